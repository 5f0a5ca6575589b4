#define CATCH_CONFIG_PREFIX_ALL

#include <catch2/catch.hpp>

#include "fauna/video/hdf5-video.hpp"
#include "fauna/video/video-error.hpp"
#include "fauna/video/video.hpp"
#include "testcases/test-helpers.hpp"

#include <H5Cpp.h>

namespace fauna
{
// Writes `data` as a dataset of shape `dims`
template<typename T>
static void write_h5(const string& fname,
                     const string& dataset,
                     const vector<hsize_t>& dims,
                     const vector<T>& data,
                     const H5::PredType& type)
{
   H5::H5File file(fname, H5F_ACC_TRUNC);
   H5::DataSpace space(int(dims.size()), dims.data());
   H5::DataSet ds = file.createDataSet(dataset, type, space);
   ds.write(data.data(), type);
}

CATCH_TEST_CASE("HDF5Video", "[hdf5-video]")
{
   testing::TestDir dir;

   // (frames, height, width, channels)
   constexpr int F = 3, H = 5, W = 7, C = 3;
   vector<uint8_t> data(F * H * W * C);
   std::iota(begin(data), end(data), uint8_t(0));
   auto at = [&](int f, int y, int x, int c) {
      return data[size_t(((f * H + y) * W + x) * C + c)];
   };

   CATCH_SECTION("channels-last")
   {
      const auto fname = dir("video.h5");
      write_h5(fname, "box", {F, H, W, C}, data, H5::PredType::NATIVE_UINT8);

      const auto video = Video::from_hdf5(fname, "box");
      CATCH_REQUIRE(video.kind() == BackendKind::HDF5);
      CATCH_REQUIRE(video.shape() == FrameShape{F, H, W, C});
      CATCH_REQUIRE(video.dtype() == DType::UINT8);

      const auto im = video.get_frame(2);
      CATCH_REQUIRE(im.type() == CV_8UC3);
      CATCH_REQUIRE(im.at<cv::Vec3b>(4, 6)[1] == at(2, 4, 6, 1));
      CATCH_REQUIRE(im.at<cv::Vec3b>(0, 0)[0] == at(2, 0, 0, 0));

      CATCH_REQUIRE_THROWS_AS(video.get_frame(F), std::out_of_range);
      CATCH_REQUIRE_THROWS_AS(video.get_frame(-1), std::out_of_range);
   }

   CATCH_SECTION("channels-first")
   {
      // Stored (frames, channels, width, height)
      vector<uint8_t> cf(data.size());
      for(auto f = 0; f < F; ++f)
         for(auto c = 0; c < C; ++c)
            for(auto x = 0; x < W; ++x)
               for(auto y = 0; y < H; ++y)
                  cf[size_t(((f * C + c) * W + x) * H + y)] = at(f, y, x, c);

      const auto fname = dir("video-cf.h5");
      write_h5(fname, "box", {F, C, W, H}, cf, H5::PredType::NATIVE_UINT8);

      const auto video = Video::from_hdf5(fname, "box", "channels_first");
      CATCH_REQUIRE(video.shape() == FrameShape{F, H, W, C});

      for(auto f = 0; f < F; ++f) {
         const auto im = video.get_frame(f);
         CATCH_REQUIRE(im.rows == H);
         CATCH_REQUIRE(im.cols == W);
         bool all_equal = true;
         for(auto y = 0; y < H; ++y)
            for(auto x = 0; x < W; ++x)
               for(auto c = 0; c < C; ++c)
                  if(im.at<cv::Vec3b>(y, x)[c] != at(f, y, x, c))
                     all_equal = false;
         CATCH_REQUIRE(all_equal);
      }
   }

   CATCH_SECTION("single-channel-rank-3")
   {
      const auto fname = dir("gray.h5");
      vector<uint8_t> gray(F * H * W, 17);
      write_h5(fname, "frames", {F, H, W}, gray, H5::PredType::NATIVE_UINT8);

      const auto video = Video::from_hdf5(fname, "frames");
      CATCH_REQUIRE(video.shape() == FrameShape{F, H, W, 1});
      const auto im = video.get_frame(1);
      CATCH_REQUIRE(im.type() == CV_8UC1);
      CATCH_REQUIRE(im.at<uint8_t>(2, 3) == 17);
   }

   CATCH_SECTION("float-range-conversion")
   {
      const auto fname = dir("float.h5");
      vector<float> fdata(F * H * W * 1, 0.5f);
      write_h5(fname, "box", {F, H, W, 1}, fdata, H5::PredType::NATIVE_FLOAT);

      const auto scaled = Video::from_hdf5(fname, "box");
      CATCH_REQUIRE(scaled.dtype() == DType::FLOAT32);
      const auto im0 = scaled.get_frame(0);
      CATCH_REQUIRE(im0.depth() == CV_8U);
      CATCH_REQUIRE(std::abs(int(im0.at<uint8_t>(0, 0)) - 128) <= 1);

      const auto raw = Video::from_hdf5(fname, "box", "channels_last", false);
      const auto im1 = raw.get_frame(0);
      CATCH_REQUIRE(im1.depth() == CV_8U);
      CATCH_REQUIRE(im1.at<uint8_t>(0, 0) <= 1);
   }

   CATCH_SECTION("errors")
   {
      const auto fname = dir("video.h5");
      write_h5(fname, "box", {F, H, W, C}, data, H5::PredType::NATIVE_UINT8);

      CATCH_REQUIRE_THROWS_AS(Video::from_hdf5(fname, "box", "channels_middle"),
                              VideoFormatError);
      CATCH_REQUIRE_THROWS_AS(Video::from_hdf5(fname, "no-such-dataset"),
                              VideoFormatError);
      CATCH_REQUIRE_THROWS_AS(Video::from_hdf5(dir("missing.h5"), "box"),
                              VideoNotFoundError);
   }

   CATCH_SECTION("matches")
   {
      const auto fname = dir("video.h5");
      write_h5(fname, "box", {F, H, W, C}, data, H5::PredType::NATIVE_UINT8);

      const auto a = Video::from_hdf5(fname, "box");
      const auto b = Video::from_hdf5(fname, "box");
      const auto c = Video::from_hdf5(fname, "box", "channels_last", false);
      CATCH_REQUIRE(a.matches(b));
      CATCH_REQUIRE(!a.matches(c));
   }
}

} // namespace fauna
