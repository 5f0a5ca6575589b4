#define CATCH_CONFIG_PREFIX_ALL

#include <catch2/catch.hpp>

#include "fauna/io/npy-io.hpp"
#include "fauna/video/numpy-video.hpp"
#include "fauna/video/video-error.hpp"
#include "fauna/video/video.hpp"
#include "testcases/test-helpers.hpp"

namespace fauna
{
template<typename T>
static NumpyArray make_array(const vector<size_t>& shape,
                             const DType dtype,
                             const vector<T>& values)
{
   NumpyArray a;
   a.shape = shape;
   a.dtype = dtype;
   a.bytes.resize(values.size() * sizeof(T));
   std::memcpy(a.bytes.data(), values.data(), a.bytes.size());
   a.check_invariant();
   return a;
}

CATCH_TEST_CASE("NumpyVideo", "[numpy-video]")
{
   testing::TestDir dir;

   CATCH_SECTION("uint8-frames")
   {
      vector<cv::Mat> frames;
      for(auto n = 0; n < 4; ++n)
         frames.push_back(testing::make_test_frame(n, 6, 8, 3));

      const auto fname = dir("frames.npy");
      save_npy(fname, frames_to_numpy(frames));

      const auto loaded = load_npy(fname);
      CATCH_REQUIRE(loaded.shape == vector<size_t>{4, 6, 8, 3});
      CATCH_REQUIRE(loaded.dtype == DType::UINT8);

      const auto video = Video::from_numpy(fname);
      CATCH_REQUIRE(video.kind() == BackendKind::NUMPY);
      CATCH_REQUIRE(video.shape() == FrameShape{4, 6, 8, 3});
      CATCH_REQUIRE(video.is_serializable());
      for(auto n = 0; n < 4; ++n)
         CATCH_REQUIRE(testing::is_same_image(video.get_frame(n), frames[n]));
   }

   CATCH_SECTION("rank-3-is-single-channel")
   {
      vector<uint8_t> values(2 * 3 * 4);
      std::iota(begin(values), end(values), uint8_t(0));
      const auto video = Video::from_numpy(
          make_array<uint8_t>({2, 3, 4}, DType::UINT8, values));

      CATCH_REQUIRE(video.shape() == FrameShape{2, 3, 4, 1});
      CATCH_REQUIRE(!video.is_serializable());
      CATCH_REQUIRE(video.filename() == string(NumpyVideo::k_raw_filename));

      const auto im = video.get_frame(1);
      CATCH_REQUIRE(im.type() == CV_8UC1);
      CATCH_REQUIRE(im.at<uint8_t>(0, 0) == 12);
      CATCH_REQUIRE(im.at<uint8_t>(2, 3) == 23);
   }

   CATCH_SECTION("range-conversion")
   {
      vector<float> values(1 * 2 * 2 * 1, 1.0f);
      values[1] = 0.0f;
      const auto a = make_array<float>({1, 2, 2, 1}, DType::FLOAT32, values);

      const auto scaled = Video::from_numpy(a, true).get_frame(0);
      CATCH_REQUIRE(scaled.depth() == CV_8U);
      CATCH_REQUIRE(scaled.at<uint8_t>(0, 0) == 255);
      CATCH_REQUIRE(scaled.at<uint8_t>(0, 1) == 0);

      const auto raw = Video::from_numpy(a, false).get_frame(0);
      CATCH_REQUIRE(raw.at<uint8_t>(0, 0) == 1);

      // Data with a maximum above 1 is left as is
      vector<double> big(1 * 2 * 2 * 1, 200.0);
      const auto b = make_array<double>({1, 2, 2, 1}, DType::FLOAT64, big);
      CATCH_REQUIRE(Video::from_numpy(b, true).get_frame(0).at<uint8_t>(1, 1)
                    == 200);
   }

   CATCH_SECTION("to-numpy")
   {
      vector<cv::Mat> frames;
      for(auto n = 0; n < 5; ++n)
         frames.push_back(testing::make_test_frame(10 * n, 4, 4, 1));
      const auto video = Video::from_numpy(frames_to_numpy(frames));

      const auto fname = dir("subset.npy");
      video.to_numpy(fname, {4, 1});
      const auto subset = Video::from_numpy(fname);
      CATCH_REQUIRE(subset.num_frames() == 2);
      CATCH_REQUIRE(testing::is_same_image(subset.get_frame(0), frames[4]));
      CATCH_REQUIRE(testing::is_same_image(subset.get_frame(1), frames[1]));
   }

   CATCH_SECTION("missing-file")
   {
      CATCH_REQUIRE_THROWS_AS(Video::from_numpy(dir("missing.npy")),
                              VideoNotFoundError);
   }
}

} // namespace fauna
