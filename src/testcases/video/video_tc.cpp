#define CATCH_CONFIG_PREFIX_ALL

#include <catch2/catch.hpp>

#include "fauna/io/json-io.hpp"
#include "fauna/video/video-error.hpp"
#include "fauna/video/video-io.hpp"
#include "fauna/video/video.hpp"
#include "testcases/test-helpers.hpp"

#include <H5Cpp.h>

#include <opencv2/imgcodecs/imgcodecs.hpp>

namespace fauna
{
static vector<cv::Mat> make_frames(int n)
{
   vector<cv::Mat> frames;
   for(auto i = 0; i < n; ++i)
      frames.push_back(testing::make_test_frame(i, 4, 6, 3));
   return frames;
}

// ----------------------------------------------------------------------- Slice

CATCH_TEST_CASE("Slice", "[video]")
{
   auto indices = [](std::optional<int> a, std::optional<int> b, int step) {
      return Slice{a, b, step}.indices(10);
   };

   CATCH_SECTION("forward")
   {
      CATCH_REQUIRE(Slice{}.indices(4) == vector<int>{0, 1, 2, 3});
      CATCH_REQUIRE(indices(2, 5, 1) == vector<int>{2, 3, 4});
      CATCH_REQUIRE(indices(1, {}, 3) == vector<int>{1, 4, 7});
      CATCH_REQUIRE(indices(-3, {}, 1) == vector<int>{7, 8, 9});
      CATCH_REQUIRE(indices({}, -8, 1) == vector<int>{0, 1});
      CATCH_REQUIRE(indices(5, 100, 2) == vector<int>{5, 7, 9});
      CATCH_REQUIRE(indices(6, 2, 1).empty());
   }

   CATCH_SECTION("backward")
   {
      CATCH_REQUIRE(indices({}, {}, -3) == vector<int>{9, 6, 3, 0});
      CATCH_REQUIRE(indices(4, 1, -1) == vector<int>{4, 3, 2});
      CATCH_REQUIRE(indices(100, -100, -4) == vector<int>{9, 5, 1});
      CATCH_REQUIRE(indices(1, 4, -1).empty());
   }

   CATCH_SECTION("zero-step")
   {
      CATCH_REQUIRE_THROWS_AS(indices({}, {}, 0), std::invalid_argument);
   }

   CATCH_SECTION("get-frames")
   {
      const auto frames = make_frames(5);
      const auto video  = Video::from_numpy(frames_to_numpy(frames));
      const auto ims    = video.get_frames(Slice{{}, {}, -2});
      CATCH_REQUIRE(ims.size() == 3);
      CATCH_REQUIRE(testing::is_same_image(ims[0], frames[4]));
      CATCH_REQUIRE(testing::is_same_image(ims[2], frames[0]));

      const auto picked = video.get_frames(vector<int>{3, 3, 1});
      CATCH_REQUIRE(picked.size() == 3);
      CATCH_REQUIRE(testing::is_same_image(picked[1], frames[3]));
   }
}

// --------------------------------------------------------------- from-filename

CATCH_TEST_CASE("Video::from_filename", "[video]")
{
   testing::TestDir dir;
   const auto frames = make_frames(3);

   CATCH_SECTION("numpy")
   {
      save_npy(dir("frames.NPY"), frames_to_numpy(frames));
      const auto video = Video::from_filename(dir("frames.NPY"));
      CATCH_REQUIRE(video.kind() == BackendKind::NUMPY);
      CATCH_REQUIRE(video.shape() == FrameShape{3, 4, 6, 3});
      CATCH_REQUIRE(str(video) == "Video ([3 x 4 x 6 x 3])");
   }

   CATCH_SECTION("hdf5")
   {
      const auto fname = dir("frames.h5");
      {
         const auto a = frames_to_numpy(frames);
         const vector<hsize_t> dims(cbegin(a.shape), cend(a.shape));
         H5::H5File file(fname, H5F_ACC_TRUNC);
         H5::DataSpace space(int(dims.size()), dims.data());
         auto ds = file.createDataSet(
             "images", H5::PredType::NATIVE_UINT8, space);
         ds.write(a.bytes.data(), H5::PredType::NATIVE_UINT8);
      }

      // A dataset is required
      CATCH_REQUIRE_THROWS_AS(Video::from_filename(fname), VideoFormatError);

      VideoOptions opts;
      opts.dataset     = "images";
      const auto video = Video::from_filename(fname, opts);
      CATCH_REQUIRE(video.kind() == BackendKind::HDF5);
      CATCH_REQUIRE(testing::is_same_image(video.get_frame(2), frames[2]));
   }

   CATCH_SECTION("frame-store")
   {
      const auto source = Video::from_numpy(frames_to_numpy(frames));
      source.to_frame_store(dir("store"), {2, 0}, "png");

      const auto by_dir  = Video::from_filename(dir("store"));
      const auto by_meta = Video::from_filename(dir("store/metadata.yaml"));
      CATCH_REQUIRE(by_dir.kind() == BackendKind::FRAME_STORE);
      CATCH_REQUIRE(by_dir.matches(by_meta));
      CATCH_REQUIRE(testing::is_same_image(by_dir.get_frame(2), frames[2]));

      VideoOptions opts;
      opts.index_by_original = false;
      const auto by_index    = Video::from_filename(dir("store"), opts);
      CATCH_REQUIRE(testing::is_same_image(by_index.get_frame(1), frames[0]));
   }

   CATCH_SECTION("unknown-extension")
   {
      CATCH_REQUIRE(!file_put_contents(dir("notes.txt"), "hello"));
      CATCH_REQUIRE_THROWS_AS(Video::from_filename(dir("notes.txt")),
                              VideoFormatError);
   }

   CATCH_SECTION("missing-file")
   {
      CATCH_REQUIRE_THROWS_AS(Video::from_filename(dir("missing.mp4")),
                              VideoNotFoundError);
   }

   CATCH_SECTION("frame-store-from-filenames")
   {
      vector<string> fnames;
      for(size_t i = 0; i < frames.size(); ++i) {
         fnames.push_back(dir(format("im-{}.png", i)));
         CATCH_REQUIRE(cv::imwrite(fnames.back(), swap_red_blue(frames[i])));
      }

      const auto video
          = Video::frame_store_from_filenames(fnames, dir("from-images"));
      CATCH_REQUIRE(video.num_frames() == 3);
      CATCH_REQUIRE(video.frame_indices() == vector<int>{0, 1, 2});
      CATCH_REQUIRE(testing::is_same_image(video.get_frame(1), frames[1]));

      CATCH_REQUIRE_THROWS(
          Video::frame_store_from_filenames({}, dir("from-nothing")));
   }

   CATCH_SECTION("frame-store-from-mixed-images")
   {
      // BGRA on disk, then a grayscale image
      const auto rgba_fname = dir("rgba.png");
      const auto gray_fname = dir("gray.png");
      CATCH_REQUIRE(cv::imwrite(
          rgba_fname, cv::Mat(4, 6, CV_8UC4, cv::Scalar(10, 20, 30, 255))));
      CATCH_REQUIRE(
          cv::imwrite(gray_fname, cv::Mat(4, 6, CV_8UC1, cv::Scalar(77))));

      const auto video = Video::frame_store_from_filenames(
          {rgba_fname, gray_fname}, dir("from-mixed"));
      CATCH_REQUIRE(video.num_frames() == 2);
      CATCH_REQUIRE(video.channels() == 3);

      const auto im0 = video.get_frame(0);
      const auto im1 = video.get_frame(1);
      CATCH_REQUIRE(im0.channels() == 3);
      CATCH_REQUIRE(im0.at<cv::Vec3b>(1, 2) == cv::Vec3b(30, 20, 10));
      CATCH_REQUIRE(im1.channels() == 3);
      CATCH_REQUIRE(im1.at<cv::Vec3b>(3, 5) == cv::Vec3b(77, 77, 77));
   }
}

// ----------------------------------------------------------------------- json

CATCH_TEST_CASE("video-json", "[video]")
{
   testing::TestDir dir;
   const auto frames = make_frames(2);

   CATCH_REQUIRE(mkdir_p(dir("old")));
   CATCH_REQUIRE(mkdir_p(dir("new")));
   const auto old_fname = dir("old/frames.npy");
   save_npy(old_fname, frames_to_numpy(frames));
   const auto video = Video::from_numpy(old_fname, false);

   CATCH_SECTION("to-json")
   {
      const auto o = video_to_json(video);
      CATCH_REQUIRE(o["backend"]["type"].asString() == "NumpyVideo");
      CATCH_REQUIRE(o["backend"]["filename"].asString() == old_fname);
      CATCH_REQUIRE(o["backend"]["convert_range"].asBool() == false);

      const auto back = video_from_json(o);
      CATCH_REQUIRE(back.matches(video));

      // In-memory data cannot be serialized
      const auto in_memory = Video::from_numpy(frames_to_numpy(frames));
      CATCH_REQUIRE(!in_memory.is_serializable());
      CATCH_REQUIRE_THROWS_AS(video_to_json(in_memory), std::runtime_error);
   }

   CATCH_SECTION("path-repair-hook")
   {
      const auto json_fname = dir("video.json");
      save_video(video, json_fname);
      std::filesystem::rename(old_fname, dir("new/frames.npy"));

      // The stored path is gone...
      CATCH_REQUIRE_THROWS_AS(load_video(json_fname), VideoNotFoundError);

      // ...but a hook can point it somewhere else
      vector<string> seen;
      auto hook = [&](const string_view path) {
         seen.emplace_back(path);
         return str_replace("/old/", "/new/", path);
      };
      const auto moved = load_video(json_fname, hook);
      CATCH_REQUIRE(seen == vector<string>{old_fname});
      CATCH_REQUIRE(moved.filename() == dir("new/frames.npy"));
      CATCH_REQUIRE(testing::is_same_image(moved.get_frame(1), frames[1]));

      // The default hook finds the file in the current directory
      testing::ScopedChdir cd(dir("new"));
      CATCH_REQUIRE(load_video(json_fname).filename() == "frames.npy");
   }

   CATCH_SECTION("frame-store")
   {
      const auto store = video.to_frame_store(dir("store"), {1}, "png", false);
      const auto back  = video_from_json(video_to_json(store));
      CATCH_REQUIRE(back.kind() == BackendKind::FRAME_STORE);
      CATCH_REQUIRE(back.matches(store));
      CATCH_REQUIRE(back.frame_indices() == vector<int>{0});
   }

   CATCH_SECTION("bad-json")
   {
      CATCH_REQUIRE_THROWS_AS(video_from_json(parse_json("{}")),
                              VideoFormatError);
      CATCH_REQUIRE_THROWS_AS(
          video_from_json(parse_json(
              R"V0G0N({"backend": {"type": "GifVideo", "filename": "x"}})V0G0N"),
                          [](const string_view s) { return string(s); }),
          VideoFormatError);
   }
}

} // namespace fauna
