#define CATCH_CONFIG_PREFIX_ALL

#include <catch2/catch.hpp>

#include "fauna/io/json-io.hpp"
#include "fauna/video/frame-store-video.hpp"
#include "fauna/video/frame-store.hpp"
#include "fauna/video/video-error.hpp"
#include "fauna/video/video.hpp"
#include "testcases/test-helpers.hpp"

namespace fauna
{
static vector<cv::Mat> make_frames(int n, int channels)
{
   vector<cv::Mat> frames;
   for(auto i = 0; i < n; ++i)
      frames.push_back(testing::make_test_frame(7 * i, 10, 12, channels));
   return frames;
}

CATCH_TEST_CASE("FrameStore", "[frame-store]")
{
   testing::TestDir dir;

   CATCH_SECTION("write-and-read-png")
   {
      const auto frames = make_frames(5, 3);
      const auto path   = dir("store");
      {
         auto writer
             = FrameStoreWriter::create(path, "png", ImageShape{10, 12, 3}, 2);
         for(auto i = 0; i < 5; ++i)
            writer.add_image(frames[size_t(i)], 100 + 10 * i, 0.5 * i);
         CATCH_REQUIRE(writer.frame_count() == 5);
         writer.add_extra_data(parse_json(R"V0G0N({"source": "test"})V0G0N"));
         writer.close();
      }

      // Three chunks of (at most) two frames
      CATCH_REQUIRE(is_regular_file(path_join(path, "metadata.yaml")));
      CATCH_REQUIRE(is_regular_file(path_join(path, "000002.yaml")));
      CATCH_REQUIRE(is_directory(path_join(path, "000001")));

      auto store = FrameStore::open(path);
      CATCH_REQUIRE(store.format() == "png");
      CATCH_REQUIRE(store.chunksize() == 2);
      CATCH_REQUIRE(store.frame_count() == 5);
      CATCH_REQUIRE(store.imgshape() == ImageShape{10, 12, 3});
      CATCH_REQUIRE(store.frame_numbers()
                    == vector<int>{100, 110, 120, 130, 140});
      CATCH_REQUIRE(store.frame_times()[3] == Approx(1.5));
      CATCH_REQUIRE(store.has_frame_number(120));
      CATCH_REQUIRE(!store.has_frame_number(121));

      CATCH_REQUIRE(testing::is_same_image(store.get_image(130), frames[3]));
      CATCH_REQUIRE(
          testing::is_same_image(store.get_image_by_index(4), frames[4]));
      CATCH_REQUIRE_THROWS_AS(store.get_image(1), std::out_of_range);
      CATCH_REQUIRE_THROWS_AS(store.get_image_by_index(5), std::out_of_range);

      CATCH_REQUIRE(store.extra_data()["source"].asString() == "test");

      // Opening by the metadata file is the same store
      CATCH_REQUIRE(
          FrameStore::open(path_join(path, "metadata.yaml")).frame_count()
          == 5);
   }

   CATCH_SECTION("get-next-image")
   {
      const auto frames = make_frames(3, 1);
      const auto path   = dir("gray");
      {
         auto writer
             = FrameStoreWriter::create(path, "bmp", ImageShape{10, 12, 1}, 8);
         for(auto i = 0; i < 3; ++i)
            writer.add_image(frames[size_t(i)], i * 2, real(i));
         writer.close();
      }

      auto store = FrameStore::open(path);
      CATCH_REQUIRE(store.extra_data().isNull());

      cv::Mat im;
      int frame_number = -1;
      vector<int> seen;
      while(store.get_next_image(im, frame_number)) {
         CATCH_REQUIRE(im.type() == CV_8UC1);
         CATCH_REQUIRE(
             testing::is_same_image(im, frames[size_t(frame_number / 2)]));
         seen.push_back(frame_number);
      }
      CATCH_REQUIRE(seen == vector<int>{0, 2, 4});
   }

   CATCH_SECTION("mjpeg-avi")
   {
      const auto path = dir("video-store");
      {
         auto writer = FrameStoreWriter::create(
             path, "mjpeg/avi", ImageShape{32, 32, 3}, 2);
         for(auto i = 0; i < 3; ++i) {
            cv::Mat im(32, 32, CV_8UC3, cv::Scalar(40 * (i + 1), 60, 90));
            writer.add_image(im, i, real(i));
         }
         writer.close();
      }
      CATCH_REQUIRE(is_regular_file(path_join(path, "000000.avi")));
      CATCH_REQUIRE(is_regular_file(path_join(path, "000001.avi")));

      auto store = FrameStore::open(path);
      CATCH_REQUIRE(store.frame_count() == 3);
      for(const auto i : {2, 0, 1}) {
         const auto mean = cv::mean(store.get_image(i));
         CATCH_REQUIRE(std::fabs(mean[0] - 40.0 * (i + 1)) < 8.0);
         CATCH_REQUIRE(std::fabs(mean[2] - 90.0) < 8.0);
      }
   }

   CATCH_SECTION("writer-errors")
   {
      const auto shape = ImageShape{10, 12, 3};
      CATCH_REQUIRE_THROWS_AS(
          FrameStoreWriter::create(dir("a"), "gif", shape, 10),
          VideoFormatError);
      CATCH_REQUIRE_THROWS(FrameStoreWriter::create(dir("a"), "png", shape, 0));

      auto writer = FrameStoreWriter::create(dir("b"), "png", shape, 10);
      CATCH_REQUIRE_THROWS(
          writer.add_image(testing::make_test_frame(0, 12, 10, 3), 0, 0.0));
      writer.close();

      // Will not write over an existing store
      CATCH_REQUIRE_THROWS(FrameStoreWriter::create(dir("b"), "png", shape, 10));
   }

   CATCH_SECTION("open-errors")
   {
      CATCH_REQUIRE_THROWS_AS(FrameStore::open(dir("nothing")),
                              VideoNotFoundError);

      const auto path = dir("corrupt");
      CATCH_REQUIRE(mkdir_p(path));
      CATCH_REQUIRE(!file_put_contents(path_join(path, "metadata.yaml"),
                                       "%YAML:1.0\n---\nformat: gif\n"));
      CATCH_REQUIRE_THROWS_AS(FrameStore::open(path), VideoFormatError);
   }
}

CATCH_TEST_CASE("FrameStoreVideo", "[frame-store]")
{
   testing::TestDir dir;

   const auto frames = make_frames(6, 3);
   const auto source = Video::from_numpy(frames_to_numpy(frames));

   CATCH_SECTION("index-by-original")
   {
      const auto video = source.to_frame_store(dir("subset"), {5, 1, 3});
      CATCH_REQUIRE(video.kind() == BackendKind::FRAME_STORE);
      CATCH_REQUIRE(video.num_frames() == 3);
      CATCH_REQUIRE(video.frame_indices() == vector<int>{5, 1, 3});
      CATCH_REQUIRE(testing::is_same_image(video.get_frame(5), frames[5]));
      CATCH_REQUIRE(testing::is_same_image(video.get_frame(1), frames[1]));
      CATCH_REQUIRE_THROWS_AS(video.get_frame(0), std::out_of_range);

      const auto& fs = dynamic_cast<const FrameStoreVideo&>(video.backend());
      CATCH_REQUIRE(fs.index_by_original());
      CATCH_REQUIRE(ends_with(fs.filename(), string_view("metadata.yaml")));

      // A subset of frames defaults to 'png'
      CATCH_REQUIRE(FrameStore::open(dir("subset")).format() == "png");

      // Slices run over positions 2 and 0, which hold frames 3 and 5
      const auto sliced = video.get_frames(Slice{{}, {}, -2});
      CATCH_REQUIRE(sliced.size() == 2);
      CATCH_REQUIRE(testing::is_same_image(sliced[0], frames[3]));
      CATCH_REQUIRE(testing::is_same_image(sliced[1], frames[5]));
   }

   CATCH_SECTION("index-by-position")
   {
      source.to_frame_store(dir("subset"), {5, 1, 3}, "png");
      const auto video = Video::from_frame_store(dir("subset"), false);
      CATCH_REQUIRE(video.frame_indices() == vector<int>{0, 1, 2});
      CATCH_REQUIRE(testing::is_same_image(video.get_frame(0), frames[5]));
      CATCH_REQUIRE(testing::is_same_image(video.get_frame(2), frames[3]));
      CATCH_REQUIRE_THROWS_AS(video.get_frame(3), std::out_of_range);

      CATCH_REQUIRE(!video.matches(Video::from_frame_store(dir("subset"))));
      CATCH_REQUIRE(
          video.matches(Video::from_frame_store(dir("subset"), false)));
   }

   CATCH_SECTION("all-frames-replaces-existing")
   {
      source.to_frame_store(dir("store"), {0}, "jpg");
      const auto video = source.to_frame_store(dir("store"), {}, "png");
      CATCH_REQUIRE(video.num_frames() == 6);
      CATCH_REQUIRE(video.frame_indices() == vector<int>{0, 1, 2, 3, 4, 5});
      for(auto i = 0; i < 6; ++i)
         CATCH_REQUIRE(testing::is_same_image(video.get_frame(i), frames[i]));

      // In-memory data cannot be referred to, so no extra data
      CATCH_REQUIRE(FrameStore::open(dir("store")).extra_data().isNull());
   }

   CATCH_SECTION("extra-data-records-source")
   {
      const auto fname = dir("frames.npy");
      source.to_numpy(fname);
      const auto video = Video::from_numpy(fname);
      video.to_frame_store(dir("store"), {2, 4}, "bmp");

      const auto extra = FrameStore::open(dir("store")).extra_data();
      CATCH_REQUIRE(extra["backend"]["type"].asString() == "NumpyVideo");
      CATCH_REQUIRE(extra["backend"]["filename"].asString() == fname);
   }

   CATCH_SECTION("invalid-format")
   {
      CATCH_REQUIRE_THROWS_AS(source.to_frame_store(dir("store"), {0}, "tiff"),
                              VideoFormatError);
   }
}

} // namespace fauna
