#define CATCH_CONFIG_PREFIX_ALL

#include <catch2/catch.hpp>

#include "fauna/utils/file-system.hpp"
#include "fauna/video/media-video.hpp"
#include "fauna/video/video-error.hpp"
#include "fauna/video/video.hpp"
#include "testcases/test-helpers.hpp"

#include <opencv2/videoio/videoio.hpp>

namespace fauna
{
// Solid colour frames survive MJPG compression nearly unchanged
static const vector<cv::Vec3b> k_colours = {cv::Vec3b(200, 30, 30),
                                            cv::Vec3b(30, 200, 30),
                                            cv::Vec3b(30, 30, 200),
                                            cv::Vec3b(120, 120, 120)};

static void write_avi(const string& fname, const int h, const int w)
{
   cv::VideoWriter writer(fname,
                          cv::VideoWriter::fourcc('M', 'J', 'P', 'G'),
                          25.0,
                          cv::Size(w, h),
                          true);
   CATCH_REQUIRE(writer.isOpened());
   for(const auto& rgb : k_colours) {
      cv::Mat im(h, w, CV_8UC3, cv::Scalar(rgb[2], rgb[1], rgb[0])); // BGR
      writer.write(im);
   }
   writer.release();
}

static bool is_near(const cv::Scalar& a, const cv::Vec3b& b, int n_channels)
{
   for(auto c = 0; c < n_channels; ++c)
      if(std::fabs(a[c] - real(b[c])) > 8.0) return false;
   return true;
}

CATCH_TEST_CASE("MediaVideo", "[media-video]")
{
   testing::TestDir dir;
   const auto fname = dir("colours.avi");
   write_avi(fname, 48, 64);

   CATCH_SECTION("frame-count-and-shape")
   {
      const auto video = Video::from_media(fname);
      CATCH_REQUIRE(video.kind() == BackendKind::MEDIA);
      CATCH_REQUIRE(video.num_frames() == int(k_colours.size()));
      CATCH_REQUIRE(video.height() == 48);
      CATCH_REQUIRE(video.width() == 64);
      CATCH_REQUIRE(video.channels() == 3);
      CATCH_REQUIRE(video.dtype() == DType::UINT8);
   }

   CATCH_SECTION("frames-are-rgb")
   {
      const auto video = Video::from_media(fname);
      // Out of order, to force seeking
      for(const auto n : {2, 0, 3, 1}) {
         const auto im = video.get_frame(n);
         CATCH_REQUIRE(im.type() == CV_8UC3);
         CATCH_REQUIRE(is_near(cv::mean(im), k_colours[size_t(n)], 3));
      }
   }

   CATCH_SECTION("bgr-false-keeps-decoder-order")
   {
      const auto video = Video::from_media(fname, std::nullopt, false);
      const auto mean  = cv::mean(video.get_frame(0));
      CATCH_REQUIRE(mean[2] > 150.0);
      CATCH_REQUIRE(mean[0] < 80.0);
   }

   CATCH_SECTION("grayscale")
   {
      const auto video = Video::from_media(fname, true);
      CATCH_REQUIRE(video.channels() == 1);
      const auto im = video.get_frame(3);
      CATCH_REQUIRE(im.type() == CV_8UC1);
      CATCH_REQUIRE(std::fabs(cv::mean(im)[0] - 120.0) < 8.0);

      // A colour video is not detected as grayscale
      CATCH_REQUIRE(Video::from_media(fname).channels() == 3);
   }

   CATCH_SECTION("matches")
   {
      const auto a = Video::from_media(fname);
      const auto b = Video::from_media(fname);
      const auto c = Video::from_media(fname, true);
      CATCH_REQUIRE(a.matches(b));
      CATCH_REQUIRE(!a.matches(c));
   }

   CATCH_SECTION("out-of-range")
   {
      const auto video = Video::from_media(fname);
      CATCH_REQUIRE_THROWS(video.get_frame(int(k_colours.size())));
      CATCH_REQUIRE_THROWS(video.get_frame(-1));
   }

   CATCH_SECTION("seeks-after-a-failed-read")
   {
      // Drop the tail of the file, while the header still counts every frame
      const auto data  = file_get_contents(fname);
      const auto cut   = dir("truncated.avi");
      const auto bytes = data.substr(0, data.size() * 85 / 100);
      CATCH_REQUIRE(!file_put_contents(cut, bytes));

      const auto video = Video::from_media(cut);
      CATCH_REQUIRE(video.num_frames() >= 2);
      CATCH_REQUIRE(is_near(cv::mean(video.get_frame(0)), k_colours[0], 3));

      bool last_failed = false;
      try {
         video.get_frame(video.num_frames() - 1);
      } catch(std::runtime_error&) {
         last_failed = true;
      }
      CATCH_INFO("reading the last frame failed: " << last_failed);

      // The decoder position is unknown after a failure, so this must seek
      CATCH_REQUIRE(is_near(cv::mean(video.get_frame(1)), k_colours[1], 3));
   }

   CATCH_SECTION("missing-file")
   {
      CATCH_REQUIRE_THROWS_AS(Video::from_media(dir("missing.mp4")),
                              VideoNotFoundError);
   }
}

} // namespace fauna
