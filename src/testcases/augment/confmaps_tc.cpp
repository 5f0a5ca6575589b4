#define CATCH_CONFIG_PREFIX_ALL

#include <catch2/catch.hpp>

#include "fauna/augment/confmaps.hpp"

namespace fauna
{
static cv::Mat plane(const cv::Mat& confmap, int node)
{
   vector<cv::Mat> planes;
   cv::split(confmap, planes);
   return planes[size_t(node)];
}

static float at(const cv::Mat& confmap, int node, int y, int x)
{
   return plane(confmap, node).at<float>(y, x);
}

CATCH_TEST_CASE("make_confmap", "[confmaps]")
{
   constexpr float nan = std::numeric_limits<float>::quiet_NaN();
   constexpr int h = 8, w = 10;
   constexpr real sigma = 1.5;

   CATCH_SECTION("peak-at-the-point")
   {
      const FramePoints points = {{cv::Point2f(3.0f, 4.0f)}};
      const auto cm            = make_confmap(points, 1, h, w, sigma);
      CATCH_REQUIRE(cm.type() == CV_32FC1);
      CATCH_REQUIRE(cm.size() == cv::Size(w, h));
      CATCH_REQUIRE(at(cm, 0, 4, 3) == Approx(1.0));
      CATCH_REQUIRE(at(cm, 0, 4, 4)
                    == Approx(std::exp(-1.0 / (2.0 * sigma * sigma))));
      CATCH_REQUIRE(at(cm, 0, 0, 9) < 0.01f);

      double max_val = 0.0;
      cv::Point max_loc;
      cv::minMaxLoc(cm, nullptr, &max_val, nullptr, &max_loc);
      CATCH_REQUIRE(max_loc == cv::Point(3, 4));
   }

   CATCH_SECTION("maximum-over-instances")
   {
      const FramePoints points
          = {{cv::Point2f(1.0f, 1.0f), cv::Point2f(nan, nan)},
             {cv::Point2f(8.0f, 6.0f)}};
      const auto cm = make_confmap(points, 2, h, w, sigma);
      CATCH_REQUIRE(cm.type() == CV_32FC2);
      CATCH_REQUIRE(at(cm, 0, 1, 1) == Approx(1.0));
      CATCH_REQUIRE(at(cm, 0, 6, 8) == Approx(1.0));

      // Node 1 is missing in the first instance, and absent in the second
      CATCH_REQUIRE(cv::countNonZero(plane(cm, 1)) == 0);
   }

   CATCH_SECTION("confmaps-per-frame")
   {
      const vector<FramePoints> frames = {{{cv::Point2f(2.0f, 2.0f)}}, {}};
      const auto cms                   = make_confmaps(frames, 1, h, w, sigma);
      CATCH_REQUIRE(cms.size() == 2);
      CATCH_REQUIRE(at(cms[0], 0, 2, 2) == Approx(1.0));
      CATCH_REQUIRE(cv::countNonZero(cms[1]) == 0);

      const auto datagen = make_confmaps_datagen(1, h, w, sigma);
      CATCH_REQUIRE(datagen(frames).size() == 2);
   }

   CATCH_SECTION("bad-arguments")
   {
      CATCH_REQUIRE_THROWS(make_confmap({}, 0, h, w, sigma));
      CATCH_REQUIRE_THROWS(make_confmap({}, 1, h, w, 0.0));
   }
}

} // namespace fauna
