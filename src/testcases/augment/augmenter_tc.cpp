#define CATCH_CONFIG_PREFIX_ALL

#include <catch2/catch.hpp>

#include "fauna/augment/augmenter.hpp"
#include "fauna/augment/confmaps.hpp"
#include "fauna/io/json-io.hpp"
#include "testcases/test-helpers.hpp"

namespace fauna
{
static constexpr float k_nan = std::numeric_limits<float>::quiet_NaN();

static vector<cv::Mat> make_images(int n, int h, int w)
{
   vector<cv::Mat> ims;
   for(auto i = 0; i < n; ++i)
      ims.push_back(testing::make_test_frame(5 * i, h, w, 3));
   return ims;
}

static Augmenter::Params no_transform_params(int batch_size)
{
   Augmenter::Params p;
   p.batch_size        = batch_size;
   p.shuffle_initially = false;
   p.rotation          = {};
   p.scale             = {};
   p.seed              = 42;
   return p;
}

// ----------------------------------------------------------------- array-split

CATCH_TEST_CASE("array_split", "[augmenter]")
{
   vector<int> xs(10);
   std::iota(begin(xs), end(xs), 0);

   auto sizes = [](const vector<vector<int>>& parts) {
      vector<size_t> out;
      for(const auto& p : parts) out.push_back(p.size());
      return out;
   };

   CATCH_REQUIRE(sizes(array_split(xs, 3)) == vector<size_t>{4, 3, 3});
   CATCH_REQUIRE(sizes(array_split(xs, 5)) == vector<size_t>{2, 2, 2, 2, 2});
   CATCH_REQUIRE(sizes(array_split(xs, 4)) == vector<size_t>{3, 3, 2, 2});
   CATCH_REQUIRE(array_split(xs, 3)[1] == vector<int>{4, 5, 6});

   // More parts than elements gives empty parts at the end
   CATCH_REQUIRE(sizes(array_split({7, 8}, 3)) == vector<size_t>{1, 1, 0});
   CATCH_REQUIRE(array_split(xs, 0).empty());
}

// ------------------------------------------------------------------- batching

CATCH_TEST_CASE("Augmenter batching", "[augmenter]")
{
   const auto X = make_images(10, 8, 8);

   CATCH_SECTION("batches")
   {
      Augmenter aug(AugmenterData{X}, no_transform_params(4));
      CATCH_REQUIRE(aug.num_samples() == 10);
      CATCH_REQUIRE(aug.num_outputs() == 1);
      CATCH_REQUIRE(aug.size() == 3);
      CATCH_REQUIRE(aug.batches()[0] == vector<int>{0, 1, 2, 3});
      CATCH_REQUIRE(aug.batches()[2] == vector<int>{7, 8, 9});

      const auto batch = aug.get_batch(1);
      CATCH_REQUIRE(batch.indices == vector<int>{4, 5, 6});
      CATCH_REQUIRE(batch.X.size() == 3);
      CATCH_REQUIRE(batch.Y.empty());
      for(size_t i = 0; i < batch.X.size(); ++i)
         CATCH_REQUIRE(
             testing::is_same_image(batch.X[i], X[size_t(batch.indices[i])]));

      CATCH_REQUIRE_THROWS_AS(aug.get_batch(3), std::out_of_range);
      CATCH_REQUIRE_THROWS_AS(aug.get_batch(-1), std::out_of_range);
   }

   CATCH_SECTION("shuffle")
   {
      auto params              = no_transform_params(3);
      params.shuffle_initially = true;
      Augmenter aug(AugmenterData{X}, params);
      CATCH_REQUIRE(aug.size() == 4);

      auto all_indices = [&]() {
         vector<int> out;
         for(const auto& b : aug.batches())
            out.insert(end(out), cbegin(b), cend(b));
         std::sort(begin(out), end(out));
         return out;
      };
      vector<int> expected(10);
      std::iota(begin(expected), end(expected), 0);

      CATCH_REQUIRE(all_indices() == expected);
      aug.shuffle(true);
      CATCH_REQUIRE(all_indices() == expected);
      aug.shuffle();
      CATCH_REQUIRE(all_indices() == expected);
      CATCH_REQUIRE(aug.size() == 4);
   }

   CATCH_SECTION("seeded-is-deterministic")
   {
      auto params              = no_transform_params(4);
      params.shuffle_initially = true;
      params.set_rotation(30.0);
      Augmenter a(AugmenterData{X}, params);
      Augmenter b(AugmenterData{X}, params);
      CATCH_REQUIRE(a.batches() == b.batches());
      const auto ba = a.get_batch(0);
      const auto bb = b.get_batch(0);
      for(size_t i = 0; i < ba.X.size(); ++i)
         CATCH_REQUIRE(testing::is_same_image(ba.X[i], bb.X[i]));
   }

   CATCH_SECTION("misaligned-data")
   {
      const auto params = no_transform_params(4);
      CATCH_REQUIRE_THROWS(
          Augmenter(AugmenterData{X, make_images(3, 8, 8)}, params));
      CATCH_REQUIRE_THROWS(
          Augmenter(AugmenterData{X, {}, vector<FramePoints>(2)}, params));
      CATCH_REQUIRE_THROWS(Augmenter(
          AugmenterData{X, X, vector<FramePoints>(X.size())}, params));

      auto bad       = params;
      bad.batch_size = 0;
      CATCH_REQUIRE_THROWS(Augmenter(AugmenterData{X}, bad));
   }
}

// ------------------------------------------------------------------ transforms

CATCH_TEST_CASE("Augmenter transforms", "[augmenter]")
{
   // A single bright pixel at (x=5, y=2) in an 11x11 image
   cv::Mat im = cv::Mat::zeros(11, 11, CV_8UC3);
   im.at<cv::Vec3b>(2, 5) = cv::Vec3b(255, 255, 255);

   const FramePoints points
       = {{cv::Point2f(5.0f, 2.0f), cv::Point2f(k_nan, k_nan)},
          {cv::Point2f(5.0f, 5.0f)}};

   CATCH_SECTION("zero-rotation-is-identity")
   {
      auto params = no_transform_params(1);
      params.set_rotation(0.0);
      Augmenter aug(AugmenterData{{im}, {}, {points}}, params);
      const auto batch = aug.get_batch(0);
      CATCH_REQUIRE(testing::is_same_image(batch.X[0], im));

      const auto& out = batch.Y.at("").points[0];
      CATCH_REQUIRE(out.size() == 2);
      CATCH_REQUIRE(out[0][0].x == Approx(5.0));
      CATCH_REQUIRE(out[0][0].y == Approx(2.0));
      CATCH_REQUIRE(std::isnan(out[0][1].x));
      CATCH_REQUIRE(out[1].size() == 1);
   }

   CATCH_SECTION("points-follow-the-image")
   {
      auto params     = no_transform_params(1);
      params.rotation = Augmenter::Range{90.0, 90.0};
      Augmenter aug(AugmenterData{{im}, {}, {points}}, params);
      const auto batch = aug.get_batch(0);

      // Rotation about the centre (5, 5)
      const auto& out = batch.Y.at("").points[0];
      CATCH_REQUIRE(out[0][0].x == Approx(2.0).margin(1e-4));
      CATCH_REQUIRE(out[0][0].y == Approx(5.0).margin(1e-4));
      CATCH_REQUIRE(std::isnan(out[0][1].x));
      CATCH_REQUIRE(std::isnan(out[0][1].y));
      CATCH_REQUIRE(out[1][0].x == Approx(5.0).margin(1e-4));
      CATCH_REQUIRE(out[1][0].y == Approx(5.0).margin(1e-4));

      // ...and the bright pixel moved with the point
      CATCH_REQUIRE(batch.X[0].at<cv::Vec3b>(5, 2)[0] > 200);
      CATCH_REQUIRE(batch.X[0].at<cv::Vec3b>(2, 5)[0] < 50);
   }

   CATCH_SECTION("equal-ended-scale-is-skipped")
   {
      auto params = no_transform_params(1);
      params.set_scale(2.0, 2.0);
      Augmenter aug(AugmenterData{{im}, {}, {points}}, params);
      const auto batch = aug.get_batch(0);
      CATCH_REQUIRE(testing::is_same_image(batch.X[0], im));
      const auto& out = batch.Y.at("").points[0];
      CATCH_REQUIRE(out[0][0].x == Approx(5.0).margin(1e-4));
      CATCH_REQUIRE(out[0][0].y == Approx(2.0).margin(1e-4));
   }

   CATCH_SECTION("scale")
   {
      auto params = no_transform_params(1);
      params.set_scale(1.2, 0.8);
      CATCH_REQUIRE(params.scale->first == 0.8);
      CATCH_REQUIRE(params.scale->second == 1.2);
      Augmenter aug(AugmenterData{{im}, {}, {points}}, params);
      const auto& out = aug.get_batch(0).Y.at("").points[0];
      // (5, 2) is 3 above the centre, so moves to between 2.4 and 3.6 above
      CATCH_REQUIRE(out[0][0].x == Approx(5.0).margin(1e-4));
      CATCH_REQUIRE(out[0][0].y >= 5.0f - 3.6f - 1e-4f);
      CATCH_REQUIRE(out[0][0].y <= 5.0f - 2.4f + 1e-4f);
   }

   CATCH_SECTION("y-images-share-the-transform")
   {
      const auto X = make_images(6, 16, 12);
      auto params  = no_transform_params(2);
      params.set_rotation(45.0);
      params.set_scale(0.8, 1.2);
      Augmenter aug(AugmenterData{X, X}, params);
      for(auto b = 0; b < aug.size(); ++b) {
         const auto batch = aug.get_batch(b);
         const auto& Y    = batch.Y.at("").images;
         CATCH_REQUIRE(Y.size() == batch.X.size());
         for(size_t i = 0; i < Y.size(); ++i)
            CATCH_REQUIRE(testing::is_same_image(batch.X[i], Y[i]));
      }
   }

   CATCH_SECTION("datagen-and-output-names")
   {
      AugmenterData data{{im, im}, {}, {points, points}};
      data.datagen      = make_confmaps_datagen(2, 11, 11, 1.0);
      data.output_names = {"confmaps", "confmaps-copy"};

      Augmenter aug(std::move(data), no_transform_params(2));
      CATCH_REQUIRE(aug.num_outputs() == 2);

      const auto batch = aug.get_batch(0);
      CATCH_REQUIRE(batch.Y.size() == 2);
      for(const auto& name : {"confmaps", "confmaps-copy"}) {
         const auto& out = batch.Y.at(name);
         CATCH_REQUIRE(out.points.empty());
         CATCH_REQUIRE(out.images.size() == 2);
         CATCH_REQUIRE(out.images[0].type() == CV_32FC2);
         CATCH_REQUIRE(out.images[0].size() == cv::Size(11, 11));
      }
   }
}

// ---------------------------------------------------------------------- params

CATCH_TEST_CASE("Augmenter::Params", "[augmenter]")
{
   CATCH_SECTION("json-round-trip")
   {
      Augmenter::Params p;
      p.batch_size = 7;
      p.set_rotation(-20.0);
      p.set_scale(1.5, 0.5);
      p.seed = 3;
      CATCH_REQUIRE(p.rotation == Augmenter::Range{-20.0, 20.0});
      CATCH_REQUIRE(p.scale == Augmenter::Range{0.5, 1.5});

      Augmenter::Params q;
      q.read(p.to_json());
      CATCH_REQUIRE(p == q);

      p.scale = {};
      q.read(parse_json(str(p.to_json())));
      CATCH_REQUIRE(p == q);
      CATCH_REQUIRE(!q.scale.has_value());
   }

   CATCH_SECTION("scalar-rotation")
   {
      Augmenter::Params p;
      p.read(parse_json(R"V0G0N(
{
   "batch_size": 4,
   "shuffle_initially": false,
   "rotation": 15
}
)V0G0N"));
      CATCH_REQUIRE(p.batch_size == 4);
      CATCH_REQUIRE(p.rotation == Augmenter::Range{-15.0, 15.0});
      CATCH_REQUIRE(p.seed == -1);
   }

   CATCH_SECTION("bad-params")
   {
      Augmenter::Params p;
      const auto before = p;
      CATCH_REQUIRE_THROWS(p.read(parse_json(R"V0G0N({"batch_size": 0,
         "shuffle_initially": true})V0G0N")));
      CATCH_REQUIRE_THROWS(p.read(parse_json(R"V0G0N({"batch_size": 2,
         "shuffle_initially": true, "rotation": [1, 2, 3]})V0G0N")));
      CATCH_REQUIRE_THROWS(p.read(parse_json(R"V0G0N({"seed": 2})V0G0N")));
      CATCH_REQUIRE(p == before);
   }
}

// ---------------------------------------------------------------- points-json

CATCH_TEST_CASE("points-json", "[augmenter]")
{
   const vector<FramePoints> points
       = {{{cv::Point2f(1.0f, 2.5f), cv::Point2f(k_nan, k_nan)}},
          {},
          {{cv::Point2f(3.0f, 4.0f)}, {cv::Point2f(5.0f, 6.0f)}}};

   const auto o = points_to_json(points);
   CATCH_REQUIRE(o.size() == 3);
   CATCH_REQUIRE(o[0][0][1][0].isNull());
   CATCH_REQUIRE(o[2][1][0][1].asDouble() == Approx(6.0));

   const auto back = points_from_json(parse_json(str(o)));
   CATCH_REQUIRE(back.size() == 3);
   CATCH_REQUIRE(back[0][0][0] == cv::Point2f(1.0f, 2.5f));
   CATCH_REQUIRE(std::isnan(back[0][0][1].x));
   CATCH_REQUIRE(back[1].empty());
   CATCH_REQUIRE(back[2][1][0] == cv::Point2f(5.0f, 6.0f));

   CATCH_REQUIRE_THROWS(points_from_json(parse_json("{}")));
   CATCH_REQUIRE_THROWS(points_from_json(parse_json("[[[[1, 2, 3]]]]")));
}

} // namespace fauna
