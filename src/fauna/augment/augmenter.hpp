
#pragma once

#include "fauna/foundation.hpp"

#include "json/json.h"

#include <map>
#include <random>

#include <opencv2/core/core.hpp>

namespace fauna
{
// One instance: a point per skeleton node. NaN marks a missing node.
using InstancePoints = vector<cv::Point2f>;

// Every instance in a frame
using FramePoints = vector<InstancePoints>;

// Turns the (augmented) points of a batch into training targets,
// one cv::Mat per sample
using Datagen = std::function<vector<cv::Mat>(const vector<FramePoints>&)>;

struct AugmenterData
{
   vector<cv::Mat> X;           // input images
   vector<cv::Mat> Y;           // optional: images aligned with X
   vector<FramePoints> points;  // optional: keypoints aligned with X
   Datagen datagen;             // optional: applied to augmented points
   vector<string> output_names; // optional: replicates the output
};

// The output for one batch. Exactly one of `images` and `points` is filled.
struct AugmentedOutput
{
   vector<cv::Mat> images;     // Y images, or datagen output
   vector<FramePoints> points; // keypoints when there is no datagen
};

struct AugmentedBatch
{
   vector<int> indices; // sample indices
   vector<cv::Mat> X;

   // Keyed by output name, or "" when unnamed. Empty when there are
   // no points and no Y.
   std::map<string, AugmentedOutput> Y;
};

/**
 * Batches samples, and applies the same random affine transform to each
 * image and its keypoints (or Y image). One transform is drawn per sample:
 * a rotation about the image centre, then an optional scale.
 *
 *    Augmenter::Params p;
 *    p.batch_size = 4;
 *    p.set_rotation(15.0); // (-15, 15) degrees
 *    auto aug = Augmenter(AugmenterData{frames, {}, points}, p);
 *    for(auto i = 0; i < aug.size(); ++i) train_on(aug.get_batch(i));
 */
class Augmenter
{
 public:
   using Range = std::pair<real, real>;

   struct Params
   {
      int batch_size                = 32;
      bool shuffle_initially        = true;
      std::optional<Range> rotation = Range{-180.0, 180.0}; // degrees
      std::optional<Range> scale    = {};
      int seed = -1; // -1: FAUNA_RANDOM_SEED, or else non-deterministic

      void set_rotation(const real r) noexcept; // (-|r|, |r|)
      void set_scale(const real a, const real b) noexcept;

      bool operator==(const Params& o) const noexcept;
      bool operator!=(const Params& o) const noexcept;

      Json::Value to_json() const noexcept;
      void read(const Json::Value& o) noexcept(false);
      string to_string() const noexcept;
      friend string str(const Params& o) noexcept { return o.to_string(); }
   };

 private:
   struct Pimpl;
   unique_ptr<Pimpl> pimpl_;

 public:
   // Throws std::runtime_error if Y or points do not align with X
   Augmenter(AugmenterData data, const Params& params) noexcept(false);
   Augmenter(const Augmenter&) = delete;
   Augmenter(Augmenter&&)      = default;
   ~Augmenter();
   Augmenter& operator=(const Augmenter&) = delete;
   Augmenter& operator=(Augmenter&&) = default;

   const Params& params() const noexcept;

   int num_samples() const noexcept;
   int num_outputs() const noexcept; // 1 when unnamed
   int size() const noexcept;        // the number of batches

   const vector<vector<int>>& batches() const noexcept;

   // Shuffles the order of the batches, or re-batches a random
   // permutation of the samples
   void shuffle(const bool batches_only = false) noexcept;

   // Throws std::out_of_range for a bad batch index
   AugmentedBatch get_batch(const int batch_idx) noexcept(false);
};

// numpy `array_split`: `n_splits` contiguous parts, where the first
// `n % n_splits` parts are one larger
vector<vector<int>> array_split(const vector<int>& indices,
                                const int n_splits) noexcept;

// Applies the 2x3 affine `M` to every point of every instance, as one
// array, then splits the result back into instances
FramePoints transform_points(const FramePoints& points,
                             const cv::Mat& M) noexcept(false);

// frames -> instances -> [x, y]. A missing node is [null, null].
Json::Value points_to_json(const vector<FramePoints>& points) noexcept;
vector<FramePoints> points_from_json(const Json::Value& o) noexcept(false);

} // namespace fauna
