
#include "augmenter.hpp"

#include "fauna/io/json-io.hpp"

#include <opencv2/imgproc/imgproc.hpp>

#define This Augmenter

namespace fauna
{
// ------------------------------------------------------------------ Params
//
void This::Params::set_rotation(const real r) noexcept
{
   rotation = Range{-std::fabs(r), std::fabs(r)};
}

void This::Params::set_scale(const real a, const real b) noexcept
{
   scale = Range{std::min(a, b), std::max(a, b)};
}

bool This::Params::operator==(const Params& o) const noexcept
{
   return batch_size == o.batch_size
          and shuffle_initially == o.shuffle_initially
          and rotation == o.rotation and scale == o.scale and seed == o.seed;
}

bool This::Params::operator!=(const Params& o) const noexcept
{
   return !(*this == o);
}

static Json::Value range_to_json(const std::optional<Augmenter::Range>& x)
{
   if(!x.has_value()) return Json::Value{Json::nullValue};
   Json::Value o{Json::arrayValue};
   o.append(x->first);
   o.append(x->second);
   return o;
}

static std::optional<Augmenter::Range>
range_from_json(const Json::Value& o) noexcept(false)
{
   if(o.isNull()) return {};
   if(o.isNumeric()) { // a scalar 'r' means (-r, r)
      const auto r = std::fabs(o.asDouble());
      return Augmenter::Range{-r, r};
   }
   vector<real> v;
   json_load(o, v);
   if(v.size() != 2)
      throw std::runtime_error(
          format("expected a range [lo, hi], but got {} values", v.size()));
   return Augmenter::Range{std::min(v[0], v[1]), std::max(v[0], v[1])};
}

Json::Value This::Params::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["batch_size"]        = batch_size;
   o["shuffle_initially"] = shuffle_initially;
   o["rotation"]          = range_to_json(rotation);
   o["scale"]             = range_to_json(scale);
   o["seed"]              = seed;
   return o;
}

void This::Params::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading augmenter params"s;
   Params p;
   p.batch_size        = json_load_key<int>(o, "batch_size", op);
   p.shuffle_initially = json_load_key<bool>(o, "shuffle_initially", op);
   if(has_key(o, "rotation")) p.rotation = range_from_json(o["rotation"]);
   if(has_key(o, "scale")) p.scale = range_from_json(o["scale"]);
   json_try_load_key(p.seed, o, "seed", op, false);

   if(p.batch_size <= 0)
      throw std::runtime_error(
          format("batch_size must be positive, got {}", p.batch_size));
   *this = p;
}

string This::Params::to_string() const noexcept
{
   auto range_str = [](const std::optional<Range>& x) -> string {
      return x.has_value() ? format("[{}, {}]", x->first, x->second)
                           : "none"s;
   };

   return format(R"V0G0N(
Augmenter::Params
   batch-size:         {}
   shuffle-initially:  {}
   rotation:           {}
   scale:              {}
   seed:               {}
)V0G0N",
                 batch_size,
                 str(shuffle_initially),
                 range_str(rotation),
                 range_str(scale),
                 seed);
}

// ----------------------------------------------------------------- array-split
//
vector<vector<int>> array_split(const vector<int>& indices,
                                const int n_splits) noexcept
{
   vector<vector<int>> out;
   if(n_splits <= 0) return out;

   const auto n     = indices.size();
   const auto k     = size_t(n_splits);
   const auto base  = n / k;
   const auto extra = n % k;

   out.resize(k);
   auto ii = cbegin(indices);
   for(size_t i = 0; i < k; ++i) {
      const auto sz = base + (i < extra ? 1 : 0);
      out[i].assign(ii, ii + long(sz));
      ii += long(sz);
   }
   return out;
}

// ------------------------------------------------------------ transform-points
//
FramePoints transform_points(const FramePoints& points,
                             const cv::Mat& M) noexcept(false)
{
   // Concatenate, recording the size of each instance
   vector<cv::Point2f> flat;
   vector<size_t> counts;
   counts.reserve(points.size());
   for(const auto& inst : points) {
      flat.insert(end(flat), cbegin(inst), cend(inst));
      counts.push_back(inst.size());
   }

   vector<cv::Point2f> moved;
   if(!flat.empty()) cv::transform(flat, moved, M);

   // Split back into instances
   FramePoints out(points.size());
   auto ii = cbegin(moved);
   for(auto&& [inst, count] : views::zip(out, counts)) {
      inst.assign(ii, ii + long(count));
      ii += long(count);
   }
   return out;
}

// ----------------------------------------------------------------------- Pimpl
//
struct This::Pimpl
{
   AugmenterData data;
   Params params;
   vector<vector<int>> batches;
   std::mt19937 rng;

   int n_samples() const noexcept { return int(data.X.size()); }

   void init() noexcept(false)
   {
      const auto n = data.X.size();
      if(!data.Y.empty() and data.Y.size() != n)
         throw std::runtime_error(
             format("Y has {} images, but X has {}", data.Y.size(), n));
      if(!data.points.empty() and data.points.size() != n)
         throw std::runtime_error(format(
             "points has {} frames, but X has {}", data.points.size(), n));
      if(!data.Y.empty() and !data.points.empty())
         throw std::runtime_error("cannot augment both Y and points");
      if(params.batch_size <= 0)
         throw std::runtime_error(
             format("batch_size must be positive, got {}", params.batch_size));

      const int seed = (params.seed != -1) ? params.seed : fauna_random_seed();
      if(seed != -1)
         rng.seed(std::mt19937::result_type(seed));
      else
         rng.seed(std::random_device{}());

      make_batches(params.shuffle_initially);
   }

   void make_batches(const bool shuffle_samples) noexcept
   {
      vector<int> indices(size_t(n_samples()));
      std::iota(begin(indices), end(indices), 0);
      if(shuffle_samples) std::shuffle(begin(indices), end(indices), rng);
      const int n_batches
          = (n_samples() + params.batch_size - 1) / params.batch_size;
      batches = array_split(indices, n_batches);
   }

   real uniform(const Range& r) noexcept
   {
      if(r.first == r.second) return r.first;
      return std::uniform_real_distribution<real>{r.first, r.second}(rng);
   }

   // One transform per sample
   cv::Mat draw_transform(const cv::Mat& im) noexcept
   {
      const real angle = params.rotation ? uniform(*params.rotation) : 0.0;
      // A degenerate scale range means no scaling
      const bool has_scale
          = params.scale and params.scale->first != params.scale->second;
      const real scale = has_scale ? uniform(*params.scale) : 1.0;
      const auto centre
          = cv::Point2f(float(im.cols - 1) * 0.5f, float(im.rows - 1) * 0.5f);
      return cv::getRotationMatrix2D(centre, angle, scale);
   }

   cv::Mat warp(const cv::Mat& im, const cv::Mat& M) const noexcept(false)
   {
      cv::Mat out;
      cv::warpAffine(im,
                     out,
                     M,
                     im.size(),
                     cv::INTER_LINEAR,
                     cv::BORDER_CONSTANT,
                     cv::Scalar::all(0));
      return out;
   }

   AugmentedBatch get_batch(const int batch_idx) noexcept(false)
   {
      if(batch_idx < 0 or batch_idx >= int(batches.size()))
         throw std::out_of_range(format("batch index {} out of range [0..{})",
                                        batch_idx,
                                        batches.size()));

      AugmentedBatch batch;
      batch.indices = batches[size_t(batch_idx)];

      AugmentedOutput output;
      for(const auto idx : batch.indices) {
         const auto& im = data.X[size_t(idx)];
         const auto M   = draw_transform(im);
         batch.X.push_back(warp(im, M));
         if(!data.Y.empty())
            output.images.push_back(warp(data.Y[size_t(idx)], M));
         if(!data.points.empty())
            output.points.push_back(
                transform_points(data.points[size_t(idx)], M));
      }

      if(data.Y.empty() and data.points.empty()) return batch;

      if(!data.points.empty() and data.datagen) {
         output.images = data.datagen(output.points);
         output.points.clear();
      }

      if(data.output_names.empty()) {
         batch.Y[""s] = std::move(output);
      } else {
         for(const auto& name : data.output_names) batch.Y[name] = output;
      }

      return batch;
   }
};

// ---------------------------------------------------------------- Construction
//
This::This(AugmenterData data, const Params& params) noexcept(false)
    : pimpl_(make_unique<Pimpl>())
{
   pimpl_->data   = std::move(data);
   pimpl_->params = params;
   pimpl_->init();
}

This::~This() = default;

// --------------------------------------------------------------------- getters
//
const This::Params& This::params() const noexcept { return pimpl_->params; }
int This::num_samples() const noexcept { return pimpl_->n_samples(); }
int This::num_outputs() const noexcept
{
   return std::max<int>(1, int(pimpl_->data.output_names.size()));
}
int This::size() const noexcept { return int(pimpl_->batches.size()); }

const vector<vector<int>>& This::batches() const noexcept
{
   return pimpl_->batches;
}

// --------------------------------------------------------------------- shuffle
//
void This::shuffle(const bool batches_only) noexcept
{
   auto& P = *pimpl_;
   if(batches_only)
      std::shuffle(begin(P.batches), end(P.batches), P.rng);
   else
      P.make_batches(true);
}

// ------------------------------------------------------------------- get-batch
//
AugmentedBatch This::get_batch(const int batch_idx) noexcept(false)
{
   return pimpl_->get_batch(batch_idx);
}

// ----------------------------------------------------------- points json
//
Json::Value points_to_json(const vector<FramePoints>& points) noexcept
{
   auto coord = [](float v) {
      return std::isfinite(v) ? Json::Value{double(v)}
                              : Json::Value{Json::nullValue};
   };

   Json::Value o{Json::arrayValue};
   for(const auto& frame : points) {
      Json::Value f{Json::arrayValue};
      for(const auto& instance : frame) {
         Json::Value inst{Json::arrayValue};
         for(const auto& X : instance) {
            Json::Value xy{Json::arrayValue};
            xy.append(coord(X.x));
            xy.append(coord(X.y));
            inst.append(xy);
         }
         f.append(inst);
      }
      o.append(f);
   }
   return o;
}

vector<FramePoints> points_from_json(const Json::Value& o) noexcept(false)
{
   auto expect_array = [](const Json::Value& x, const char* what) {
      if(!x.isArray())
         throw std::runtime_error(format("expected an array of {}", what));
   };

   vector<FramePoints> points;
   expect_array(o, "frames");
   points.reserve(o.size());
   for(const auto& f : o) {
      expect_array(f, "instances");
      FramePoints frame;
      for(const auto& inst : f) {
         expect_array(inst, "points");
         InstancePoints instance;
         for(const auto& xy : inst) {
            if(!xy.isArray() or xy.size() != 2)
               throw std::runtime_error("expected a point [x, y]");
            instance.emplace_back(float(load_numeric(xy[0])),
                                  float(load_numeric(xy[1])));
         }
         frame.push_back(std::move(instance));
      }
      points.push_back(std::move(frame));
   }
   return points;
}

} // namespace fauna
