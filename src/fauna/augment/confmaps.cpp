
#include "confmaps.hpp"

namespace fauna
{
// ---------------------------------------------------------------- make-confmap
//
cv::Mat make_confmap(const FramePoints& points,
                     const int n_nodes,
                     const int height,
                     const int width,
                     const real sigma) noexcept(false)
{
   if(n_nodes <= 0 or n_nodes > CV_CN_MAX)
      throw std::runtime_error(format("invalid number of nodes: {}", n_nodes));
   if(!(sigma > 0.0))
      throw std::runtime_error(format("sigma must be positive, got {}", sigma));

   const real k = -1.0 / (2.0 * sigma * sigma);

   vector<cv::Mat> planes(size_t(n_nodes));
   for(int node = 0; node < n_nodes; ++node) {
      auto& plane = planes[size_t(node)];
      plane       = cv::Mat::zeros(height, width, CV_32FC1);
      for(const auto& inst : points) {
         if(size_t(node) >= inst.size()) continue;
         const auto& p = inst[size_t(node)];
         if(!std::isfinite(p.x) or !std::isfinite(p.y)) continue;
         for(int y = 0; y < height; ++y) {
            float* row     = plane.ptr<float>(y);
            const real dy2 = (real(y) - real(p.y)) * (real(y) - real(p.y));
            for(int x = 0; x < width; ++x) {
               const real dx = real(x) - real(p.x);
               row[x] = std::max(row[x], float(std::exp((dx * dx + dy2) * k)));
            }
         }
      }
   }

   cv::Mat out;
   cv::merge(planes, out);
   return out;
}

// --------------------------------------------------------------- make-confmaps
//
vector<cv::Mat> make_confmaps(const vector<FramePoints>& points,
                              const int n_nodes,
                              const int height,
                              const int width,
                              const real sigma) noexcept(false)
{
   vector<cv::Mat> out;
   out.reserve(points.size());
   for(const auto& frame_points : points)
      out.push_back(make_confmap(frame_points, n_nodes, height, width, sigma));
   return out;
}

// ------------------------------------------------------- make-confmaps-datagen
//
Datagen make_confmaps_datagen(const int n_nodes,
                              const int height,
                              const int width,
                              const real sigma) noexcept
{
   return [=](const vector<FramePoints>& points) {
      return make_confmaps(points, n_nodes, height, width, sigma);
   };
}

} // namespace fauna
