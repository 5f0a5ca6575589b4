
#pragma once

#include "augmenter.hpp"

namespace fauna
{
// One CV_32FC(n_nodes) map per frame. Channel `k` is the maximum, over
// instances, of a gaussian with standard deviation `sigma` centred on
// node `k`. Missing (NaN) nodes are skipped.
vector<cv::Mat> make_confmaps(const vector<FramePoints>& points,
                              const int n_nodes,
                              const int height,
                              const int width,
                              const real sigma) noexcept(false);

cv::Mat make_confmap(const FramePoints& points,
                     const int n_nodes,
                     const int height,
                     const int width,
                     const real sigma) noexcept(false);

// An Augmenter datagen that produces confidence maps
Datagen make_confmaps_datagen(const int n_nodes,
                              const int height,
                              const int width,
                              const real sigma) noexcept;

} // namespace fauna
