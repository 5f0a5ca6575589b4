
#pragma once

#include "fauna/foundation.hpp"

#include <opencv2/core/core.hpp>

namespace fauna
{
// A single image: height x width x channels, CV_8U, RGB channel order
using Frame = cv::Mat;

// ------------------------------------------------------------------------ DType
// The element type of the underlying source
enum class DType : int { UINT8 = 0, UINT16, INT32, INT64, FLOAT32, FLOAT64 };

const char* str(DType x) noexcept;                    // "uint8", "float32"...
DType to_dtype(const string_view s) noexcept(false); // throws VideoFormatError
size_t dtype_size(DType x) noexcept;                 // in bytes
bool is_floating_point(DType x) noexcept;

// The cv depth used to hold `x` in memory. INT64 is held as CV_64F.
int cv_depth(DType x) noexcept;

// ------------------------------------------------------------------ FrameShape
//
struct FrameShape
{
   int frames   = 0;
   int height   = 0;
   int width    = 0;
   int channels = 0;

   bool operator==(const FrameShape& o) const noexcept;
   bool operator!=(const FrameShape& o) const noexcept;

   size_t size() const noexcept; // number of elements

   string to_string() const noexcept; // [F x H x W x C]
   friend string str(const FrameShape& o) noexcept { return o.to_string(); }
};

// -------------------------------------------------------------- normalise-frame
// Produces a CV_8U frame. Floating point data with a maximum <= 1 is scaled
// by 255 when `convert_range` is set; everything is then saturated to 0..255.
Frame normalise_frame(const cv::Mat& im, const bool convert_range);

// -------------------------------------------------------------- colour helpers

// RGB <=> BGR for 3 channel images; other images are returned unchanged
cv::Mat swap_red_blue(const cv::Mat& im);

// TRUE iff the first and last channel are equal at every pixel
bool is_grayscale(const cv::Mat& im) noexcept;

} // namespace fauna
