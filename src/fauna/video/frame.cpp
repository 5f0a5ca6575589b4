
#include "frame.hpp"

#include "video-error.hpp"

#include <opencv2/imgproc/imgproc.hpp>

namespace fauna
{
// ----------------------------------------------------------------------- DType
//
const char* str(DType x) noexcept
{
   switch(x) {
   case DType::UINT8: return "uint8";
   case DType::UINT16: return "uint16";
   case DType::INT32: return "int32";
   case DType::INT64: return "int64";
   case DType::FLOAT32: return "float32";
   case DType::FLOAT64: return "float64";
   }
   return "<unknown>";
}

DType to_dtype(const string_view s) noexcept(false)
{
   if(s == "uint8") return DType::UINT8;
   if(s == "uint16") return DType::UINT16;
   if(s == "int32") return DType::INT32;
   if(s == "int64") return DType::INT64;
   if(s == "float32") return DType::FLOAT32;
   if(s == "float64") return DType::FLOAT64;
   throw VideoFormatError(format("unsupported dtype '{}'", s));
}

size_t dtype_size(DType x) noexcept
{
   switch(x) {
   case DType::UINT8: return 1;
   case DType::UINT16: return 2;
   case DType::INT32: return 4;
   case DType::INT64: return 8;
   case DType::FLOAT32: return 4;
   case DType::FLOAT64: return 8;
   }
   return 0;
}

bool is_floating_point(DType x) noexcept
{
   return x == DType::FLOAT32 or x == DType::FLOAT64;
}

int cv_depth(DType x) noexcept
{
   switch(x) {
   case DType::UINT8: return CV_8U;
   case DType::UINT16: return CV_16U;
   case DType::INT32: return CV_32S;
   case DType::INT64: return CV_64F;
   case DType::FLOAT32: return CV_32F;
   case DType::FLOAT64: return CV_64F;
   }
   return CV_8U;
}

// ------------------------------------------------------------------ FrameShape
//
bool FrameShape::operator==(const FrameShape& o) const noexcept
{
   return frames == o.frames and height == o.height and width == o.width
          and channels == o.channels;
}

bool FrameShape::operator!=(const FrameShape& o) const noexcept
{
   return !(*this == o);
}

size_t FrameShape::size() const noexcept
{
   return size_t(frames) * size_t(height) * size_t(width) * size_t(channels);
}

string FrameShape::to_string() const noexcept
{
   return format("[{} x {} x {} x {}]", frames, height, width, channels);
}

// ------------------------------------------------------------- normalise-frame
//
Frame normalise_frame(const cv::Mat& im, const bool convert_range)
{
   if(im.empty()) return im;
   if(im.depth() == CV_8U) return im;

   double alpha = 1.0;
   if(convert_range and (im.depth() == CV_32F or im.depth() == CV_64F)) {
      double minval = 0.0, maxval = 0.0;
      cv::minMaxLoc(im.reshape(1), &minval, &maxval);
      if(maxval <= 1.0) alpha = 255.0;
   }

   Frame out;
   im.convertTo(out, CV_MAKETYPE(CV_8U, im.channels()), alpha);
   return out;
}

// -------------------------------------------------------------- colour helpers
//
cv::Mat swap_red_blue(const cv::Mat& im)
{
   if(im.channels() != 3) return im;
   cv::Mat out;
   cv::cvtColor(im, out, cv::COLOR_BGR2RGB);
   return out;
}

bool is_grayscale(const cv::Mat& im) noexcept
{
   if(im.empty() or im.channels() == 1) return true;
   cv::Mat first, last;
   cv::extractChannel(im, first, 0);
   cv::extractChannel(im, last, im.channels() - 1);
   return cv::countNonZero(first != last) == 0;
}

} // namespace fauna
