
#pragma once

#include "fauna/foundation.hpp"
#include "fauna/video/frame.hpp"

namespace fauna
{
// A dense, C-ordered array, as held in a .npy file
struct NumpyArray
{
   vector<size_t> shape;
   DType dtype = DType::UINT8;
   vector<char> bytes;

   size_t n_elements() const noexcept;

   bool operator==(const NumpyArray& o) const noexcept;
   bool operator!=(const NumpyArray& o) const noexcept;

   // Throws VideoFormatError if `bytes` does not agree with shape and dtype
   void check_invariant() const noexcept(false);
};

// Throws VideoNotFoundError when the file is missing, and VideoFormatError
// for fortran ordered, big-endian, or unsupported element types.
NumpyArray load_npy(const string_view filename) noexcept(false);

void save_npy(const string_view filename, const NumpyArray& a) noexcept(false);

// Stacks CV_8U frames into a (frames, height, width, channels) uint8 array
NumpyArray frames_to_numpy(const vector<cv::Mat>& frames) noexcept(false);

} // namespace fauna
