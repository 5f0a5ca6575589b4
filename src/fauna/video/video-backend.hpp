
#pragma once

#include "frame.hpp"

#include "json/json.h"

namespace fauna
{
enum class BackendKind : int { HDF5 = 0, MEDIA, NUMPY, FRAME_STORE };

// "HDF5Video", "MediaVideo", "NumpyVideo", "FrameStoreVideo"
const char* str(BackendKind x) noexcept;
BackendKind to_backend_kind(const string_view s) noexcept(false);

// Throws std::out_of_range unless 0 <= idx < n_frames
void check_frame_index(const int idx, const int n_frames) noexcept(false);

/**
 * Every concrete backend reports the same shape semantics:
 * frames x height x width x channels, and frames come back as CV_8U.
 */
class VideoBackend
{
 public:
   virtual ~VideoBackend() = default;

   virtual BackendKind kind() const noexcept = 0;
   virtual const string& filename() const noexcept = 0;

   virtual int frames() const noexcept   = 0;
   virtual int height() const noexcept   = 0;
   virtual int width() const noexcept    = 0;
   virtual int channels() const noexcept = 0;
   virtual DType dtype() const noexcept  = 0;

   virtual Frame get_frame(const int idx) noexcept(false) = 0;

   // Same source, same options. `o` is always the same kind.
   virtual bool matches(const VideoBackend& o) const noexcept = 0;

   // The fields needed to reconstruct this backend
   virtual Json::Value to_json() const noexcept(false) = 0;

   // Releases file handles. The next `get_frame` reopens.
   virtual void close() noexcept = 0;
};

} // namespace fauna
