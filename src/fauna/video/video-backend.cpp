
#include "video-backend.hpp"

#include "video-error.hpp"

namespace fauna
{
const char* str(BackendKind x) noexcept
{
   switch(x) {
   case BackendKind::HDF5: return "HDF5Video";
   case BackendKind::MEDIA: return "MediaVideo";
   case BackendKind::NUMPY: return "NumpyVideo";
   case BackendKind::FRAME_STORE: return "FrameStoreVideo";
   }
   return "<unknown>";
}

BackendKind to_backend_kind(const string_view s) noexcept(false)
{
   for(auto x : {BackendKind::HDF5,
                 BackendKind::MEDIA,
                 BackendKind::NUMPY,
                 BackendKind::FRAME_STORE})
      if(s == str(x)) return x;
   throw VideoFormatError(format("unknown video backend '{}'", s));
}

void check_frame_index(const int idx, const int n_frames) noexcept(false)
{
   if(idx < 0 or idx >= n_frames)
      throw std::out_of_range(
          format("frame index {} out of range [0..{})", idx, n_frames));
}

} // namespace fauna
