
#pragma once

#include "video-backend.hpp"

#include "fauna/io/npy-io.hpp"

namespace fauna
{
// ----------------------------------------------------------------- NumpyVideo
// A (frames, height, width, channels) array, or (frames, height, width)
// for a single channel. Held entirely in memory.
class NumpyVideo final : public VideoBackend
{
 private:
   struct Pimpl;
   unique_ptr<Pimpl> pimpl_;

 public:
   static constexpr const char* k_raw_filename = "Raw Video Data";

   // Loads a .npy file
   NumpyVideo(const string_view filename,
              const bool convert_range = true) noexcept(false);

   // Wraps an in-memory array; `filename()` is `k_raw_filename`
   NumpyVideo(NumpyArray data, const bool convert_range = true) noexcept(false);

   NumpyVideo(const NumpyVideo&) = delete;
   NumpyVideo(NumpyVideo&&)      = default;
   ~NumpyVideo();
   NumpyVideo& operator=(const NumpyVideo&) = delete;
   NumpyVideo& operator=(NumpyVideo&&) = default;

   BackendKind kind() const noexcept override { return BackendKind::NUMPY; }
   const string& filename() const noexcept override;

   bool is_in_memory() const noexcept;
   bool convert_range() const noexcept;
   const NumpyArray& data() const noexcept;

   int frames() const noexcept override;
   int height() const noexcept override;
   int width() const noexcept override;
   int channels() const noexcept override;
   DType dtype() const noexcept override;

   Frame get_frame(const int idx) noexcept(false) override;
   bool matches(const VideoBackend& o) const noexcept override;

   // Throws std::runtime_error for in-memory data
   Json::Value to_json() const noexcept(false) override;
   void close() noexcept override {}
};

} // namespace fauna
