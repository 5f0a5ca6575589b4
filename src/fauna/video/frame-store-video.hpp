
#pragma once

#include "frame-store.hpp"
#include "video-backend.hpp"

namespace fauna
{
// ------------------------------------------------------------ FrameStoreVideo
// With `index_by_original`, `get_frame(n)` takes the frame number of the
// source video, as recorded in the store. Otherwise `n` is the index into
// the store.
class FrameStoreVideo final : public VideoBackend
{
 private:
   struct Pimpl;
   unique_ptr<Pimpl> pimpl_;

 public:
   // `filename` is the store directory or its 'metadata.yaml'
   FrameStoreVideo(const string_view filename,
                   const bool index_by_original = true) noexcept(false);
   FrameStoreVideo(const FrameStoreVideo&) = delete;
   FrameStoreVideo(FrameStoreVideo&&)      = default;
   ~FrameStoreVideo();
   FrameStoreVideo& operator=(const FrameStoreVideo&) = delete;
   FrameStoreVideo& operator=(FrameStoreVideo&&) = default;

   BackendKind kind() const noexcept override
   {
      return BackendKind::FRAME_STORE;
   }

   // Absolute path to 'metadata.yaml'
   const string& filename() const noexcept override;

   bool index_by_original() const noexcept;
   const vector<int>& frame_numbers() const noexcept;

   int frames() const noexcept override;
   int height() const noexcept override;
   int width() const noexcept override;
   int channels() const noexcept override;
   DType dtype() const noexcept override { return DType::UINT8; }

   Frame get_frame(const int idx) noexcept(false) override;
   bool matches(const VideoBackend& o) const noexcept override;
   Json::Value to_json() const noexcept(false) override;

   void open() noexcept(false);
   void close() noexcept override;
};

} // namespace fauna
