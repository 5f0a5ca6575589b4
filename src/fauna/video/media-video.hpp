
#pragma once

#include "video-backend.hpp"

namespace fauna
{
// ----------------------------------------------------------------- MediaVideo
// Any container the OpenCV decoder reads (mp4, avi...). When `grayscale` is
// unset, it is detected from the first frame.
class MediaVideo final : public VideoBackend
{
 private:
   struct Pimpl;
   unique_ptr<Pimpl> pimpl_;

 public:
   MediaVideo(const string_view filename,
              const std::optional<bool> grayscale = {},
              const bool bgr                      = true) noexcept(false);
   MediaVideo(const MediaVideo&) = delete;
   MediaVideo(MediaVideo&&)      = default;
   ~MediaVideo();
   MediaVideo& operator=(const MediaVideo&) = delete;
   MediaVideo& operator=(MediaVideo&&) = default;

   BackendKind kind() const noexcept override { return BackendKind::MEDIA; }
   const string& filename() const noexcept override;

   bool grayscale() const noexcept;
   bool bgr() const noexcept;
   real fps() const noexcept;

   int frames() const noexcept override;
   int height() const noexcept override;
   int width() const noexcept override;
   int channels() const noexcept override;
   DType dtype() const noexcept override { return DType::UINT8; }

   Frame get_frame(const int idx) noexcept(false) override;
   bool matches(const VideoBackend& o) const noexcept override;
   Json::Value to_json() const noexcept(false) override;
   void close() noexcept override;
};

} // namespace fauna
