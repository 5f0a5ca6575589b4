
#pragma once

#include "video-backend.hpp"

namespace fauna
{
// ------------------------------------------------------------------ HDF5Video
// A 4d dataset inside an HDF5 file. 'channels_last' is
// (frames, height, width, channels) and 'channels_first' is
// (frames, channels, width, height). A rank 3 dataset is
// (frames, height, width) with a single channel.
class HDF5Video final : public VideoBackend
{
 private:
   struct Pimpl;
   unique_ptr<Pimpl> pimpl_;

 public:
   // Throws VideoNotFoundError or VideoFormatError
   HDF5Video(const string_view filename,
             const string_view dataset,
             const string_view input_format = "channels_last",
             const bool convert_range       = true) noexcept(false);
   HDF5Video(const HDF5Video&) = delete;
   HDF5Video(HDF5Video&&)      = default;
   ~HDF5Video();
   HDF5Video& operator=(const HDF5Video&) = delete;
   HDF5Video& operator=(HDF5Video&&) = default;

   BackendKind kind() const noexcept override { return BackendKind::HDF5; }
   const string& filename() const noexcept override;

   const string& dataset() const noexcept;
   const string& input_format() const noexcept;
   bool convert_range() const noexcept;

   int frames() const noexcept override;
   int height() const noexcept override;
   int width() const noexcept override;
   int channels() const noexcept override;
   DType dtype() const noexcept override;

   Frame get_frame(const int idx) noexcept(false) override;
   bool matches(const VideoBackend& o) const noexcept override;
   Json::Value to_json() const noexcept(false) override;
   void close() noexcept override;
};

} // namespace fauna
