
#pragma once

#include "frame.hpp"
#include "video-backend.hpp"

#include "fauna/io/npy-io.hpp"

namespace fauna
{
// Options for `Video::from_filename`. Each backend reads only its own.
struct VideoOptions
{
   string dataset                = ""s;              // hdf5
   string input_format           = "channels_last"s; // hdf5
   bool convert_range            = true;             // hdf5, numpy
   std::optional<bool> grayscale = {};               // media, unset: detect
   bool bgr                      = true;             // media
   bool index_by_original        = true;             // frame-store
};

// Python slice semantics: negative indices count from the end, and
// out-of-range bounds are clamped
struct Slice
{
   std::optional<int> start = {};
   std::optional<int> stop  = {};
   int step                 = 1;

   // Throws std::invalid_argument if `step` is zero
   vector<int> indices(const int length) const noexcept(false);
};

/**
 * A sequence of frames from any backend. All frames come back as
 * `height x width x channels`, CV_8U, RGB.
 *
 *    auto video = Video::from_filename("session-1/centered_pair.mp4");
 *    cv::Mat im = video.get_frame(0);
 *
 * Copies share the same backend.
 */
class Video
{
 private:
   shared_ptr<VideoBackend> backend_;

   explicit Video(shared_ptr<VideoBackend> backend);

 public:
   // -- Named constructors. Each runs `fixup_path` on the filename, and
   //    throws VideoNotFoundError or VideoFormatError on failure.
   static Video from_hdf5(const string_view filename,
                          const string_view dataset,
                          const string_view input_format = "channels_last",
                          const bool convert_range = true) noexcept(false);
   static Video from_numpy(const string_view filename,
                           const bool convert_range = true) noexcept(false);
   static Video from_numpy(NumpyArray data,
                           const bool convert_range = true) noexcept(false);
   static Video from_media(const string_view filename,
                           const std::optional<bool> grayscale = {},
                           const bool bgr = true) noexcept(false);
   static Video from_frame_store(const string_view filename,
                                 const bool index_by_original
                                 = true) noexcept(false);

   // Dispatches on the (case insensitive) extension: .h5/.hdf5, .npy,
   // .mp4/.avi, or a frame-store directory/metadata.yaml
   static Video from_filename(const string_view filename,
                              const VideoOptions& opts = {}) noexcept(false);

   // Builds a 'png' frame-store at `output` from a list of image files
   static Video
   frame_store_from_filenames(const vector<string>& filenames,
                              const string_view output) noexcept(false);

   // -- Getters
   BackendKind kind() const noexcept { return backend_->kind(); }
   const VideoBackend& backend() const noexcept { return *backend_; }
   const string& filename() const noexcept { return backend_->filename(); }

   int num_frames() const noexcept { return backend_->frames(); }
   int frames() const noexcept { return backend_->frames(); }
   int height() const noexcept { return backend_->height(); }
   int width() const noexcept { return backend_->width(); }
   int channels() const noexcept { return backend_->channels(); }
   DType dtype() const noexcept { return backend_->dtype(); }
   FrameShape shape() const noexcept;
   size_t size() const noexcept { return size_t(num_frames()); }

   string to_string() const noexcept; // Video ([F x H x W x C])
   friend string str(const Video& o) noexcept { return o.to_string(); }

   // -- Frames
   // The values `get_frame` accepts: 0..n-1, or the source frame numbers
   // of a frame-store indexed by original
   vector<int> frame_indices() const noexcept;

   Frame get_frame(const int idx) const noexcept(false);
   vector<Frame> get_frames(const vector<int>& indices) const noexcept(false);
   vector<Frame> get_frames(const Slice& slice) const noexcept(false);

   // Same backend kind, same source and options
   bool matches(const Video& o) const noexcept;

   // FALSE for numpy data that only exists in memory
   bool is_serializable() const noexcept;

   void close() const noexcept { backend_->close(); }

   // -- Writing
   // Saves `indices` (all frames when empty) as a uint8 .npy file
   void to_numpy(const string_view filename,
                 const vector<int>& indices = {}) const noexcept(false);

   // Replaces anything at `path`. Stores all frames when `frame_numbers` is
   // empty. `format` defaults to 'mjpeg/avi' for all frames, else 'png'.
   Video to_frame_store(const string_view path,
                        const vector<int>& frame_numbers = {},
                        const string_view format         = "",
                        const bool index_by_original
                        = true) const noexcept(false);
};

} // namespace fauna
