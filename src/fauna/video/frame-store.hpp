
#pragma once

#include "frame.hpp"

#include "json/json.h"

namespace fauna
{
/**
 * A frame-store is a directory holding an indexed sequence of images, in
 * chunks of `chunksize` frames:
 *
 *    <dir>/metadata.yaml     format, image shape, chunksize, frame count
 *    <dir>/000000.yaml       frame numbers and times for chunk 0
 *    <dir>/000000/           'png', 'jpg', 'bmp': one image per frame
 *    <dir>/000000.avi        'mjpeg/avi': one MJPG video per chunk
 *    <dir>/extra_data.json   arbitrary user data
 *
 * Every image is recorded with its frame number in the source video.
 */

struct ImageShape
{
   int height   = 0;
   int width    = 0;
   int channels = 0;

   bool operator==(const ImageShape& o) const noexcept
   {
      return height == o.height and width == o.width
             and channels == o.channels;
   }
   bool operator!=(const ImageShape& o) const noexcept { return !(*this == o); }
};

// 'png', 'jpg', 'bmp', or 'mjpeg/avi'
bool is_valid_frame_store_format(const string_view format) noexcept;

// ------------------------------------------------------------ FrameStoreWriter
//
class FrameStoreWriter
{
 private:
   struct Pimpl;
   unique_ptr<Pimpl> pimpl_;

   FrameStoreWriter();

 public:
   FrameStoreWriter(const FrameStoreWriter&) = delete;
   FrameStoreWriter(FrameStoreWriter&&)      = default;
   ~FrameStoreWriter(); // closes
   FrameStoreWriter& operator=(const FrameStoreWriter&) = delete;
   FrameStoreWriter& operator=(FrameStoreWriter&&) = default;

   // Throws VideoFormatError for an unknown format, and std::runtime_error
   // if `basedir` already holds a frame-store
   static FrameStoreWriter create(const string_view basedir,
                                  const string_view format,
                                  const ImageShape imgshape,
                                  const int chunksize) noexcept(false);

   // `im` must be CV_8U, RGB, with shape `imgshape`
   void add_image(const cv::Mat& im,
                  const int frame_number,
                  const real frame_time) noexcept(false);

   void add_extra_data(const Json::Value& o) noexcept;

   int frame_count() const noexcept;

   // Flushes the last chunk and writes the metadata
   void close() noexcept(false);
};

// ------------------------------------------------------------------ FrameStore
//
class FrameStore
{
 private:
   struct Pimpl;
   unique_ptr<Pimpl> pimpl_;

   FrameStore();

 public:
   FrameStore(const FrameStore&) = delete;
   FrameStore(FrameStore&&)      = default;
   ~FrameStore();
   FrameStore& operator=(const FrameStore&) = delete;
   FrameStore& operator=(FrameStore&&) = default;

   // `path` is the store directory, or its 'metadata.yaml'.
   // Throws VideoNotFoundError or VideoFormatError
   static FrameStore open(const string_view path) noexcept(false);

   const string& directory() const noexcept;
   const string& metadata_filename() const noexcept;
   const string& format() const noexcept;
   int chunksize() const noexcept;
   int frame_count() const noexcept;
   ImageShape imgshape() const noexcept;

   const vector<int>& frame_numbers() const noexcept;
   const vector<real>& frame_times() const noexcept;
   bool has_frame_number(const int frame_number) const noexcept;

   // Throws std::out_of_range for an unknown frame number
   cv::Mat get_image(const int frame_number) noexcept(false);

   // Throws std::out_of_range unless 0 <= index < frame_count()
   cv::Mat get_image_by_index(const int index) noexcept(false);

   // Iterates from the start, or from the last image read.
   // Returns FALSE after the last image.
   bool get_next_image(cv::Mat& im, int& frame_number) noexcept(false);

   Json::Value extra_data() const noexcept(false);

   bool is_open() const noexcept;
   void close() noexcept;
};

} // namespace fauna
