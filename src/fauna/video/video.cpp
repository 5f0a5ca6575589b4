
#include "video.hpp"

#include "fixup-path.hpp"
#include "frame-store-video.hpp"
#include "frame-store.hpp"
#include "hdf5-video.hpp"
#include "media-video.hpp"
#include "numpy-video.hpp"
#include "video-error.hpp"
#include "video-io.hpp"

#include "fauna/utils/file-system.hpp"
#include "fauna/utils/tick-tock.hpp"

#include <opencv2/imgcodecs/imgcodecs.hpp>

namespace fauna
{
// ----------------------------------------------------------------------- Slice
//
vector<int> Slice::indices(const int length) const noexcept(false)
{
   if(step == 0) throw std::invalid_argument("slice step cannot be zero");

   auto resolve = [&](std::optional<int> x, int def, int lo, int hi) {
      if(!x.has_value()) return def;
      int v = *x;
      if(v < 0) v += length;
      return std::clamp(v, lo, hi);
   };

   vector<int> out;
   if(step > 0) {
      const int i0 = resolve(start, 0, 0, length);
      const int i1 = resolve(stop, length, 0, length);
      for(int i = i0; i < i1; i += step) out.push_back(i);
   } else {
      const int i0 = resolve(start, length - 1, -1, length - 1);
      const int i1 = resolve(stop, -1, -1, length - 1);
      for(int i = i0; i > i1; i += step) out.push_back(i);
   }
   return out;
}

// ---------------------------------------------------------------- Construction
//
Video::Video(shared_ptr<VideoBackend> backend)
    : backend_(std::move(backend))
{
   Expects(backend_ != nullptr);
}

Video Video::from_hdf5(const string_view filename,
                       const string_view dataset,
                       const string_view input_format,
                       const bool convert_range) noexcept(false)
{
   return Video(make_shared<HDF5Video>(
       fixup_path(filename), dataset, input_format, convert_range));
}

Video Video::from_numpy(const string_view filename,
                        const bool convert_range) noexcept(false)
{
   return Video(make_shared<NumpyVideo>(fixup_path(filename), convert_range));
}

Video Video::from_numpy(NumpyArray data, const bool convert_range) noexcept(
    false)
{
   return Video(make_shared<NumpyVideo>(std::move(data), convert_range));
}

Video Video::from_media(const string_view filename,
                        const std::optional<bool> grayscale,
                        const bool bgr) noexcept(false)
{
   return Video(make_shared<MediaVideo>(fixup_path(filename), grayscale, bgr));
}

Video Video::from_frame_store(const string_view filename,
                              const bool index_by_original) noexcept(false)
{
   return Video(make_shared<FrameStoreVideo>(fixup_path(filename),
                                             index_by_original));
}

// --------------------------------------------------------------- from-filename
//
Video Video::from_filename(const string_view filename,
                           const VideoOptions& opts) noexcept(false)
{
   const auto path = fixup_path(filename);
   const auto ext  = string_to_lowercase(file_ext(path));

   if(ext == ".h5" or ext == ".hdf5") {
      if(opts.dataset.empty())
         throw VideoFormatError(
             format("a dataset is required to open HDF5 file {}", path));
      return from_hdf5(path, opts.dataset, opts.input_format, opts.convert_range);
   }

   if(ext == ".npy") return from_numpy(path, opts.convert_range);

   if(ext == ".mp4" or ext == ".avi")
      return from_media(path, opts.grayscale, opts.bgr);

   if(is_directory(path) or path.find("metadata.yaml") != string::npos)
      return from_frame_store(path, opts.index_by_original);

   throw VideoFormatError("Could not detect backend for specified filename.");
}

// -------------------------------------------------- frame-store-from-filenames
//
Video Video::frame_store_from_filenames(const vector<string>& filenames,
                                        const string_view output) noexcept(false)
{
   if(filenames.empty())
      throw std::runtime_error("no image files to build a frame-store from");

   // Every image becomes 8-bit, 3-channel, whatever is on disk
   auto read_rgb = [](const string& fname) {
      const cv::Mat im = cv::imread(fname, cv::IMREAD_COLOR);
      if(im.empty())
         throw VideoNotFoundError(format("failed to read image {}", fname));
      return swap_red_blue(im);
   };

   const auto im0   = read_rgb(filenames.front());
   const auto shape = ImageShape{im0.rows, im0.cols, 3};

   auto writer = FrameStoreWriter::create(
       output, "png", shape, fauna_default_chunksize());

   for(size_t i = 0; i < filenames.size(); ++i) {
      const auto im = (i == 0) ? im0 : read_rgb(filenames[i]);
      writer.add_image(im, int(i), real(i));
   }
   writer.close();

   return from_frame_store(output);
}

// --------------------------------------------------------------------- getters
//
FrameShape Video::shape() const noexcept
{
   return FrameShape{frames(), height(), width(), channels()};
}

string Video::to_string() const noexcept
{
   return format("Video ({})", shape().to_string());
}

// ---------------------------------------------------------------------- frames
//
Frame Video::get_frame(const int idx) const noexcept(false)
{
   return backend_->get_frame(idx);
}

vector<Frame> Video::get_frames(const vector<int>& indices) const
    noexcept(false)
{
   vector<Frame> out;
   out.reserve(indices.size());
   for(const auto idx : indices) out.push_back(get_frame(idx));
   return out;
}

vector<Frame> Video::get_frames(const Slice& slice) const noexcept(false)
{
   // Slices positions, which map to frame numbers when indexed by original
   const auto all = frame_indices();
   vector<int> indices;
   for(const auto pos : slice.indices(int(all.size())))
      indices.push_back(all[size_t(pos)]);
   return get_frames(indices);
}

// --------------------------------------------------------------------- matches
//
bool Video::matches(const Video& o) const noexcept
{
   return kind() == o.kind() and backend_->matches(*o.backend_);
}

bool Video::is_serializable() const noexcept
{
   const auto ptr = dynamic_cast<const NumpyVideo*>(backend_.get());
   return ptr == nullptr or !ptr->is_in_memory();
}

// -------------------------------------------------------------------- to-numpy
//
void Video::to_numpy(const string_view filename,
                     const vector<int>& indices) const noexcept(false)
{
   const auto ims = get_frames(indices.empty() ? frame_indices() : indices);
   save_npy(filename, frames_to_numpy(ims));
}

// --------------------------------------------------------------- frame-indices

vector<int> Video::frame_indices() const noexcept
{
   const auto fs = dynamic_cast<const FrameStoreVideo*>(backend_.get());
   if(fs != nullptr and fs->index_by_original()) return fs->frame_numbers();

   vector<int> indices(size_t(num_frames()));
   std::iota(begin(indices), end(indices), 0);
   return indices;
}

// -------------------------------------------------------------- to-frame-store

Video Video::to_frame_store(const string_view path,
                            const vector<int>& frame_numbers,
                            const string_view format,
                            const bool index_by_original) const noexcept(false)
{
   const bool all_frames = frame_numbers.empty();
   const string store_format
       = !format.empty() ? string(format) : all_frames ? "mjpeg/avi"s : "png"s;

   if(!is_valid_frame_store_format(store_format))
      throw VideoFormatError(
          fmt::format("invalid frame-store format '{}'", store_format));

   if(is_directory(path) or is_regular_file(path)) remove_all(path);

   const vector<int> numbers = all_frames ? frame_indices() : frame_numbers;

   const auto tt = tick();
   auto writer   = FrameStoreWriter::create(
       path,
       store_format,
       ImageShape{height(), width(), channels()},
       fauna_default_chunksize());
   for(const auto n : numbers) writer.add_image(get_frame(n), n, real(n));
   if(is_serializable()) writer.add_extra_data(video_to_json(*this));
   writer.close();

   INFO(fmt::format("exported {} frames of {} to {} in {}ms",
                    numbers.size(),
                    filename(),
                    path,
                    ms_tock_s(tt)));

   return from_frame_store(path, index_by_original);
}

} // namespace fauna
