
#include "numpy-video.hpp"

#include "video-error.hpp"

#define This NumpyVideo

namespace fauna
{
// ----------------------------------------------------------------------- Pimpl
//
struct This::Pimpl
{
   string filename;
   bool convert_range = true;
   bool in_memory     = false;
   NumpyArray data;

   int n_frames   = 0;
   int h          = 0;
   int w          = 0;
   int n_channels = 0;

   void init(NumpyArray a) noexcept(false)
   {
      a.check_invariant();
      const auto rank = a.shape.size();
      if(rank != 3 and rank != 4)
         throw VideoFormatError(
             format("expected a 4d (or 3d) array, but rank is {}", rank));

      data       = std::move(a);
      n_frames   = int(data.shape[0]);
      h          = int(data.shape[1]);
      w          = int(data.shape[2]);
      n_channels = (rank == 3) ? 1 : int(data.shape[3]);
   }

   Frame get_frame(const int idx) const noexcept(false)
   {
      check_frame_index(idx, n_frames);
      const size_t frame_sz
          = size_t(h) * size_t(w) * size_t(n_channels) * dtype_size(data.dtype);
      const char* src = data.bytes.data() + size_t(idx) * frame_sz;

      if(data.dtype == DType::INT64) {
         cv::Mat im(h, w, CV_MAKETYPE(CV_64F, n_channels));
         const auto ptr = reinterpret_cast<const int64_t*>(src);
         const auto dst = reinterpret_cast<double*>(im.data);
         std::transform(ptr,
                        ptr + size_t(h) * size_t(w) * size_t(n_channels),
                        dst,
                        [](int64_t x) { return double(x); });
         return im;
      }

      // Wraps `src` without copying; clone before the buffer can go away
      const cv::Mat im(h,
                       w,
                       CV_MAKETYPE(cv_depth(data.dtype), n_channels),
                       const_cast<char*>(src));
      return im.clone();
   }
};

// ---------------------------------------------------------------- Construction
//
This::This(const string_view filename, const bool convert_range) noexcept(
    false)
    : pimpl_(make_unique<Pimpl>())
{
   pimpl_->filename      = string(filename);
   pimpl_->convert_range = convert_range;
   pimpl_->init(load_npy(filename));
   INFO(format("opened numpy video {}, [{} x {} x {} x {}] {}",
               filename,
               frames(),
               height(),
               width(),
               channels(),
               str(dtype())));
}

This::This(NumpyArray data, const bool convert_range) noexcept(false)
    : pimpl_(make_unique<Pimpl>())
{
   pimpl_->filename      = k_raw_filename;
   pimpl_->convert_range = convert_range;
   pimpl_->in_memory     = true;
   pimpl_->init(std::move(data));
}

This::~This() = default;

// --------------------------------------------------------------------- getters
//
const string& This::filename() const noexcept { return pimpl_->filename; }
bool This::is_in_memory() const noexcept { return pimpl_->in_memory; }
bool This::convert_range() const noexcept { return pimpl_->convert_range; }
const NumpyArray& This::data() const noexcept { return pimpl_->data; }

int This::frames() const noexcept { return pimpl_->n_frames; }
int This::height() const noexcept { return pimpl_->h; }
int This::width() const noexcept { return pimpl_->w; }
int This::channels() const noexcept { return pimpl_->n_channels; }
DType This::dtype() const noexcept { return pimpl_->data.dtype; }

// ------------------------------------------------------------------- get-frame
//
Frame This::get_frame(const int idx) noexcept(false)
{
   return normalise_frame(pimpl_->get_frame(idx), pimpl_->convert_range);
}

// --------------------------------------------------------------------- matches
// Element-wise equality of the data
bool This::matches(const VideoBackend& o) const noexcept
{
   const auto ptr = dynamic_cast<const This*>(&o);
   return ptr != nullptr and data() == ptr->data();
}

// --------------------------------------------------------------------- to-json
//
Json::Value This::to_json() const noexcept(false)
{
   if(is_in_memory())
      throw std::runtime_error(
          "cannot serialize a numpy video that only exists in memory");
   Json::Value o{Json::objectValue};
   o["filename"]      = filename();
   o["convert_range"] = convert_range();
   return o;
}

} // namespace fauna
