
#include "media-video.hpp"

#include "video-error.hpp"

#include "fauna/utils/file-system.hpp"

#include <opencv2/core/core.hpp>
#include <opencv2/videoio/videoio.hpp>

#define This MediaVideo

namespace fauna
{
// ----------------------------------------------------------------------- Pimpl
//
struct This::Pimpl
{
   string filename;
   bool grayscale = false;
   bool bgr       = true;

   unique_ptr<cv::VideoCapture> reader;
   int next_pos = 0; // position of the decoder

   int n_frames           = 0;
   int w                  = 0;
   int h                  = 0;
   int n_channels         = 0;
   real frames_per_second = 0.0;

   void open() noexcept(false)
   {
      if(reader) return;
      if(!is_regular_file(filename))
         throw VideoNotFoundError(
             format("Could not find media file {}", filename));
      reader = make_unique<cv::VideoCapture>(filename);
      if(!reader->isOpened()) {
         reader.reset();
         throw VideoFormatError(
             format("failed to open media file {}", filename));
      }
      next_pos = 0;
   }

   void close() noexcept { reader.reset(); }

   // The raw decoder output, BGR
   cv::Mat read_raw(const int idx) noexcept(false)
   {
      open();
      if(next_pos != idx) {
         TRACE(format("seek {} => {} in {}", next_pos, idx, filename));
         reader->set(cv::CAP_PROP_POS_FRAMES, double(idx));
      }
      next_pos = -1; // unknown until the read succeeds
      cv::Mat im;
      if(!reader->read(im) or im.empty())
         throw std::runtime_error(
             format("failed to read frame {} of {}", idx, filename));
      next_pos = idx + 1;
      return im;
   }

   Frame finish(const cv::Mat& raw) const noexcept(false)
   {
      if(grayscale) {
         cv::Mat out;
         cv::extractChannel(raw, out, 0);
         return out;
      }
      return bgr ? swap_red_blue(raw) : raw;
   }
};

// ---------------------------------------------------------------- Construction
//
This::This(const string_view filename,
           const std::optional<bool> grayscale,
           const bool bgr) noexcept(false)
    : pimpl_(make_unique<Pimpl>())
{
   auto& P    = *pimpl_;
   P.filename = string(filename);
   P.bgr      = bgr;

   P.open();
   P.n_frames          = int(P.reader->get(cv::CAP_PROP_FRAME_COUNT));
   P.frames_per_second = P.reader->get(cv::CAP_PROP_FPS);

   // Read a test frame to learn the frame shape
   const cv::Mat test_frame = P.read_raw(0);
   P.h                      = test_frame.rows;
   P.w                      = test_frame.cols;

   if(grayscale.has_value()) {
      P.grayscale = *grayscale;
   } else {
      P.grayscale = is_grayscale(test_frame);
      if(P.grayscale) INFO(format("detected grayscale video {}", filename));
   }
   P.n_channels = P.grayscale ? 1 : test_frame.channels();

   INFO(format("opened media video {}, [{} x {} x {} x {}] @ {} fps",
               filename,
               P.n_frames,
               P.h,
               P.w,
               P.n_channels,
               P.frames_per_second));
}

This::~This() = default;

// --------------------------------------------------------------------- getters
//
const string& This::filename() const noexcept { return pimpl_->filename; }
bool This::grayscale() const noexcept { return pimpl_->grayscale; }
bool This::bgr() const noexcept { return pimpl_->bgr; }
real This::fps() const noexcept { return pimpl_->frames_per_second; }

int This::frames() const noexcept { return pimpl_->n_frames; }
int This::height() const noexcept { return pimpl_->h; }
int This::width() const noexcept { return pimpl_->w; }
int This::channels() const noexcept { return pimpl_->n_channels; }

// ------------------------------------------------------------------- get-frame
//
Frame This::get_frame(const int idx) noexcept(false)
{
   check_frame_index(idx, frames());
   return normalise_frame(pimpl_->finish(pimpl_->read_raw(idx)), false);
}

// --------------------------------------------------------------------- matches
//
bool This::matches(const VideoBackend& o) const noexcept
{
   const auto ptr = dynamic_cast<const This*>(&o);
   return ptr != nullptr and filename() == ptr->filename()
          and grayscale() == ptr->grayscale() and bgr() == ptr->bgr();
}

// --------------------------------------------------------------------- to-json
//
Json::Value This::to_json() const noexcept(false)
{
   Json::Value o{Json::objectValue};
   o["filename"]  = filename();
   o["grayscale"] = grayscale();
   o["bgr"]       = bgr();
   return o;
}

void This::close() noexcept { pimpl_->close(); }

} // namespace fauna
