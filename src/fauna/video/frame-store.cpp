
#include "frame-store.hpp"

#include "video-backend.hpp"
#include "video-error.hpp"

#include "fauna/io/json-io.hpp"
#include "fauna/utils/file-system.hpp"

#include <opencv2/core/core.hpp>
#include <opencv2/imgcodecs/imgcodecs.hpp>
#include <opencv2/imgproc/imgproc.hpp>
#include <opencv2/videoio/videoio.hpp>

namespace fauna
{
static constexpr real k_video_store_fps = 25.0;

static const char* k_metadata_fname   = "metadata.yaml";
static const char* k_extra_data_fname = "extra_data.json";

// --------------------------------------------------------------------- helpers
//
bool is_valid_frame_store_format(const string_view format) noexcept
{
   return format == "png" or format == "jpg" or format == "bmp"
          or format == "mjpeg/avi";
}

static bool is_video_format(const string_view format) noexcept
{
   return format == "mjpeg/avi";
}

static string extension_of(const string_view fmt_s) noexcept
{
   return is_video_format(fmt_s) ? ".avi"s : format(".{}", fmt_s);
}

static string chunk_name(const int chunk) { return format("{:06d}", chunk); }

static string index_fname(const string_view dir, const int chunk)
{
   return format("{}/{}.yaml", dir, chunk_name(chunk));
}

static string video_fname(const string_view dir, const int chunk)
{
   return format("{}/{}.avi", dir, chunk_name(chunk));
}

static string image_fname(const string_view dir,
                          const int chunk,
                          const int index,
                          const string_view ext)
{
   return format("{}/{}/{:06d}{}", dir, chunk_name(chunk), index, ext);
}

// ============================================================ FrameStoreWriter

struct FrameStoreWriter::Pimpl
{
   string basedir;
   string format;
   string ext;
   ImageShape shape;
   int chunksize = 0;

   int n_frames      = 0;
   int current_chunk = -1;
   vector<int> chunk_frame_numbers;
   vector<real> chunk_frame_times;
   unique_ptr<cv::VideoWriter> video;

   Json::Value extra_data{Json::nullValue};
   bool is_closed = false;

   ~Pimpl()
   {
      try {
         close();
      } catch(std::exception& e) {
         LOG_ERR(fmt::format(
             "error closing frame-store '{}': {}", basedir, e.what()));
      }
   }

   void start_chunk(const int chunk) noexcept(false)
   {
      current_chunk = chunk;
      chunk_frame_numbers.clear();
      chunk_frame_times.clear();

      if(is_video_format(format)) {
         const auto fname = video_fname(basedir, chunk);
         video            = make_unique<cv::VideoWriter>(
             fname,
             cv::VideoWriter::fourcc('M', 'J', 'P', 'G'),
             k_video_store_fps,
             cv::Size(shape.width, shape.height),
             true);
         if(!video->isOpened())
            throw std::runtime_error(
                fmt::format("failed to open video writer for '{}'", fname));
      } else {
         const auto dir = fmt::format("{}/{}", basedir, chunk_name(chunk));
         if(!mkdir_p(dir))
            throw std::runtime_error(
                fmt::format("failed to create directory '{}'", dir));
      }
   }

   void finish_chunk() noexcept(false)
   {
      if(current_chunk < 0) return;
      if(video) {
         video->release();
         video.reset();
      }

      cv::FileStorage fs(index_fname(basedir, current_chunk),
                         cv::FileStorage::WRITE);
      fs << "frame_number" << chunk_frame_numbers;
      fs << "frame_time" << chunk_frame_times;
      fs.release();
      current_chunk = -1;
   }

   void add_image(const cv::Mat& im,
                  const int frame_number,
                  const real frame_time) noexcept(false)
   {
      if(is_closed)
         throw std::runtime_error(
             fmt::format("frame-store '{}' is closed", basedir));

      if(im.depth() != CV_8U or im.rows != shape.height
         or im.cols != shape.width or im.channels() != shape.channels)
         throw std::runtime_error(fmt::format(
             "image [{}x{}x{}] does not match frame-store shape [{}x{}x{}]",
             im.rows,
             im.cols,
             im.channels(),
             shape.height,
             shape.width,
             shape.channels));

      const int chunk = n_frames / chunksize;
      if(chunk != current_chunk) {
         finish_chunk();
         start_chunk(chunk);
      }

      if(video) {
         cv::Mat bgr;
         if(im.channels() == 1)
            cv::cvtColor(im, bgr, cv::COLOR_GRAY2BGR);
         else
            bgr = swap_red_blue(im);
         video->write(bgr);
      } else {
         const auto fname = image_fname(basedir, chunk, n_frames, ext);
         if(!cv::imwrite(fname, swap_red_blue(im)))
            throw std::runtime_error(
                fmt::format("failed to write image '{}'", fname));
      }

      chunk_frame_numbers.push_back(frame_number);
      chunk_frame_times.push_back(frame_time);
      ++n_frames;
   }

   void close() noexcept(false)
   {
      if(is_closed) return;
      is_closed = true;
      finish_chunk();

      cv::FileStorage fs(fmt::format("{}/{}", basedir, k_metadata_fname),
                         cv::FileStorage::WRITE);
      fs << "class"
         << (is_video_format(format) ? "VideoStore" : "DirectoryStore");
      fs << "format" << format;
      fs << "extension" << ext;
      fs << "imgshape"
         << vector<int>{shape.height, shape.width, shape.channels};
      fs << "imgdtype"
         << "uint8";
      fs << "chunksize" << chunksize;
      fs << "frame_count" << n_frames;
      fs.release();

      if(!extra_data.isNull()) {
         const auto fname = fmt::format("{}/{}", basedir, k_extra_data_fname);
         const auto ec    = file_put_contents(fname, str(extra_data));
         if(ec)
            throw std::runtime_error(fmt::format(
                "failed to write '{}': {}", fname, ec.message()));
      }

      INFO(fmt::format("wrote {} frames to frame-store {}", n_frames, basedir));
   }
};

FrameStoreWriter::FrameStoreWriter()
    : pimpl_(make_unique<Pimpl>())
{}

FrameStoreWriter::~FrameStoreWriter() = default;

FrameStoreWriter FrameStoreWriter::create(const string_view basedir,
                                          const string_view format,
                                          const ImageShape imgshape,
                                          const int chunksize) noexcept(false)
{
   if(!is_valid_frame_store_format(format))
      throw VideoFormatError(
          fmt::format("invalid frame-store format '{}', expected one of "
                      "'png', 'jpg', 'bmp', 'mjpeg/avi'",
                      format));

   if(chunksize <= 0)
      throw std::runtime_error(
          fmt::format("frame-store chunksize must be positive: {}", chunksize));

   if(imgshape.height <= 0 or imgshape.width <= 0
      or (imgshape.channels != 1 and imgshape.channels != 3))
      throw std::runtime_error(
          fmt::format("invalid frame-store image shape [{}x{}x{}]",
                      imgshape.height,
                      imgshape.width,
                      imgshape.channels));

   if(is_regular_file(fmt::format("{}/{}", basedir, k_metadata_fname)))
      throw std::runtime_error(
          fmt::format("frame-store '{}' already exists", basedir));

   if(!mkdir_p(basedir))
      throw std::runtime_error(
          fmt::format("failed to create directory '{}'", basedir));

   FrameStoreWriter o;
   auto& P     = *o.pimpl_;
   P.basedir   = string(basedir);
   P.format    = string(format);
   P.ext       = extension_of(format);
   P.shape     = imgshape;
   P.chunksize = chunksize;
   return o;
}

void FrameStoreWriter::add_image(const cv::Mat& im,
                                 const int frame_number,
                                 const real frame_time) noexcept(false)
{
   pimpl_->add_image(im, frame_number, frame_time);
}

void FrameStoreWriter::add_extra_data(const Json::Value& o) noexcept
{
   pimpl_->extra_data = o;
}

int FrameStoreWriter::frame_count() const noexcept { return pimpl_->n_frames; }

void FrameStoreWriter::close() noexcept(false) { pimpl_->close(); }

// ================================================================== FrameStore

struct FrameStore::Pimpl
{
   string directory;
   string metadata_fname;
   string format;
   string ext;
   ImageShape shape;
   int chunksize = 0;

   vector<int> frame_numbers;
   vector<real> frame_times;
   hashmap<int, int> index_of; // frame-number => index

   int next_index = 0;

   unique_ptr<cv::VideoCapture> video;
   int video_chunk = -1;
   int video_pos   = 0;

   void load_metadata() noexcept(false)
   {
      try {
         cv::FileStorage fs(metadata_fname, cv::FileStorage::READ);
         if(!fs.isOpened())
            throw VideoFormatError(
                fmt::format("failed to read '{}'", metadata_fname));

         vector<int> imgshape;
         int frame_count = -1;
         fs["format"] >> format;
         fs["extension"] >> ext;
         fs["imgshape"] >> imgshape;
         fs["chunksize"] >> chunksize;
         if(!fs["frame_count"].empty()) fs["frame_count"] >> frame_count;

         if(!is_valid_frame_store_format(format))
            throw VideoFormatError(fmt::format(
                "invalid frame-store format '{}' in {}", format, metadata_fname));
         if(imgshape.size() != 3 or chunksize <= 0)
            throw VideoFormatError(
                fmt::format("corrupt frame-store metadata in {}",
                            metadata_fname));
         if(ext.empty()) ext = extension_of(format);
         shape = ImageShape{imgshape[0], imgshape[1], imgshape[2]};

         load_index();
         if(frame_count >= 0 and frame_count != int(frame_numbers.size()))
            WARN(fmt::format("frame-store {} has {} frames, but metadata says {}",
                             directory,
                             frame_numbers.size(),
                             frame_count));
      } catch(cv::Exception& e) {
         throw VideoFormatError(fmt::format(
             "error reading frame-store '{}': {}", metadata_fname, e.what()));
      }
   }

   void load_index() noexcept(false)
   {
      for(int chunk = 0; is_regular_file(index_fname(directory, chunk));
          ++chunk) {
         cv::FileStorage fs(index_fname(directory, chunk),
                            cv::FileStorage::READ);
         vector<int> numbers;
         vector<real> times;
         fs["frame_number"] >> numbers;
         fs["frame_time"] >> times;
         if(times.size() != numbers.size()) times.resize(numbers.size(), 0.0);

         frame_numbers.insert(end(frame_numbers), cbegin(numbers), cend(numbers));
         frame_times.insert(end(frame_times), cbegin(times), cend(times));
      }

      for(auto&& [i, n] : views::enumerate(frame_numbers))
         index_of.emplace(n, int(i)); // first one wins
   }

   void close() noexcept
   {
      video.reset();
      video_chunk = -1;
   }

   cv::Mat read_video_frame(const int chunk, const int local) noexcept(false)
   {
      if(video_chunk != chunk) {
         close();
         const auto fname = video_fname(directory, chunk);
         video            = make_unique<cv::VideoCapture>(fname);
         if(!video->isOpened()) {
            video.reset();
            throw std::runtime_error(
                fmt::format("failed to open frame-store chunk '{}'", fname));
         }
         video_chunk = chunk;
         video_pos   = 0;
      }

      if(video_pos != local)
         video->set(cv::CAP_PROP_POS_FRAMES, double(local));

      video_pos = -1;
      cv::Mat im;
      if(!video->read(im) or im.empty())
         throw std::runtime_error(fmt::format(
             "failed to read frame {} of chunk {} in {}", local, chunk, directory));
      video_pos = local + 1;
      return im;
   }

   cv::Mat read_image(const int index) noexcept(false)
   {
      check_frame_index(index, int(frame_numbers.size()));
      const int chunk = index / chunksize;

      cv::Mat raw;
      if(is_video_format(format)) {
         raw = read_video_frame(chunk, index % chunksize);
      } else {
         const auto fname = image_fname(directory, chunk, index, ext);
         raw              = cv::imread(fname, cv::IMREAD_UNCHANGED);
         if(raw.empty())
            throw std::runtime_error(
                fmt::format("failed to read image '{}'", fname));
      }

      if(shape.channels == 1 and raw.channels() != 1) {
         cv::Mat gray;
         cv::extractChannel(raw, gray, 0);
         return gray;
      }
      return swap_red_blue(raw);
   }
};

FrameStore::FrameStore()
    : pimpl_(make_unique<Pimpl>())
{}

FrameStore::~FrameStore() = default;

FrameStore FrameStore::open(const string_view path) noexcept(false)
{
   const string p(path);
   const string meta
       = is_directory(p) ? fmt::format("{}/{}", p, k_metadata_fname) : p;
   if(!is_regular_file(meta))
      throw VideoNotFoundError(
          fmt::format("Could not find frame-store {}", path));

   FrameStore o;
   auto& P          = *o.pimpl_;
   P.metadata_fname = meta;
   P.directory      = dirname(meta);
   if(P.directory.empty()) P.directory = ".";
   P.load_metadata();
   return o;
}

const string& FrameStore::directory() const noexcept
{
   return pimpl_->directory;
}
const string& FrameStore::metadata_filename() const noexcept
{
   return pimpl_->metadata_fname;
}
const string& FrameStore::format() const noexcept { return pimpl_->format; }
int FrameStore::chunksize() const noexcept { return pimpl_->chunksize; }
int FrameStore::frame_count() const noexcept
{
   return int(pimpl_->frame_numbers.size());
}
ImageShape FrameStore::imgshape() const noexcept { return pimpl_->shape; }

const vector<int>& FrameStore::frame_numbers() const noexcept
{
   return pimpl_->frame_numbers;
}
const vector<real>& FrameStore::frame_times() const noexcept
{
   return pimpl_->frame_times;
}

bool FrameStore::has_frame_number(const int frame_number) const noexcept
{
   return pimpl_->index_of.count(frame_number) > 0;
}

cv::Mat FrameStore::get_image(const int frame_number) noexcept(false)
{
   const auto ii = pimpl_->index_of.find(frame_number);
   if(ii == cend(pimpl_->index_of))
      throw std::out_of_range(fmt::format(
          "frame number {} not in frame-store {}", frame_number, directory()));
   pimpl_->next_index = ii->second + 1;
   return pimpl_->read_image(ii->second);
}

cv::Mat FrameStore::get_image_by_index(const int index) noexcept(false)
{
   auto im            = pimpl_->read_image(index);
   pimpl_->next_index = index + 1;
   return im;
}

bool FrameStore::get_next_image(cv::Mat& im, int& frame_number) noexcept(false)
{
   const int index = pimpl_->next_index;
   if(index >= frame_count()) return false;
   im           = get_image_by_index(index);
   frame_number = pimpl_->frame_numbers[size_t(index)];
   return true;
}

Json::Value FrameStore::extra_data() const noexcept(false)
{
   const auto fname = fmt::format("{}/{}", directory(), k_extra_data_fname);
   if(!is_regular_file(fname)) return Json::Value{Json::nullValue};
   return parse_json(file_get_contents(fname));
}

bool FrameStore::is_open() const noexcept { return pimpl_->video != nullptr; }

void FrameStore::close() noexcept { pimpl_->close(); }

} // namespace fauna
