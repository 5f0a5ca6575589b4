
#include "hdf5-video.hpp"

#include "video-error.hpp"

#include "fauna/utils/file-system.hpp"

#include <H5Cpp.h>

#include <opencv2/core/core.hpp>

#define This HDF5Video

namespace fauna
{
// --------------------------------------------------------------------- helpers
//
static DType dtype_of(const H5::DataSet& ds) noexcept(false)
{
   const auto cls = ds.getTypeClass();
   if(cls == H5T_FLOAT) {
      const auto sz = ds.getFloatType().getSize();
      if(sz == 4) return DType::FLOAT32;
      if(sz == 8) return DType::FLOAT64;
   } else if(cls == H5T_INTEGER) {
      const auto int_type  = ds.getIntType();
      const auto sz        = int_type.getSize();
      const bool is_signed = int_type.getSign() != H5T_SGN_NONE;
      if(!is_signed and sz == 1) return DType::UINT8;
      if(!is_signed and sz == 2) return DType::UINT16;
      if(is_signed and sz == 4) return DType::INT32;
      if(is_signed and sz == 8) return DType::INT64;
   }
   throw VideoFormatError("unsupported HDF5 dataset element type");
}

static const H5::PredType& mem_type_of(DType x) noexcept
{
   switch(x) {
   case DType::UINT8: return H5::PredType::NATIVE_UINT8;
   case DType::UINT16: return H5::PredType::NATIVE_UINT16;
   case DType::INT32: return H5::PredType::NATIVE_INT32;
   case DType::INT64: return H5::PredType::NATIVE_DOUBLE; // held as CV_64F
   case DType::FLOAT32: return H5::PredType::NATIVE_FLOAT;
   case DType::FLOAT64: return H5::PredType::NATIVE_DOUBLE;
   }
   return H5::PredType::NATIVE_UINT8;
}

// ----------------------------------------------------------------------- Pimpl
//
struct This::Pimpl
{
   string filename;
   string dataset;
   string input_format;
   bool convert_range = true;

   unique_ptr<H5::H5File> file;
   unique_ptr<H5::DataSet> ds;

   DType dtype     = DType::UINT8;
   int rank        = 0;
   hsize_t dims[4] = {0, 0, 0, 0}; // as stored on disk

   bool channels_first() const noexcept
   {
      return rank == 4 and input_format == "channels_first";
   }

   int frames() const noexcept { return int(dims[0]); }
   int height() const noexcept
   {
      return int(channels_first() ? dims[3] : dims[1]);
   }
   int width() const noexcept { return int(dims[2]); }
   int channels() const noexcept
   {
      return (rank == 3) ? 1 : int(channels_first() ? dims[1] : dims[3]);
   }

   void open() noexcept(false)
   {
      if(file) return;

      if(!is_regular_file(filename))
         throw VideoNotFoundError(
             format("Could not find HDF5 file {}", filename));

      try {
         file = make_unique<H5::H5File>(filename, H5F_ACC_RDONLY);
      } catch(H5::Exception& e) {
         throw VideoNotFoundError(format(
             "Could not open HDF5 file {}: {}", filename, e.getDetailMsg()));
      }

      try {
         ds = make_unique<H5::DataSet>(file->openDataSet(dataset));
      } catch(H5::Exception& e) {
         file.reset();
         throw VideoFormatError(format("failed to find dataset '{}' in {}: {}",
                                       dataset,
                                       filename,
                                       e.getDetailMsg()));
      }

      const auto space = ds->getSpace();
      rank             = space.getSimpleExtentNdims();
      if(rank != 3 and rank != 4) {
         close();
         throw VideoFormatError(format("dataset '{}' has rank {}, expected 4",
                                       dataset,
                                       rank));
      }
      space.getSimpleExtentDims(dims);
      if(rank == 3) dims[3] = 1;
      dtype = dtype_of(*ds);
   }

   void close() noexcept
   {
      ds.reset();
      file.reset();
   }

   cv::Mat read_frame(const int idx) noexcept(false)
   {
      open();
      check_frame_index(idx, frames());

      const int d1 = int(dims[1]), d2 = int(dims[2]), d3 = int(dims[3]);
      const auto& mem_type = mem_type_of(dtype);
      const int depth      = cv_depth(dtype);

      auto read_hyperslab = [&](void* dst) {
         hsize_t offset[4] = {hsize_t(idx), 0, 0, 0};
         hsize_t count[4]  = {1, dims[1], dims[2], dims[3]};
         auto file_space   = ds->getSpace();
         file_space.selectHyperslab(H5S_SELECT_SET, count, offset);
         H5::DataSpace mem_space(rank, count);
         ds->read(dst, mem_type, mem_space, file_space);
      };

      if(!channels_first()) {
         cv::Mat im(d1, d2, CV_MAKETYPE(depth, d3));
         read_hyperslab(im.data);
         return im;
      }

      // (channels, width, height) => (height, width, channels)
      cv::Mat raw(d1 * d2, d3, CV_MAKETYPE(depth, 1));
      read_hyperslab(raw.data);
      vector<cv::Mat> planes(size_t(d1));
      for(int c = 0; c < d1; ++c)
         cv::transpose(raw.rowRange(c * d2, (c + 1) * d2), planes[size_t(c)]);
      cv::Mat im;
      cv::merge(planes, im);
      return im;
   }
};

// ---------------------------------------------------------------- Construction
//
This::This(const string_view filename,
           const string_view dataset,
           const string_view input_format,
           const bool convert_range) noexcept(false)
    : pimpl_(make_unique<Pimpl>())
{
   if(input_format != "channels_last" and input_format != "channels_first")
      throw VideoFormatError(
          format("HDF5Video input_format must be 'channels_last' or "
                 "'channels_first', got '{}'",
                 input_format));

   pimpl_->filename      = string(filename);
   pimpl_->dataset       = string(dataset);
   pimpl_->input_format  = string(input_format);
   pimpl_->convert_range = convert_range;

   H5::Exception::dontPrint();
   pimpl_->open();

   INFO(format("opened HDF5 video {}:{}, [{} x {} x {} x {}] {}",
               filename,
               dataset,
               frames(),
               height(),
               width(),
               channels(),
               str(dtype())));
}

This::~This() = default;

// --------------------------------------------------------------------- getters
//
const string& This::filename() const noexcept { return pimpl_->filename; }
const string& This::dataset() const noexcept { return pimpl_->dataset; }
const string& This::input_format() const noexcept
{
   return pimpl_->input_format;
}
bool This::convert_range() const noexcept { return pimpl_->convert_range; }

int This::frames() const noexcept { return pimpl_->frames(); }
int This::height() const noexcept { return pimpl_->height(); }
int This::width() const noexcept { return pimpl_->width(); }
int This::channels() const noexcept { return pimpl_->channels(); }
DType This::dtype() const noexcept { return pimpl_->dtype; }

// ------------------------------------------------------------------- get-frame
//
Frame This::get_frame(const int idx) noexcept(false)
{
   try {
      return normalise_frame(pimpl_->read_frame(idx), pimpl_->convert_range);
   } catch(H5::Exception& e) {
      throw std::runtime_error(format("error reading frame {} of {}:{}: {}",
                                      idx,
                                      pimpl_->filename,
                                      pimpl_->dataset,
                                      e.getDetailMsg()));
   }
}

// --------------------------------------------------------------------- matches
//
bool This::matches(const VideoBackend& o) const noexcept
{
   const auto ptr = dynamic_cast<const This*>(&o);
   return ptr != nullptr and filename() == ptr->filename()
          and dataset() == ptr->dataset()
          and convert_range() == ptr->convert_range()
          and input_format() == ptr->input_format();
}

// --------------------------------------------------------------------- to-json
//
Json::Value This::to_json() const noexcept(false)
{
   Json::Value o{Json::objectValue};
   o["filename"]      = filename();
   o["dataset"]       = dataset();
   o["input_format"]  = input_format();
   o["convert_range"] = convert_range();
   return o;
}

void This::close() noexcept { pimpl_->close(); }

} // namespace fauna
