
#include "npy-io.hpp"

#include "fauna/utils/file-system.hpp"
#include "fauna/video/video-error.hpp"

#include <cnpy.h>

namespace fauna
{
// ------------------------------------------------------------------ NumpyArray
//
size_t NumpyArray::n_elements() const noexcept
{
   return std::accumulate(
       cbegin(shape), cend(shape), size_t(1), std::multiplies<size_t>());
}

bool NumpyArray::operator==(const NumpyArray& o) const noexcept
{
   return shape == o.shape and dtype == o.dtype and bytes == o.bytes;
}

bool NumpyArray::operator!=(const NumpyArray& o) const noexcept
{
   return !(*this == o);
}

void NumpyArray::check_invariant() const noexcept(false)
{
   if(bytes.size() != n_elements() * dtype_size(dtype))
      throw VideoFormatError(format("array data is {} bytes, but shape and "
                                    "dtype require {}",
                                    bytes.size(),
                                    n_elements() * dtype_size(dtype)));
}

// ------------------------------------------------------------------ read-descr
// cnpy does not report the element kind, so read 'descr' from the header
static DType read_npy_dtype(const string& filename) noexcept(false)
{
   std::ifstream fs(filename, std::ios::binary);
   string header(1024, '\0');
   fs.read(&header[0], std::streamsize(header.size()));
   header.resize(size_t(fs.gcount()));

   if(!begins_with(header, string_view("\x93NUMPY", 6)))
      throw VideoFormatError(format("{} is not a .npy file", filename));

   const auto key = header.find("'descr'");
   const auto q0  = (key == string::npos) ? key : header.find('\'', key + 7);
   const auto q1  = (q0 == string::npos) ? q0 : header.find('\'', q0 + 1);
   if(q1 == string::npos)
      throw VideoFormatError(
          format("failed to read 'descr' from header of {}", filename));

   const string descr = header.substr(q0 + 1, q1 - q0 - 1);
   if(descr.size() < 3 or descr[0] == '>')
      throw VideoFormatError(
          format("unsupported .npy element type '{}' in {}", descr, filename));

   const auto kind = descr.substr(1);
   if(kind == "u1") return DType::UINT8;
   if(kind == "u2") return DType::UINT16;
   if(kind == "i4") return DType::INT32;
   if(kind == "i8") return DType::INT64;
   if(kind == "f4") return DType::FLOAT32;
   if(kind == "f8") return DType::FLOAT64;
   throw VideoFormatError(
       format("unsupported .npy element type '{}' in {}", descr, filename));
}

// -------------------------------------------------------------------- load-npy
//
NumpyArray load_npy(const string_view filename) noexcept(false)
{
   const string fname(filename);
   if(!is_regular_file(fname))
      throw VideoNotFoundError(format("Could not find numpy file {}", fname));

   const auto dtype = read_npy_dtype(fname);

   cnpy::NpyArray raw = cnpy::npy_load(fname);
   if(raw.fortran_order)
      throw VideoFormatError(
          format("fortran ordered arrays are not supported: {}", fname));
   if(raw.word_size != dtype_size(dtype))
      throw VideoFormatError(format("word size {} disagrees with dtype {}",
                                    raw.word_size,
                                    str(dtype)));

   NumpyArray a;
   a.shape = raw.shape;
   a.dtype = dtype;
   a.bytes.resize(raw.num_bytes());
   const char* src = raw.data<char>();
   std::copy(src, src + raw.num_bytes(), begin(a.bytes));
   return a;
}

// -------------------------------------------------------------------- save-npy
//
template<typename T>
static void save_npyT(const string& fname, const NumpyArray& a)
{
   cnpy::npy_save(
       fname, reinterpret_cast<const T*>(a.bytes.data()), a.shape, "w");
}

void save_npy(const string_view filename, const NumpyArray& a) noexcept(false)
{
   a.check_invariant();
   const string fname(filename);
   switch(a.dtype) {
   case DType::UINT8: save_npyT<uint8_t>(fname, a); break;
   case DType::UINT16: save_npyT<uint16_t>(fname, a); break;
   case DType::INT32: save_npyT<int32_t>(fname, a); break;
   case DType::INT64: save_npyT<int64_t>(fname, a); break;
   case DType::FLOAT32: save_npyT<float>(fname, a); break;
   case DType::FLOAT64: save_npyT<double>(fname, a); break;
   }
}

// ------------------------------------------------------------- frames-to-numpy
//
NumpyArray frames_to_numpy(const vector<cv::Mat>& frames) noexcept(false)
{
   NumpyArray a;
   a.dtype = DType::UINT8;
   if(frames.empty()) {
      a.shape = {0, 0, 0, 0};
      return a;
   }

   const auto& f0 = frames.front();
   a.shape        = {frames.size(),
              size_t(f0.rows),
              size_t(f0.cols),
              size_t(f0.channels())};
   const size_t frame_sz = a.shape[1] * a.shape[2] * a.shape[3];
   a.bytes.resize(frames.size() * frame_sz);

   for(size_t i = 0; i < frames.size(); ++i) {
      const auto& im = frames[i];
      if(im.depth() != CV_8U or im.rows != f0.rows or im.cols != f0.cols
         or im.channels() != f0.channels())
         throw std::runtime_error(
             format("frame {} does not have the shape of frame 0", i));
      const cv::Mat c = im.isContinuous() ? im : im.clone();
      std::copy(c.data, c.data + frame_sz, begin(a.bytes) + long(i * frame_sz));
   }
   return a;
}

} // namespace fauna
