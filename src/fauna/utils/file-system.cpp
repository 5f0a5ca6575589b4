
#include "file-system.hpp"

#include "fauna/foundation.hpp"

#include <filesystem>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fauna
{
namespace fs = std::filesystem;

bool is_regular_file(const std::string_view filename) noexcept
{
   std::error_code ec;
   return fs::is_regular_file(fs::path(filename), ec);
}

bool is_directory(const std::string_view filename) noexcept
{
   std::error_code ec;
   return fs::is_directory(fs::path(filename), ec);
}

// ----------------------------------------------------------- file-get-contents
//
template<typename T>
static error_code file_get_contentsT(const std::string_view fname,
                                     T& data) noexcept
{
   const string path(fname);
   std::unique_ptr<FILE, std::function<void(FILE*)>> fp(
       fopen(path.c_str(), "rb"), [](FILE* ptr) {
          if(ptr) fclose(ptr);
       });

   if(fp == nullptr) return std::make_error_code(std::errc(errno));

   if(fseek(fp.get(), 0, SEEK_END) == -1)
      return std::make_error_code(std::errc(errno));

   auto fpos = ftell(fp.get());
   if(fpos == -1) return std::make_error_code(std::errc(errno));

   auto sz = size_t(fpos < 0 ? 0 : fpos);

   try {
      data.resize(sz);
   } catch(std::length_error&) {
      return std::make_error_code(std::errc::invalid_argument);
   } catch(std::bad_alloc&) {
      return std::make_error_code(std::errc::not_enough_memory);
   }

   if(fseek(fp.get(), 0, SEEK_SET) == -1)
      return std::make_error_code(std::errc(errno));

   if(sz > 0 and data.size() != fread(&data[0], 1, data.size(), fp.get())) {
      if(ferror(fp.get())) return std::make_error_code(std::errc(errno));
      return std::make_error_code(std::errc::io_error);
   }

   if(FILE* ptr = fp.release(); fclose(ptr) != 0)
      return std::make_error_code(std::errc(errno));

   return {};
}

error_code file_get_contents(const std::string_view filename,
                             std::string& out) noexcept
{
   return file_get_contentsT(filename, out);
}

error_code file_get_contents(const std::string_view filename,
                             std::vector<char>& out) noexcept
{
   return file_get_contentsT(filename, out);
}

std::string file_get_contents(const std::string_view fname) noexcept(false)
{
   std::string out;
   const auto ec = file_get_contents(fname, out);
   if(ec)
      throw std::runtime_error(
          format("failed to read '{}': {}", fname, ec.message()));
   return out;
}

// ----------------------------------------------------------- file-put-contents

error_code file_put_contents(const std::string_view filename,
                             const std::string_view dat) noexcept
{
   const string path(filename);
   FILE* fp = fopen(path.c_str(), "wb");
   if(fp == nullptr) return std::make_error_code(std::errc(errno));

   error_code ec = {};

   auto sz = fwrite(dat.data(), 1, dat.size(), fp);
   if(sz != dat.size()) {
      if(ferror(fp))
         ec = std::make_error_code(std::errc(errno));
      else
         ec = std::make_error_code(std::errc::io_error);
   }
   if(fclose(fp) != 0)
      if(!ec) ec = make_error_code(std::errc(errno));

   return ec;
}

// --------------------------------------------------- basename/dirname/file_ext

std::string absolute_path(const std::string_view filename) noexcept
{
   std::error_code ec;
   auto p = fs::absolute(fs::path(filename), ec);
   return ec ? string(filename) : p.lexically_normal().string();
}

std::string basename(const std::string_view filename,
                     const bool strip_extension) noexcept
{
   const auto p = fs::path(filename);
   return strip_extension ? p.stem().string() : p.filename().string();
}

std::string dirname(const std::string_view filename) noexcept
{
   return fs::path(filename).parent_path().string();
}

std::string file_ext(const std::string_view filename) noexcept
{
   return fs::path(filename).extension().string();
}

std::string extensionless(const std::string_view filename) noexcept
{
   const auto ext = file_ext(filename);
   return string(filename.data(), filename.size() - ext.size());
}

std::string path_join(const std::string_view a,
                      const std::string_view b) noexcept
{
   return (fs::path(a) / fs::path(b)).string();
}

// ----------------------------------------------------------------------- mkdir
// Like `mkdir -p`, true if the directory exists afterwards
bool mkdir_p(const std::string_view dname) noexcept
{
   std::error_code ec;
   fs::create_directories(fs::path(dname), ec);
   return !ec and is_directory(dname);
}

// --------------------------------------------------------- make-temp-directory

std::string make_temp_directory(const string_view p) noexcept(false)
{
   string s(p);
   size_t n_Xs = 0;
   while(n_Xs < s.size() and s[s.size() - n_Xs - 1] == 'X') ++n_Xs;
   if(n_Xs < 6) s.append(6 - n_Xs, 'X');

   std::vector<char> buf(cbegin(s), cend(s));
   buf.push_back('\0');
   if(mkdtemp(&buf[0]) == nullptr)
      throw std::runtime_error(
          format("failed to create temporary directory '{}'", s));
   return string{&buf[0]};
}

// -------------------------------------------------------------- list-directory

vector<string> list_directory(const string_view dname) noexcept(false)
{
   vector<string> out;
   std::error_code ec;
   for(auto it = fs::directory_iterator(fs::path(dname), ec);
       !ec and it != fs::directory_iterator();
       it.increment(ec))
      if(it->is_regular_file()) out.push_back(it->path().string());

   if(ec)
      throw std::runtime_error(
          format("failed to list directory '{}': {}", dname, ec.message()));

   std::sort(begin(out), end(out));
   return out;
}

// ------------------------------------------------------------------ remove-all

std::error_code delete_file(const string_view path)
{
   std::error_code ec;
   fs::remove(fs::path(path), ec);
   return ec;
}

int remove_all(const string_view path) noexcept(false)
{
   std::error_code ec;
   int val = int(fs::remove_all(fs::path(path), ec));
   if(ec)
      throw std::runtime_error(format(
          "failed to remove directory '{}': {}", path, ec.message()));
   return val;
}

} // namespace fauna
