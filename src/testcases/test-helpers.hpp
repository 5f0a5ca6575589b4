#pragma once

#include "stdinc.hpp"

#include "fauna/utils/file-system.hpp"

#include <filesystem>

#include <opencv2/core/core.hpp>

namespace fauna::testing
{
// A fresh directory under /tmp, removed with everything in it on destruction
struct TestDir
{
   string path;

   TestDir()
       : path(make_temp_directory("/tmp/fauna-XXXXXX"))
   {}
   TestDir(const TestDir&) = delete;
   TestDir& operator=(const TestDir&) = delete;
   ~TestDir()
   {
      std::error_code ec;
      std::filesystem::remove_all(path, ec);
      if(ec) WARN(format("failed to remove '{}': {}", path, ec.message()));
   }

   string operator()(const string_view fname) const
   {
      return path_join(path, fname);
   }
};

// Changes the working directory, restoring it on destruction
struct ScopedChdir
{
   std::filesystem::path old_path;

   explicit ScopedChdir(const string_view dir)
       : old_path(std::filesystem::current_path())
   {
      std::filesystem::current_path(std::filesystem::path(string(dir)));
   }
   ScopedChdir(const ScopedChdir&) = delete;
   ScopedChdir& operator=(const ScopedChdir&) = delete;
   ~ScopedChdir()
   {
      std::error_code ec;
      std::filesystem::current_path(old_path, ec);
      if(ec) WARN(format("failed to restore cwd: {}", ec.message()));
   }
};

// A CV_8UC(channels) frame, with pixel (y, x, c) = (n + y + 2x + 3c) % 256
inline cv::Mat make_test_frame(int n, int h, int w, int channels)
{
   cv::Mat im(h, w, CV_8UC(channels));
   for(auto y = 0; y < h; ++y) {
      uint8_t* row = im.ptr<uint8_t>(y);
      for(auto x = 0; x < w; ++x)
         for(auto c = 0; c < channels; ++c)
            *row++ = uint8_t((n + y + 2 * x + 3 * c) % 256);
   }
   return im;
}

inline bool is_same_image(const cv::Mat& a, const cv::Mat& b)
{
   if(a.size() != b.size() or a.type() != b.type()) return false;
   return cv::norm(a, b, cv::NORM_INF) == 0.0;
}

} // namespace fauna::testing
