
#include "fixup-path.hpp"

#include "video-error.hpp"

#include "fauna/utils/file-system.hpp"

namespace fauna
{
static bool path_exists(const string_view path) noexcept
{
   return is_regular_file(path) or is_directory(path);
}

string fixup_path(const string_view path,
                  const bool raise_warning) noexcept(false)
{
   if(path_exists(path)) return string(path);

   const auto fname = basename(path);
   if(!fname.empty() and path_exists(fname)) {
      if(raise_warning)
         WARN(format("cannot find video '{}', using '{}' from the current "
                     "directory",
                     path,
                     fname));
      return fname;
   }

   if(ends_with(path, string_view("metadata.yaml"))) {
      const auto dir = basename(dirname(path));
      if(!dir.empty() and is_directory(dir)) {
         if(raise_warning)
            WARN(format("cannot find frame-store '{}', using '{}' from the "
                        "current directory",
                        path,
                        dir));
         return dir;
      }
   }

   throw VideoNotFoundError(format("Cannot find a video file: {}", path));
}

} // namespace fauna
