
#pragma once

#include "fauna/foundation.hpp"

namespace fauna
{
/**
 * Finds a video file that may have moved along with the current directory.
 * In order:
 *
 *    1. `path`, if it exists;
 *    2. `basename(path)`, if it exists in the current directory;
 *    3. for a frame-store `.../<dir>/metadata.yaml`, the directory `<dir>`,
 *       if it exists in the current directory.
 *
 * Otherwise throws VideoNotFoundError.
 */
string fixup_path(const string_view path,
                  const bool raise_warning = false) noexcept(false);

} // namespace fauna
