
#pragma once

#include <stdexcept>
#include <string>

namespace fauna
{
// A video file (or frame-store directory) could not be located
struct VideoNotFoundError : public std::runtime_error
{
   explicit VideoNotFoundError(const std::string& msg)
       : std::runtime_error(msg)
   {}
};

// Bad enumerated option, unsupported layout, or undetectable backend
struct VideoFormatError : public std::runtime_error
{
   explicit VideoFormatError(const std::string& msg)
       : std::runtime_error(msg)
   {}
};

} // namespace fauna
