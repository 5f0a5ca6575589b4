#pragma once

#include "fauna/foundation.hpp"

namespace fauna::cli
{
// Each throws std::runtime_error when argv[i + 1] is missing or malformed

inline string safe_arg_str(int argc, char** argv, int& i) noexcept(false)
{
   auto arg = argv[i];
   ++i;
   if(i >= argc)
      throw std::runtime_error(
          format("expected string after argument '{}'", arg));
   return string(argv[i]);
}

inline int safe_arg_int(int argc, char** argv, int& i) noexcept(false)
{
   auto arg = argv[i];
   ++i;
   auto badness = (i >= argc);
   auto ret     = 0;

   if(!badness) {
      char* end = nullptr;
      ret       = int(strtol(argv[i], &end, 10));
      if(*end != '\0') badness = true;
   }

   if(badness)
      throw std::runtime_error(
          format("expected integer after argument '{}'", arg));

   return ret;
}

inline real safe_arg_real(int argc, char** argv, int& i) noexcept(false)
{
   auto arg = argv[i];
   ++i;
   auto badness = (i >= argc);
   auto ret     = 0.0;

   if(!badness) {
      char* end = nullptr;
      ret       = strtod(argv[i], &end);
      if(*end != '\0') badness = true;
   }

   if(badness)
      throw std::runtime_error(
          format("expected numeric after argument '{}'", arg));

   return ret;
}

} // namespace fauna::cli
