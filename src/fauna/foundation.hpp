#pragma once

#include "config.hpp"

// ------------------------------------------------------------- Likely/unlikely

#if defined(__clang__) || defined(__GNUC__)
#define branch_is_likely(x) __builtin_expect(!!(x), 1)
#else
#define branch_is_likely(x) (!!(x))
#endif

// -------------------------------------------------------------- C/C++ Includes

#define _FILE_OFFSET_BITS 64

#ifndef __cplusplus
#error "this is a c++ only include"
#endif

// C includes
#include <cmath>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
// C++ includes
#include <algorithm>
#include <array>
#include <cstddef>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <numeric>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <unordered_map>

// ------------------------------------------------------------------ Beyond std

#include "fmt/format.h"
#include "range/v3/all.hpp"

// --------------------------------------------------------------- Fauna headers

#include "utils/logger.hpp"

namespace views   = ranges::views;

namespace fauna
{
using fmt::format;

using std::array;
using std::string;
using std::string_view;
using std::vector;

using std::cout;
using std::endl;

using std::cbegin;
using std::cend;

using std::lock_guard;

using namespace std::string_literals;

using real = double;

// -------------------------------------------------------------------- Aliasing

// Internal invariants only, FATAL on failure.
#ifdef Expects
#undef Expects
#endif
#define Expects(cond)                                                \
   {                                                                 \
      if(!branch_is_likely(cond))                                    \
         FATAL(::fauna::format("precondition failed: {}", #cond));  \
   }

using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::unique_ptr;

template<class Key, class T> using hashmap = std::unordered_map<Key, T>;

} // namespace fauna
