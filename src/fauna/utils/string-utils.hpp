#pragma once

#include <algorithm>
#include <cfloat>
#include <charconv>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

#include "fmt/format.h"

namespace fauna
{
using std::string;
using std::string_view;

// -- Terminal Colours

#define ANSI_COLOUR_RED "\x1b[31m"
#define ANSI_COLOUR_GREEN "\x1b[32m"
#define ANSI_COLOUR_YELLOW "\x1b[33m"
#define ANSI_COLOUR_BLUE "\x1b[34m"
#define ANSI_COLOUR_CYAN "\x1b[36m"
#define ANSI_COLOUR_GREY "\x1b[37m"

#define ANSI_COLOUR_RESET "\x1b[0m"

// ---------------------------------------------------------------- lexical-cast
//
template<typename I>
requires std::is_arithmetic_v<I> std::error_code
lexical_cast(std::string_view s, I& value, int base = 10) noexcept
{
   if constexpr(std::is_integral<I>::value) {
      const auto [ptr, ec] = std::from_chars(begin(s), end(s), value, base);
      if(ec == std::errc() and ptr != end(s))
         return std::make_error_code(std::errc::invalid_argument);
      return std::make_error_code(ec);
   } else {
      const auto [ptr, ec] = std::from_chars(begin(s), end(s), value);
      if(ec == std::errc() and ptr != end(s))
         return std::make_error_code(std::errc::invalid_argument);
      return std::make_error_code(ec);
   }
}

// -------------------------------------------------------------------- str shim
// `str(x)` is what the logging macros call on their argument.

inline string& str(string& s) { return s; }
inline const string& str(const string& s) { return s; }
inline string str(string_view s) { return string(s.data(), s.size()); }
inline string str(const char* p) { return string(p); }
inline string str(bool v) { return v ? "true" : "false"; }
inline string str(char c) { return string(1, c); }

template<typename T>
requires std::is_integral_v<T> string str(T v)
{
   return fmt::format("{}", v);
}

template<typename T>
requires std::is_floating_point_v<T> string str(T v)
{
   return fmt::format("{:f}", v);
}

// ----------------------------------------------------------------- str replace

std::string str_replace(const std::string_view search,
                        const std::string_view replace,
                        const std::string_view subject) noexcept;

// --------------------------------------------------------------------- Implode

template<typename InputIt, typename F>
string implode(InputIt first, InputIt last, const std::string_view glue, F f)
{
   std::stringstream stream("");
   bool start = true;
   while(first != last) {
      if(start)
         start = false;
      else
         stream << glue;
      stream << str(f(*first++));
   }
   return stream.str();
}

template<typename InputIt>
string implode(InputIt first, InputIt last, const std::string_view glue)
{
   auto f = [](const auto& v) -> std::string { return str(v); };
   return implode(first, last, glue, f);
}

std::vector<std::string> explode(const std::string_view line,
                                 const std::string_view delims,
                                 const bool collapse_empty_fields
                                 = false) noexcept(false); // std::bad_alloc

// ----------------------------------------------------------------- Begins with

template<class U, class V>
constexpr bool begins_with(const U& input, const V& match)
{
   return input.size() >= match.size()
          and std::equal(cbegin(match), cend(match), begin(input));
}

template<class U, class V>
constexpr bool ends_with(const U& input, const V& match)
{
   return input.size() >= match.size()
          and std::equal(crbegin(match), crend(match), rbegin(input));
}

// ------------------------------------------------------------------------ Trim

inline void ltrim(std::string& s)
{
   s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) {
              return !std::isspace(ch);
           }));
}

// trim from end (in place)
inline void rtrim(std::string& s)
{
   s.erase(std::find_if(
               s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); })
               .base(),
           s.end());
}

// trim from both ends (in place)
inline void trim(std::string& s)
{
   ltrim(s);
   rtrim(s);
}

inline string trim_copy(const std::string& s)
{
   auto ret = s;
   trim(ret);
   return ret;
}

// --------------------------------------------------------- synchronized output

inline void sync_write(std::function<void()> thunk)
{
   static std::mutex padlock;
   std::lock_guard<decltype(padlock)> lock(padlock);
   thunk();
}

// ------------------------------------------------------------------ lowercase

string string_to_lowercase(const std::string_view s) noexcept;

} // namespace fauna
