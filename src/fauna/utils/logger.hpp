#pragma once

#include "fmt/format.h"
#include "string-utils.hpp"

#include <cstdlib>
#include <iostream>

// Levels: 0 debug, 1 info, 2 warn, 3 error, 4 fatal, 5 trace
#ifdef DEBUG_BUILD
#define DLOG(m) ::fauna::Logger::report(0, __FILE__, __LINE__, ::fauna::str(m))
#else
#define DLOG(m)
#endif

#define INFO(m)                                \
   if(::fauna::Logger::log_level() <= 1)       \
   ::fauna::Logger::report(1, __FILE__, __LINE__, ::fauna::str(m))
#define WARN(m)                                \
   if(::fauna::Logger::log_level() <= 2)       \
   ::fauna::Logger::report(2, __FILE__, __LINE__, ::fauna::str(m))
#define LOG_ERR(m)                             \
   if(::fauna::Logger::log_level() <= 3)       \
   ::fauna::Logger::report(3, __FILE__, __LINE__, ::fauna::str(m))
#define FATAL(m) ::fauna::Logger::report(4, __FILE__, __LINE__, ::fauna::str(m))
#define TRACE(m)                               \
   if(::fauna::fauna_trace_mode())             \
   ::fauna::Logger::report(5, __FILE__, __LINE__, ::fauna::str(m))

namespace fauna
{
bool fauna_trace_mode() noexcept;

/**
 * Process-wide logger. Warnings, errors and fatals go to `cerr`, everything
 * else to `cout`. A FATAL report exits the process with status 1.
 *
 * The level and colours are set from FAUNA_LOG_LEVEL and FAUNA_NO_COLOUR
 * when `load_environment_variables()` runs.
 */
class Logger
{
 private:
   bool colours_  = true;
   int log_level_ = 0;

   static Logger& instance()
   {
      static Logger instance_;
      return instance_;
   }

   static const char* level_name(int level) noexcept
   {
      switch(level) {
      case 0: return "DEBUG";
      case 1: return "INFO ";
      case 2: return "WARN ";
      case 3: return "ERROR";
      case 4: return "FATAL";
      case 5: return "TRACE";
      }
      return "?    ";
   }

   static const char* level_colour(int level) noexcept
   {
      switch(level) {
      case 0: return ANSI_COLOUR_CYAN;
      case 1: return ANSI_COLOUR_BLUE;
      case 2: return ANSI_COLOUR_YELLOW;
      case 3:
      case 4: return ANSI_COLOUR_RED;
      case 5: return ANSI_COLOUR_GREEN;
      }
      return ANSI_COLOUR_RESET;
   }

 public:
   static void
   report(int level, const char* file, int lineno, const string& msg)
   {
      std::ostream& out = (level >= 2 and level <= 4) ? std::cerr : std::cout;
      sync_write([&]() {
         if(colours_enabled())
            out << level_colour(level) << level_name(level) << ANSI_COLOUR_RESET
                << " " << ANSI_COLOUR_GREY << file << ":" << lineno
                << ANSI_COLOUR_RESET << " " << msg << "\n";
         else
            out << level_name(level) << " " << file << ":" << lineno << " "
                << msg << "\n";
      });
      if(level == 4) std::exit(1);
   }

   static int log_level() noexcept { return instance().log_level_; }

   // FATAL is always reported, so levels above 3 are rejected
   static void set_log_level(int level)
   {
      if(level >= 0 and level <= 3)
         instance().log_level_ = level;
      else
         report(2,
                __FILE__,
                __LINE__,
                fmt::format("invalid log level {}, expected [0..3]", level));
   }

   static bool colours_enabled() noexcept { return instance().colours_; }
   static void enable_colours(bool value) noexcept
   {
      instance().colours_ = value;
   }
};

} // namespace fauna
