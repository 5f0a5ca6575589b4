
#pragma once

#include <string>

namespace Json
{
class Value;
}

namespace fauna
{
#ifdef TESTCASE_BUILD
constexpr bool k_is_testcase_build = true;
#else
constexpr bool k_is_testcase_build = false;
#endif

#ifdef GUI_BUILD
constexpr bool k_is_gui_build = true;
static_assert(!k_is_testcase_build, "cannot build gui and testcases together");
#else
constexpr bool k_is_gui_build = false;
#endif

constexpr bool k_is_cli_build = !k_is_gui_build and !k_is_testcase_build;

#ifdef DEBUG_BUILD
constexpr bool k_is_debug_build = true;
#else
constexpr bool k_is_debug_build = false;
#endif

#ifdef RELEASE_BUILD
constexpr bool k_is_release_build = true;
#else
constexpr bool k_is_release_build = false;
#endif

constexpr const char* k_version = FAUNA_VERSION;

// Must be called before any of the functions below
void load_environment_variables() noexcept;

// NOT thread safe
void set_environment_variables(const Json::Value o) noexcept;

const std::string& fauna_cache_dir() noexcept;

bool fauna_trace_mode() noexcept;
int fauna_default_chunksize() noexcept;
int fauna_random_seed() noexcept; // -1 means "seed from std::random_device"

std::string environment_info() noexcept;
std::string environment_json_str() noexcept;

} // namespace fauna
