
#include "config.hpp"

#include "stdinc.hpp"

#include "fauna/utils/file-system.hpp"

#include "json/json.h"

#include <stdlib.h>
#include <unistd.h>

#include <mutex>

#include <boost/lexical_cast.hpp>

namespace fauna
{
struct EnvironmentVariables
{
   bool is_init          = false;
   std::string cache_dir = ""s;
   bool trace_mode       = false;
   int default_chunksize = 1000;
   int random_seed       = -1;
   int log_level         = 0;
   bool no_colour        = false;
   Json::Value env_obj   = Json::Value{Json::nullValue};

   string make_config_info_str();
   void init_config(const Json::Value& o);
};

static EnvironmentVariables env_vars_;

static void init_instance(const Json::Value& o) noexcept
{
   env_vars_.init_config(o);
}

static EnvironmentVariables& instance()
{
   if(!env_vars_.is_init)
      FATAL(format("Must call 'load_environment_variables()' before attempting "
                   "to load any environmental variables"));
   return env_vars_;
}

// -------------------------------------------------------- make config info str
//
string EnvironmentVariables::make_config_info_str()
{
   auto make_build_str = []() {
      std::stringstream ss{""};
      bool needs_comma = false;
      auto push_ss     = [&](const string_view s) {
         if(needs_comma) ss << ", ";
         ss << s;
         needs_comma = true;
      };
      auto push_bool = [&](bool val, const string_view s) {
         if(val) push_ss(s);
      };
      push_bool(k_is_cli_build, "cli");
      push_bool(k_is_testcase_build, "testcases");
      push_bool(k_is_gui_build, "gui");
      push_bool(k_is_debug_build, "debug");
      push_bool(k_is_release_build, "release");
      return ss.str();
   };

   return format(R"V0G0N(
   k-fauna-version               = '{}'
   build-configuration           =  {}
   FAUNA_CACHE_DIR               = '{}'
   FAUNA_TRACE_MODE              =  {}
   FAUNA_DEFAULT_CHUNKSIZE       =  {}
   FAUNA_RANDOM_SEED             =  {}
   FAUNA_LOG_LEVEL               =  {}
   FAUNA_NO_COLOUR               =  {}
)V0G0N",
                 k_version,
                 make_build_str(),
                 cache_dir,
                 str(trace_mode),
                 default_chunksize,
                 random_seed,
                 log_level,
                 str(no_colour));
}

// -------------------------------------------------------------------- read-env
//
static Json::Value read_env()
{
   Json::Value o{Json::objectValue};

   auto get_w_default
       = [&o](const std::string_view name,
              const std::string_view default_value) -> std::string {
      const char* ss = getenv(name.data());
      const auto ret
          = (ss == nullptr) ? std::string(default_value) : std::string(ss);
      o[string(name)] = ret;
      return ret;
   };

   auto get_bool_w_default = [&](const std::string_view name) -> bool {
      const auto val  = get_w_default(name, "");
      const auto ret  = (val == std::string("1") or val == std::string("true"));
      o[string(name)] = ret;
      return ret;
   };

   auto get_int_w_default = [&](const std::string_view name, int def) -> int {
      const auto s = get_w_default(name, "");
      int ret      = def;
      if(s.size() > 0) {
         using boost::lexical_cast;
         using boost::bad_lexical_cast;
         try {
            ret = lexical_cast<int>(s);
         } catch(bad_lexical_cast&) {
            WARN(format("bad lexical cast reading environment variable {}='{}' "
                        "as an integer, using default value {}",
                        name,
                        s,
                        def));
            ret = def;
         }
      }
      o[string(name)] = ret;
      return ret;
   };

   get_w_default("FAUNA_CACHE_DIR", ""s);
   get_bool_w_default("FAUNA_TRACE_MODE");
   get_int_w_default("FAUNA_DEFAULT_CHUNKSIZE", 1000);
   get_int_w_default("FAUNA_RANDOM_SEED", -1);
   get_int_w_default("FAUNA_LOG_LEVEL", 0);
   get_bool_w_default("FAUNA_NO_COLOUR");

   return o;
}

const Json::Value& get_env_data()
{
   static std::mutex padlock_;
   static bool first_run_ = true;
   static Json::Value env_data_;
   {
      lock_guard<decltype(padlock_)> lock(padlock_);
      if(first_run_) {
         env_data_  = read_env();
         first_run_ = false;
      }
   }

   return env_data_;
}

// ----------------------------------------------------------------- init config
//
void EnvironmentVariables::init_config(const Json::Value& o)
{
   auto make_cache_dir = [&]() -> string {
      string dir = o["FAUNA_CACHE_DIR"].asString();
      if(dir.empty()) {
         const auto home_s     = getenv("HOME");
         const string home_dir = (home_s == nullptr) ? "" : home_s;
         dir = home_dir.empty() ? "/tmp/fauna-cache"s
                                : format("{}/.cache/fauna", home_dir);
      }
      if(!is_directory(dir) and !mkdir_p(dir))
         WARN(format("failed to find/create cache-dir `{}`", dir));
      return dir;
   };

   cache_dir         = make_cache_dir();
   trace_mode        = o["FAUNA_TRACE_MODE"].asBool();
   default_chunksize = o["FAUNA_DEFAULT_CHUNKSIZE"].asInt();
   random_seed       = o["FAUNA_RANDOM_SEED"].asInt();
   log_level         = o["FAUNA_LOG_LEVEL"].asInt();
   no_colour         = o["FAUNA_NO_COLOUR"].asBool();
   env_obj           = o;

   if(default_chunksize <= 0) {
      WARN(format("FAUNA_DEFAULT_CHUNKSIZE={} is not positive, using 1000",
                  default_chunksize));
      default_chunksize = 1000;
   }

   Logger::set_log_level(log_level);
   Logger::enable_colours(!no_colour);

   is_init = true;
}

// -------------------------------------------------- load environment variables
//

void load_environment_variables() noexcept { init_instance(get_env_data()); }

void set_environment_variables(const Json::Value o) noexcept
{
   init_instance(o);
}

// --------------------------------------------------------------------- getters
//
const std::string& fauna_cache_dir() noexcept { return instance().cache_dir; }

bool fauna_trace_mode() noexcept
{
   // The logger may ask before anything is loaded
   return env_vars_.is_init and env_vars_.trace_mode;
}

int fauna_default_chunksize() noexcept { return instance().default_chunksize; }

int fauna_random_seed() noexcept { return instance().random_seed; }

// ---------------------------------------------------------- configuration-info
//
string environment_info() noexcept { return instance().make_config_info_str(); }

std::string environment_json_str() noexcept
{
   std::stringstream ss{""};
   ss << instance().env_obj;
   return ss.str();
}

} // namespace fauna
