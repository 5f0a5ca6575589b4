#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>

#include "fauna/foundation.hpp"
#include "fauna/utils/file-system.hpp"

#include "augment-preview/augment-preview-inc.hpp"
#include "images-to-frame-store/images-to-frame-store-inc.hpp"
#include "to-frame-store/to-frame-store-inc.hpp"
#include "video-info/video-info-inc.hpp"

using namespace fauna;
using namespace std::string_literals;

// ------------------------------------------------------------------------ Runs

static auto make_runs()
{
   std::unordered_map<std::string, std::function<int(int, char**)>> r;
   std::unordered_map<std::string, std::function<std::string()>> b;

#define REGISTER(z)                 \
   {                                \
      r[#z] = fauna::z ::run_main;  \
      b[#z] = fauna::z ::brief;     \
   }

   // -- register -- "main" functions
   REGISTER(video_info);
   REGISTER(to_frame_store);
   REGISTER(images_to_frame_store);
   REGISTER(augment_preview);

#undef REGISTER

   return make_pair(r, b);
}

// ------------------------------------------------------------------- show-help

static void show_help(const char* arg0)
{
   auto [runs, briefs] = make_runs();

   std::vector<std::string> names;
   for(const auto& ii : runs) names.push_back(ii.first);
   std::sort(names.begin(), names.end());

   auto f = [&](const string& s) {
      auto ii        = briefs.find(s);
      std::string bb = ""s;
      if(ii == cend(briefs)) {
         WARN(format("failed to find brief of '{:s}'", s));
      } else {
         bb = ii->second();
      }
      const int sz = 25 - int(s.size());
      std::string spaces(size_t(std::max(1, sz)), ' ');

      return format("{:s}{:s}    {:s}", s, spaces, bb);
   };

   cout << format(R"V0G0N(

   Usage: {:s} [-h] <run> [options...]

      Run can be one of:

      {:s}

   Type '{:s} <run> -h' for help on a run.

)V0G0N",
                  basename(arg0),
                  implode(names.begin(), names.end(), "\n      ", f),
                  basename(arg0));
}

// ------------------------------------------------------------------------ main

int main(int argc, char** argv)
{
   int ret = 0;
   {
      if(argc < 2) {
         cout << "Type -h for help" << endl;
         return EXIT_FAILURE;
      }

      const std::string arg = argv[1];
      if(arg == "--help"s || arg == "-h") {
         show_help(argv[0]);
         return EXIT_SUCCESS;
      }

      auto [runs, briefs] = make_runs();

      if(runs.find(arg) == runs.end()) {
         WARN(format("Failed to find run '{:s}'", arg));
         return EXIT_FAILURE;
      }

      // Init environment variables
      load_environment_variables();

      // Now "shift" argv[0] to argv[1]
      ret = runs.find(arg)->second(argc - 1, &argv[1]);
   }

   return ret;
}
