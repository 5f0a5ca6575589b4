#include "cmd-line.hpp"

#include "fauna/utils/cli-utils.hpp"
#include "fauna/utils/file-system.hpp"

namespace fauna::gui
{
// ------------------------------------------------------------------- to-string

string AppConfig::to_string() const noexcept
{
   return format(R"V0G0N(
AppConfig
   video:          '{}'
   dataset:        '{}'
   input-format:   '{}'
)V0G0N",
                 video_fname,
                 dataset,
                 input_format);
}

// ------------------------------------------------------------------- show-help

void show_help(string argv0)
{
   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...] [video-filename]

      -d <dataset>        HDF5 dataset, when opening an HDF5 video.
      --channels-first    HDF5 data is stored (frames, channels, width, height).

   Environment variables:

      FAUNA_CACHE_DIR, FAUNA_TRACE_MODE

)V0G0N",
                  basename(argv0));
}

// ---------------------------------------------------------- parse-command-line

AppConfig parse_command_line(int argc, char** argv) noexcept
{
   AppConfig config;

   for(int i = 1; i < argc; ++i) {
      const string_view arg = argv[i];
      if(arg == "-h" || arg == "--help") config.show_help = true;
   }
   if(config.show_help) return config;

   for(int i = 1; i < argc; ++i) {
      const string_view arg = argv[i];
      try {
         if(arg == "-d"s) {
            config.dataset = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--channels-first"s) {
            config.input_format = "channels_first"s;
         } else if(!arg.empty() and arg[0] != '-'
                   and config.video_fname.empty()) {
            config.video_fname = string(arg);
         } else {
            LOG_ERR(format("unknown command line argument: '{:s}'", arg));
            config.has_error = true;
         }
      } catch(std::runtime_error& e) {
         LOG_ERR(format("Error on command-line: {:s}", e.what()));
         config.has_error = true;
      }
   }

   return config;
}

} // namespace fauna::gui
