#include "video-info-inc.hpp"
#include "stdinc.hpp"

#include "fauna/io/json-io.hpp"
#include "fauna/utils/cli-utils.hpp"
#include "fauna/utils/file-system.hpp"
#include "fauna/video/video-io.hpp"

namespace fauna::video_info
{
// ----------------------------------------------------------------------- brief

string brief() noexcept
{
   return "Print the shape, backend and JSON of a video";
}

// ---------------------------------------------------------------------- config
//
struct Config
{
   bool has_error     = false;
   bool show_help     = false;
   bool print_frames  = false;
   string video_fname = ""s;
   VideoOptions opts;
};

// ------------------------------------------------------------------- show help
//
void show_help(const string_view argv0)
{
   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...] <filename>

      -d <dataset>        HDF5 dataset.
      --channels-first    HDF5 data is stored (frames, channels, width, height).
      --no-convert-range  Do not scale [0..1] floating point data to [0..255].
      --grayscale         Media video is grayscale (default is to detect).
      --by-index          Frame-store frames are indexed 0..n-1.
      --frames            Print each frame's mean intensity.

)V0G0N",
                  basename(argv0));
}

// ------------------------------------------------------------------ parse-args

Config parse_args(int argc, char** argv)
{
   Config config;

   for(int i = 1; i < argc; ++i) {
      const string_view arg = argv[i];
      if(arg == "-h" || arg == "--help") config.show_help = true;
   }
   if(config.show_help) return config;

   for(int i = 1; i < argc; ++i) {
      const string_view arg = argv[i];
      try {
         if(arg == "-d"s) {
            config.opts.dataset = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--channels-first"s) {
            config.opts.input_format = "channels_first"s;
         } else if(arg == "--no-convert-range"s) {
            config.opts.convert_range = false;
         } else if(arg == "--grayscale"s) {
            config.opts.grayscale = true;
         } else if(arg == "--by-index"s) {
            config.opts.index_by_original = false;
         } else if(arg == "--frames"s) {
            config.print_frames = true;
         } else if(config.video_fname.empty() and !begins_with(arg, "-"s)) {
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

   if(config.video_fname.empty()) {
      LOG_ERR(format("must specify a video filename"));
      config.has_error = true;
   }

   return config;
}

// -------------------------------------------------------------------- run-main

int run_main(int argc, char** argv)
{
   const Config config = parse_args(argc, argv);

   if(config.show_help) {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(config.has_error) {
      cout << "aborting" << endl;
      return EXIT_FAILURE;
   }

   try {
      const auto video = Video::from_filename(config.video_fname, config.opts);

      cout << format(R"V0G0N(
{}
   backend:   {}
   filename:  '{}'
   dtype:     {}
)V0G0N",
                     str(video),
                     str(video.kind()),
                     video.filename(),
                     str(video.dtype()));

      if(video.is_serializable())
         cout << video_to_json(video) << endl;

      if(config.print_frames) {
         for(const auto n : video.frame_indices()) {
            const auto mean = cv::mean(video.get_frame(n));
            cout << format("   frame {:6d}  mean = {:.3f}", n, mean[0]) << endl;
         }
      }
   } catch(std::exception& e) {
      LOG_ERR(format("{}", e.what()));
      return EXIT_FAILURE;
   }

   return EXIT_SUCCESS;
}

} // namespace fauna::video_info
