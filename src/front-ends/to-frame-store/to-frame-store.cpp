#include "stdinc.hpp"
#include "to-frame-store-inc.hpp"

#include "fauna/utils/cli-utils.hpp"
#include "fauna/utils/file-system.hpp"
#include "fauna/video/frame-store.hpp"
#include "fauna/video/video.hpp"

namespace fauna::to_frame_store
{
// ----------------------------------------------------------------------- brief

string brief() noexcept { return "Convert a video into a frame store"; }

// ---------------------------------------------------------------------- config
//
struct Config
{
   bool has_error         = false;
   bool show_help         = false;
   bool allow_overwrite   = false;
   string video_fname     = ""s;
   string output_dir      = ""s;
   string store_format    = ""s; // default depends on the frames
   vector<int> frames     = {};  // all frames when empty
   bool index_by_original = true;
   VideoOptions opts;
};

// ------------------------------------------------------------------- show help
//
void show_help(const string_view argv0)
{
   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...] -i <filename> -o <directory>

      -i <filename>       Input video.
      -o <directory>      Output frame-store directory.
      -y                  Allow overwrite.
      -d <dataset>        HDF5 dataset, when the input is an HDF5 video.
      --channels-first    HDF5 data is stored (frames, channels, width, height).
      -f <format>         One of png, jpg, bmp, mjpeg/avi. Default is
                          'mjpeg/avi' for all frames, otherwise 'png'.
      --frames <list>     Comma separated frame numbers. Default is all.
      --by-index          Open the output indexed 0..n-1.

)V0G0N",
                  basename(argv0));
}

// ------------------------------------------------------------------ parse-args

static vector<int> parse_frame_list(const string_view s) noexcept(false)
{
   vector<int> ret;
   for(const auto& token : explode(s, ",", true)) {
      int val = 0;
      if(lexical_cast(trim_copy(token), val))
         throw std::runtime_error(format("bad frame number '{}'", token));
      ret.push_back(val);
   }
   return ret;
}

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
         if(arg == "-i"s) {
            config.video_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-o"s) {
            config.output_dir = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-y"s) {
            config.allow_overwrite = true;
         } else if(arg == "-d"s) {
            config.opts.dataset = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--channels-first"s) {
            config.opts.input_format = "channels_first"s;
         } else if(arg == "-f"s) {
            config.store_format = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--frames"s) {
            config.frames = parse_frame_list(cli::safe_arg_str(argc, argv, i));
         } else if(arg == "--by-index"s) {
            config.index_by_original = false;
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
      LOG_ERR(format("must specify an input video"));
      config.has_error = true;
   }

   if(config.output_dir.empty()) {
      LOG_ERR(format("must specify an output directory"));
      config.has_error = true;
   } else if(!config.allow_overwrite and is_directory(config.output_dir)) {
      LOG_ERR(format("cowardly refusing to overwrite output directory '{:s}'",
                     config.output_dir));
      config.has_error = true;
   }

   if(!config.store_format.empty()
      and !is_valid_frame_store_format(config.store_format)) {
      LOG_ERR(format("invalid frame-store format '{:s}'", config.store_format));
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
      INFO(format("loaded {}", str(video)));

      const auto out = video.to_frame_store(config.output_dir,
                                            config.frames,
                                            config.store_format,
                                            config.index_by_original);
      INFO(format("wrote {} to '{}'", str(out), config.output_dir));
   } catch(std::exception& e) {
      LOG_ERR(format("{}", e.what()));
      return EXIT_FAILURE;
   }

   return EXIT_SUCCESS;
}

} // namespace fauna::to_frame_store
