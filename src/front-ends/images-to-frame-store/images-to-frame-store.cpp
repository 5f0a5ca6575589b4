#include "images-to-frame-store-inc.hpp"
#include "stdinc.hpp"

#include "fauna/utils/cli-utils.hpp"
#include "fauna/utils/file-system.hpp"
#include "fauna/video/video.hpp"

namespace fauna::images_to_frame_store
{
// ----------------------------------------------------------------------- brief

string brief() noexcept { return "Build a png frame store from image files"; }

// ---------------------------------------------------------------------- config
//
struct Config
{
   bool has_error       = false;
   bool show_help       = false;
   bool allow_overwrite = false;
   string output_dir    = ""s;
   string input_dir     = ""s;
   vector<string> filenames;
};

// ------------------------------------------------------------------- show help
//
void show_help(const string_view argv0)
{
   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...] -o <directory> [images...]

      -o <directory>      Output frame-store directory.
      -y                  Allow overwrite.
      -d <directory>      Add every image file in <directory>, sorted.

   Images are stored in the order given, as frames 0..n-1.

)V0G0N",
                  basename(argv0));
}

// ------------------------------------------------------------------ parse-args

static bool is_image_file(const string_view fname) noexcept
{
   const auto ext = string_to_lowercase(file_ext(fname));
   return ext == ".png" or ext == ".jpg" or ext == ".jpeg" or ext == ".bmp"
          or ext == ".tif" or ext == ".tiff";
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
         if(arg == "-o"s) {
            config.output_dir = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-y"s) {
            config.allow_overwrite = true;
         } else if(arg == "-d"s) {
            config.input_dir = cli::safe_arg_str(argc, argv, i);
         } else if(!begins_with(arg, "-"s)) {
            config.filenames.emplace_back(arg);
         } else {
            LOG_ERR(format("unknown command line argument: '{:s}'", arg));
            config.has_error = true;
         }
      } catch(std::runtime_error& e) {
         LOG_ERR(format("Error on command-line: {:s}", e.what()));
         config.has_error = true;
      }
   }

   if(!config.input_dir.empty()) {
      try {
         const auto fnames = list_directory(config.input_dir);
         for(const auto& fname : fnames | views::filter(is_image_file))
            config.filenames.push_back(fname);
      } catch(std::runtime_error& e) {
         LOG_ERR(format("failed to read directory '{:s}': {:s}",
                        config.input_dir,
                        e.what()));
         config.has_error = true;
      }
   }

   if(config.filenames.empty()) {
      LOG_ERR(format("no input images"));
      config.has_error = true;
   }

   for(const auto& fname : config.filenames) {
      if(!is_regular_file(fname)) {
         LOG_ERR(format("failed to find file: '{:s}'", fname));
         config.has_error = true;
      }
   }

   if(config.output_dir.empty()) {
      LOG_ERR(format("must specify an output directory"));
      config.has_error = true;
   } else if(!config.allow_overwrite and is_directory(config.output_dir)) {
      LOG_ERR(format("cowardly refusing to overwrite output directory '{:s}'",
                     config.output_dir));
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
      if(is_directory(config.output_dir)) remove_all(config.output_dir);
      const auto video = Video::frame_store_from_filenames(config.filenames,
                                                           config.output_dir);
      INFO(format("wrote {} to '{}'", str(video), config.output_dir));
   } catch(std::exception& e) {
      LOG_ERR(format("{}", e.what()));
      return EXIT_FAILURE;
   }

   return EXIT_SUCCESS;
}

} // namespace fauna::images_to_frame_store
