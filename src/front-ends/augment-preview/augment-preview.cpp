#include "augment-preview-inc.hpp"
#include "stdinc.hpp"

#include "fauna/augment/augmenter.hpp"
#include "fauna/augment/confmaps.hpp"
#include "fauna/io/json-io.hpp"
#include "fauna/utils/cli-utils.hpp"
#include "fauna/utils/file-system.hpp"
#include "fauna/video/video.hpp"

#include <opencv2/imgcodecs/imgcodecs.hpp>
#include <opencv2/imgproc/imgproc.hpp>

namespace fauna::augment_preview
{
// ----------------------------------------------------------------------- brief

string brief() noexcept
{
   return "Augment frames of a video, and save the first batch as pngs";
}

// ---------------------------------------------------------------------- config
//
struct Config
{
   bool has_error      = false;
   bool show_help      = false;
   string video_fname  = ""s;
   string outdir       = "/tmp/fauna-augment"s;
   string params_fname = ""s;
   string points_fname = ""s;
   int n_frames        = 16;
   real sigma          = 0.0; // confidence maps when positive
   VideoOptions opts;
};

// ------------------------------------------------------------------- show help
//
void show_help(const string_view argv0)
{
   Config default_config;

   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...] -i <filename>

      -i <filename>       Input video.
      -o <directory>      Output directory. Default is '{:s}'.
      -d <dataset>        HDF5 dataset, when the input is an HDF5 video.
      -n <number>         Number of frames to augment. Default is {}.
      -p <json-file>      Augmenter parameters. If the file does not
                          exist, then the defaults are written to it.
      --points <json>     Keypoints, frames -> instances -> [x, y], drawn
                          on the augmented images.
      --sigma <number>    Also save confidence maps of the keypoints.

{:s})V0G0N",
                  basename(argv0),
                  default_config.outdir,
                  default_config.n_frames,
                  str(Augmenter::Params{}));
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
         if(arg == "-i"s) {
            config.video_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-o"s) {
            config.outdir = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-d"s) {
            config.opts.dataset = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-n"s) {
            config.n_frames = cli::safe_arg_int(argc, argv, i);
         } else if(arg == "-p"s) {
            config.params_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--points"s) {
            config.points_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--sigma"s) {
            config.sigma = cli::safe_arg_real(argc, argv, i);
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

   if(config.n_frames <= 0) {
      LOG_ERR(format("expected a positive number of frames, got {}",
                     config.n_frames));
      config.has_error = true;
   }

   if(!config.points_fname.empty() and !is_regular_file(config.points_fname)) {
      LOG_ERR(format("failed to find file: '{:s}'", config.points_fname));
      config.has_error = true;
   }

   if(config.sigma > 0.0 and config.points_fname.empty()) {
      LOG_ERR(format("--sigma needs --points"));
      config.has_error = true;
   }

   return config;
}

// ----------------------------------------------------------------- draw points

static cv::Mat draw_points(const cv::Mat& im, const FramePoints& frame)
{
   cv::Mat out;
   if(im.channels() == 1)
      cv::cvtColor(im, out, cv::COLOR_GRAY2BGR);
   else
      cv::cvtColor(im, out, cv::COLOR_RGB2BGR);

   for(const auto& instance : frame)
      for(const auto& X : instance)
         if(std::isfinite(X.x) and std::isfinite(X.y))
            cv::circle(out, X, 3, cv::Scalar(0, 255, 255), -1, cv::LINE_AA);
   return out;
}

// Maximum over the node channels, scaled to [0..255]
static cv::Mat confmap_to_image(const cv::Mat& confmap)
{
   vector<cv::Mat> planes;
   cv::split(confmap, planes);
   cv::Mat max_im = cv::Mat::zeros(confmap.rows, confmap.cols, CV_32F);
   for(const auto& plane : planes) cv::max(max_im, plane, max_im);
   cv::Mat out;
   max_im.convertTo(out, CV_8U, 255.0);
   return out;
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

   // Augmenter parameters
   Augmenter::Params params;
   if(!config.params_fname.empty()) {
      if(is_regular_file(config.params_fname)) {
         try { // load
            params.read(parse_json(file_get_contents(config.params_fname)));
         } catch(std::runtime_error& e) {
            LOG_ERR(format("failed to load parameters from '{:s}': {:s}",
                           config.params_fname,
                           e.what()));
            return EXIT_FAILURE;
         }
      } else {
         std::stringstream ss{""};
         ss << params.to_json() << endl;
         if(file_put_contents(config.params_fname, ss.str())) {
            LOG_ERR(format("failed to save parameters to '{:s}'",
                           config.params_fname));
            return EXIT_FAILURE;
         }
      }
   }
   INFO(format("augmenting with {}", str(params)));

   try {
      const auto video = Video::from_filename(config.video_fname, config.opts);
      auto indices     = video.frame_indices();
      if(int(indices.size()) > config.n_frames)
         indices.resize(size_t(config.n_frames));

      AugmenterData data;
      data.X = video.get_frames(indices);
      if(!config.points_fname.empty()) {
         data.points = points_from_json(
             parse_json(file_get_contents(config.points_fname)));
         if(data.points.size() > data.X.size())
            data.points.resize(data.X.size());
      }

      vector<FramePoints> points_in_batch;
      if(config.sigma > 0.0) {
         int n_nodes = 0;
         for(const auto& frame : data.points)
            for(const auto& instance : frame)
               n_nodes = std::max(n_nodes, int(instance.size()));
         const auto confmaps_gen = make_confmaps_datagen(
             n_nodes, video.height(), video.width(), config.sigma);
         // Keep the augmented points for drawing as well
         data.datagen = [&points_in_batch,
                         confmaps_gen](const vector<FramePoints>& points) {
            points_in_batch = points;
            return confmaps_gen(points);
         };
      }

      Augmenter augmenter(std::move(data), params);
      const auto batch = augmenter.get_batch(0);

      if(!is_directory(config.outdir) and !mkdir_p(config.outdir))
         throw std::runtime_error(
             format("failed to create directory '{}'", config.outdir));

      const auto ii           = batch.Y.find(""s);
      const AugmentedOutput Y = (ii != cend(batch.Y)) ? ii->second
                                                      : AugmentedOutput{};
      const auto& b_points
          = Y.points.size() > 0 ? Y.points : points_in_batch;

      for(size_t i = 0; i < batch.X.size(); ++i) {
         const auto n     = batch.indices[i];
         const auto frame = (i < b_points.size()) ? b_points[i] : FramePoints{};
         const auto fname = path_join(config.outdir, format("{:06d}.png", n));
         if(!cv::imwrite(fname, draw_points(batch.X[i], frame)))
            throw std::runtime_error(format("failed to write '{}'", fname));

         if(i < Y.images.size()) {
            const auto cname
                = path_join(config.outdir, format("{:06d}-confmap.png", n));
            if(!cv::imwrite(cname, confmap_to_image(Y.images[i])))
               throw std::runtime_error(format("failed to write '{}'", cname));
         }
      }

      INFO(format("wrote {} augmented frames to '{}'",
                  batch.X.size(),
                  config.outdir));
   } catch(std::exception& e) {
      LOG_ERR(format("{}", e.what()));
      return EXIT_FAILURE;
   }

   return EXIT_SUCCESS;
}

} // namespace fauna::augment_preview
