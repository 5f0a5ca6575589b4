#pragma once

#include <atomic>
#include <mutex>

#include <QObject>

#include "cmd-line.hpp"

#include "fauna/video/video.hpp"

class MainWindow;

/// A singleton that contains the global gui state.
/// QObject so that it can participate in signals and slots.
class AppState final : public QObject
{
   Q_OBJECT

 public:
   using AppConfig    = fauna::gui::AppConfig;
   using Video        = fauna::Video;
   using VideoOptions = fauna::VideoOptions;

 private:
   AppConfig config_; //!< The command line..
   MainWindow* main_window_{nullptr};

   std::unique_ptr<Video> video_{nullptr};
   int frame_no_{-1};

 public:
   AppState();
   AppState(const AppState&) = delete;
   AppState(AppState&&)      = delete;
   virtual ~AppState();
   AppState& operator=(const AppState&) = delete;
   AppState& operator=(AppState&&) = delete;

   static AppState* instance() noexcept; //!< Singleton
   static void dispose_instance();       //!< Deletes the singlton instance.
   bool initialize(AppConfig config) noexcept;

   const AppConfig& config() const noexcept { return config_; }

   void set_main_window(MainWindow* main_window) noexcept
   {
      main_window_ = main_window;
   }

   // nullptr if no video is open
   const Video* video() const noexcept { return video_.get(); }
   bool has_video() const noexcept { return video_ != nullptr; }

   // Throws VideoNotFoundError or VideoFormatError, leaving the
   // current video in place
   void open_video(const std::string_view filename,
                   const VideoOptions& opts) noexcept(false);
   void close_video() noexcept;

   int frame_no() const noexcept; // Frame number, -1 if none.
   int n_frames() const noexcept; // -1 if no video
   bool has_current_frame() const noexcept;

   // Empty if there's no current frame
   cv::Mat current_frame() const noexcept(false);

 signals:
   void video_changed();
   void frame_changed(int);

 public slots:
   void seek_frame(int frame_no) noexcept;
};

AppState* app_state() noexcept;
