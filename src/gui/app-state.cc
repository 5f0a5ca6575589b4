#include "app-state.hh"

#define This AppState

using namespace fauna;

This::This()
    : QObject(nullptr)
{}

This::~This() = default;

struct AppStateManager
{
   std::mutex padlock_;
   unique_ptr<AppState> state_{make_unique<AppState>()};
   std::atomic<bool> is_disposed_{false};

   AppState* get() noexcept
   {
      if(is_disposed_) {
         // This is not a 100% fail-safe check
         FATAL(format("call to 'get' after dispose"));
      }
      return state_.get();
   }
   void dispose() noexcept
   {
      lock_guard<decltype(padlock_)> lock(padlock_);
      state_.reset();
      is_disposed_ = true;
   }
};

AppStateManager& app_state_manager()
{
   static AppStateManager manager;
   return manager;
}

void This::dispose_instance() { app_state_manager().dispose(); }
AppState* This::instance() noexcept { return app_state_manager().get(); }
AppState* app_state() noexcept { return AppState::instance(); }

// ------------------------------------------------------------------ initialize

bool This::initialize(AppConfig in_config) noexcept
{
   config_ = std::move(in_config);
   if(config_.video_fname.empty()) return true;

   VideoOptions opts;
   opts.dataset           = config_.dataset;
   opts.input_format      = config_.input_format;
   opts.index_by_original = false;
   try {
      open_video(config_.video_fname, opts);
   } catch(std::exception& e) {
      LOG_ERR(
          format("failed to open '{}': {}", config_.video_fname, e.what()));
      return false;
   }
   return true;
}

// ------------------------------------------------------------------ open-video

void This::open_video(const string_view filename,
                      const VideoOptions& opts) noexcept(false)
{
   auto video = make_unique<Video>(Video::from_filename(filename, opts));
   INFO(format("opened {} '{}', {}",
               str(video->kind()),
               video->filename(),
               str(*video)));

   if(video_) video_->close();
   video_    = std::move(video);
   frame_no_ = (video_->num_frames() > 0) ? 0 : -1;

   emit video_changed();
   emit frame_changed(frame_no_);
}

void This::close_video() noexcept
{
   if(!video_) return;
   video_->close();
   video_.reset();
   frame_no_ = -1;
   emit video_changed();
   emit frame_changed(frame_no_);
}

// ------------------------------------------------------------------ frame-no

int This::frame_no() const noexcept { return frame_no_; }

int This::n_frames() const noexcept
{
   return video_ ? video_->num_frames() : -1;
}

bool This::has_current_frame() const noexcept
{
   const auto fn = frame_no();
   return fn >= 0 && fn < n_frames();
}

void This::seek_frame(int frame_no) noexcept
{
   if(!has_video()) return;
   frame_no = std::clamp(frame_no, 0, std::max(0, n_frames() - 1));
   if(frame_no == frame_no_ or frame_no >= n_frames()) return;
   frame_no_ = frame_no;
   emit frame_changed(frame_no_);
}

// --------------------------------------------------------------- current-frame

cv::Mat This::current_frame() const noexcept(false)
{
   if(!has_current_frame()) return cv::Mat{};
   return video_->get_frame(frame_no_);
}
