#include "stdinc.hpp"

#include "frame-viewer.hh"

#include "gui/app-state.hh"
#include "gui/qt-helpers.hpp"
#include "gui/widgets/image-viewer.hh"

#define This FrameViewer

using namespace fauna;

// ----------------------------------------------------------------------- pimpl

struct This::Pimpl
{
   FrameViewer* parent{nullptr};

   QLabel* info_label{nullptr};
   ImageViewer* image_viewer{nullptr};
   shared_ptr<QImage> qim_ptr{nullptr};

   Pimpl(FrameViewer* in_parent)
       : parent(in_parent)
   {
      qim_ptr = make_shared<QImage>();
   }

   void make_ui() noexcept;

   void set_info_label()
   {
      const auto video = app_state()->video();
      info_label->setText(
          video == nullptr
              ? "no video"
              : to_qstr(format("{}  {}  '{}'",
                               str(video->kind()),
                               str(video->shape()),
                               video->filename())));
   }
};

// --------------------------------------------------------------------- make ui

void This::Pimpl::make_ui() noexcept
{
   info_label = new QLabel{};

   image_viewer = new ImageViewer{};
   image_viewer->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
   image_viewer->setStyleSheet("background-color: black;");

   QVBoxLayout* layout = new QVBoxLayout{};
   layout->addWidget(info_label);
   layout->addWidget(image_viewer);
   parent->setLayout(layout);

   set_info_label();

   // ---- (*) ---- Wiring
   connect(app_state(),
           SIGNAL(video_changed()),
           parent,
           SLOT(on_video_changed()));

   connect(app_state(), SIGNAL(frame_changed(int)), parent, SLOT(on_redraw()));
}

// ---------------------------------------------------------------- Construction

This::This(QWidget* parent)
    : QWidget(parent)
    , pimpl_(make_unique<Pimpl>(this))
{
   pimpl_->make_ui();
}

This::~This() = default;

ImageViewer* This::get_image_viewer() noexcept { return pimpl_->image_viewer; }

// ------------------------------------------------------------ on video changed

void This::on_video_changed()
{
   pimpl_->set_info_label();
   pimpl_->image_viewer->reset_offset_zoom();
   on_redraw();
}

// ------------------------------------------------------------------- on redraw

void This::on_redraw()
{
   auto& P = *pimpl_;

   if(!app_state()->has_current_frame()) {
      P.image_viewer->set_qimage(nullptr);
      return;
   }

   try {
      const cv::Mat im = app_state()->current_frame();
      to_qimage(im, *P.qim_ptr);
      P.image_viewer->set_qimage(P.qim_ptr);
   } catch(std::exception& e) {
      LOG_ERR(format("failed to read frame {}: {}",
                     app_state()->frame_no(),
                     e.what()));
      P.image_viewer->set_qimage(nullptr);
   }
}
