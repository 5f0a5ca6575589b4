#pragma once

#include <memory>

#include <QImage>
#include <QWidget>

class ImageViewer;

// Shows the app-state's current frame, with a one line info panel
class FrameViewer final : public QWidget
{
   Q_OBJECT

 private:
   struct Pimpl;
   std::unique_ptr<Pimpl> pimpl_;

 public:
   FrameViewer(QWidget* parent = nullptr);
   FrameViewer(const FrameViewer&) = delete;
   FrameViewer(FrameViewer&&)      = delete;
   virtual ~FrameViewer();

   FrameViewer& operator=(const FrameViewer&) = delete;
   FrameViewer& operator=(FrameViewer&&) = delete;

   ImageViewer* get_image_viewer() noexcept;

 public slots:
   void on_redraw(); //!< Force a redraw
   void on_video_changed();
};
