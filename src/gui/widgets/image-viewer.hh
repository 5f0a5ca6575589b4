#pragma once

#include <functional>
#include <memory>

#include <QImage>
#include <QPointF>
#include <QWidget>

class ImageViewer final : public QWidget
{
   Q_OBJECT

 private:
   struct Pimpl;
   std::unique_ptr<Pimpl> pimpl_;

 public:
   ImageViewer(QWidget* parent = nullptr);
   ImageViewer(const ImageViewer&) = delete;
   ImageViewer(ImageViewer&&)      = delete;
   virtual ~ImageViewer();

   ImageViewer& operator=(const ImageViewer&) = delete;
   ImageViewer& operator=(ImageViewer&&) = delete;

   // Sets the image. Clears the image if 'nullptr' is passed.
   // A non-zero @clear_image_delay_ms delays the clear, so that
   // a subsequent call with a non-null image does not flicker.
   void set_qimage(const std::shared_ptr<const QImage> qim,
                   const unsigned clear_image_delay_ms = 200);
   std::shared_ptr<const QImage> qimage() const noexcept;

   // Reset offset and zoom
   void reset_offset_zoom();
   double zoom() const;    // current zoom
   QPointF offset() const; // current drag offset
   void set_offset(const QPointF& pos);

   // converts a widget mouse pos into 'qim' image co-ordinates
   QPointF mouse_to_qim(const QPointF& pos) const;
   QPointF qim_to_mouse(const QPointF& qim_pos) const;

   // If true, then can click and drag the image around
   bool is_pannable{true};
   bool is_zoomable{true};

   // Called after the image is painted, eg, to overlay keypoints
   std::function<void(QPaintEvent* event, QPainter& painter)> post_paint_func;

 protected:
   virtual void paintEvent(QPaintEvent* event);
   virtual void mouseMoveEvent(QMouseEvent* event);
   virtual void mousePressEvent(QMouseEvent* event);
   virtual void mouseReleaseEvent(QMouseEvent* event);
   virtual void wheelEvent(QWheelEvent* event);

 private slots:
   void on_process_clear_image() noexcept;
};
