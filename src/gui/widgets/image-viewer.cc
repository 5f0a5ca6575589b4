#include "stdinc.hpp"

#include "image-viewer.hh"

#include <QMouseEvent>
#include <QPaintEvent>
#include <QPainter>
#include <QTimer>
#include <QWheelEvent>

#define This ImageViewer

using namespace fauna;

struct This::Pimpl
{
 public:
   ImageViewer& parent;
   shared_ptr<const QImage> qim{nullptr};

   double zoom{1.0}; // 1.0 is 100%

   bool mouse_is_panning{false};
   QPointF mouse_down_pos{0.0, 0.0};
   QPointF offset{0.0, 0.0};

   QTimer* timer{nullptr};

   Pimpl(ImageViewer& parent_)
       : parent(parent_)
       , timer(new QTimer{&parent})
   {
      connect(
          timer, SIGNAL(timeout()), &parent, SLOT(on_process_clear_image()));
   }

   void start_pan(const QPointF& pos)
   {
      mouse_down_pos   = pos - offset;
      mouse_is_panning = true;
   }

   void stop_pan()
   {
      mouse_is_panning = false;
      parent.update();
   }
};

static bool no_modifiers(const QInputEvent* event) noexcept
{
   return (event->modifiers()
           & (Qt::ShiftModifier | Qt::ControlModifier | Qt::AltModifier
              | Qt::MetaModifier))
          == 0;
}

This::This(QWidget* parent)
    : QWidget(parent)
    , pimpl_(make_unique<Pimpl>(*this))
{}

This::~This() = default;

// --------------------------------------------------------------------- Getters

double This::zoom() const { return pimpl_->zoom; }

QPointF This::offset() const { return pimpl_->offset; }

void This::set_offset(const QPointF& pos)
{
   pimpl_->offset = pos;
   update();
}

QPointF This::mouse_to_qim(const QPointF& pos) const
{
   return (pos - pimpl_->offset) / pimpl_->zoom;
}

QPointF This::qim_to_mouse(const QPointF& qim_pos) const
{
   return pimpl_->zoom * qim_pos + pimpl_->offset;
}

shared_ptr<const QImage> This::qimage() const noexcept { return pimpl_->qim; }

// ------------------------------------------------------------------ set-qimage

void This::set_qimage(const shared_ptr<const QImage> qim,
                      const unsigned clear_image_delay_ms)
{
   if(qim == nullptr and clear_image_delay_ms > 0) {
      pimpl_->timer->setSingleShot(true);
      pimpl_->timer->setInterval(int(clear_image_delay_ms));
      pimpl_->timer->start();
   } else {
      pimpl_->timer->stop();
      pimpl_->qim = qim;
      update();
   }
}

// ----------------------------------------------------------- reset offset/zoom

void This::reset_offset_zoom()
{
   auto& P  = *pimpl_;
   P.zoom   = 1.0;
   P.offset = QPointF(0.0, 0.0);
   update();
}

// ----------------------------------------------------------------------- mouse

void This::mousePressEvent(QMouseEvent* event)
{
   auto& P = *pimpl_;
   if(P.qim == nullptr) return; // nothing to do

   const bool is_left_btn = event->buttons() & Qt::LeftButton;
   if(is_left_btn && no_modifiers(event) && is_pannable)
      P.start_pan(event->pos());
}

void This::mouseMoveEvent(QMouseEvent* event)
{
   auto& P = *pimpl_;
   if(!P.mouse_is_panning) return;

   if(!no_modifiers(event))
      P.stop_pan();
   else
      P.offset = QPointF(event->pos()) - P.mouse_down_pos;

   update();
}

void This::mouseReleaseEvent(QMouseEvent*)
{
   auto& P = *pimpl_;
   if(P.mouse_is_panning) P.stop_pan();
}

// ----------------------------------------------------------------------- wheel

void This::wheelEvent(QWheelEvent* event)
{
   auto& P = *pimpl_;

   if(!is_zoomable) return;

   P.stop_pan();

   const QPointF pos     = event->posF();
   const double delta    = event->angleDelta().y();
   const double scale    = 0.05 / 120.0;
   const double min_zoom = 0.1;
   const double max_zoom = 10.0;

   const double old_zoom = P.zoom;
   const QPointF old_pos = mouse_to_qim(pos);

   P.zoom = std::clamp(P.zoom * (1.0 + delta * scale), min_zoom, max_zoom);

   // Change offset such that 'mouse-to-qim' gives 'old-pos'
   if(old_zoom != P.zoom) {
      P.offset = pos - P.zoom * old_pos;
      update();
   }
}

// ----------------------------------------------------------------- paint-event

void This::paintEvent(QPaintEvent* event)
{
   auto& P = *pimpl_;
   shared_ptr<const QImage> qim{P.qim};
   if(qim == nullptr) return; // nothing to paint!

   QPainter painter(this);
   QRectF target_rect(P.offset.x(),
                      P.offset.y(),
                      std::ceil(qim->width() * P.zoom),
                      std::ceil(qim->height() * P.zoom));
   painter.drawImage(target_rect, *qim, qim->rect());

   if(post_paint_func) post_paint_func(event, painter);

   painter.end();
}

// ------------------------------------------------------ on-process-clear-image

void This::on_process_clear_image() noexcept { set_qimage(nullptr, 0); }
