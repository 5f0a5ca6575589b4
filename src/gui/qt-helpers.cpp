#include "qt-helpers.hpp"

#include <QCheckBox>
#include <QMessageBox>

namespace fauna
{
// ------------------------------------------------------------------- to-qimage

void to_qimage(const cv::Mat& im, QImage& qim) noexcept(false)
{
   const auto cols = im.cols;
   const auto rows = im.rows;

   if(qim.size() != QSize(cols, rows))
      qim = QImage(cols, rows, QImage::Format_ARGB32);

   if(im.type() == CV_8UC3) {
      for(auto y = 0; y < rows; ++y) {
         const uint8_t* row = im.ptr(y); // RGB format
         uint32_t* dst      = reinterpret_cast<uint32_t*>(qim.scanLine(y));
         for(auto x = 0; x < cols; ++x) {
            uint32_t r = *row++;
            uint32_t g = *row++;
            uint32_t b = *row++;
            *dst++     = 0xff000000u | (r << 16) | (g << 8) | (b << 0);
         }
      }
   } else if(im.type() == CV_8UC1) {
      for(auto y = 0; y < rows; ++y) {
         const uint8_t* row = im.ptr(y);
         uint32_t* dst      = reinterpret_cast<uint32_t*>(qim.scanLine(y));
         for(auto x = 0; x < cols; ++x) {
            uint32_t v = *row++;
            *dst++     = 0xff000000u | (v << 16) | (v << 8) | (v << 0);
         }
      }
   } else {
      throw std::runtime_error(
          format("can only convert CV_8UC1 or CV_8UC3 images, got type {}",
                 im.type()));
   }
}

// ------------------------------------------------------------------ to-qstring

QString to_qstr(string_view s) noexcept
{
   return QString::fromUtf8(s.data(), int(s.size()));
}

string from_qstr(const QString& s) noexcept
{
   QByteArray utf8 = s.toUtf8();
   return string(utf8.constData(), size_t(utf8.size()));
}

// ------------------------------------------------------------- setting widgets

void block_signal_set(QCheckBox* cb, bool val) noexcept
{
   const bool was_blocked = cb->blockSignals(true);
   cb->setChecked(val);
   cb->blockSignals(was_blocked);
}

void block_signal_set(QLineEdit* le, const string_view val) noexcept
{
   const bool was_blocked = le->blockSignals(true);
   le->setText(to_qstr(val));
   le->blockSignals(was_blocked);
}

void block_signal_set(QComboBox* c, const int val) noexcept
{
   const bool was_blocked = c->blockSignals(true);
   c->setCurrentIndex(val);
   c->blockSignals(was_blocked);
}

void block_signal_set(QSpinBox* sb, const int val) noexcept
{
   const bool was_blocked = sb->blockSignals(true);
   sb->setValue(val);
   sb->blockSignals(was_blocked);
}

void block_signal_set(QDoubleSpinBox* sb, const real val) noexcept
{
   const bool was_blocked = sb->blockSignals(true);
   sb->setValue(val);
   sb->blockSignals(was_blocked);
}

void block_signal_set(QSlider* s, const int val) noexcept
{
   const bool was_blocked = s->blockSignals(true);
   s->setValue(val);
   s->blockSignals(was_blocked);
}

// ------------------------------------------------------------------- new-label

QLabel* new_label(const string_view text, const char* style_sheet)
{
   auto lb = new QLabel(to_qstr(text));
   if(style_sheet) lb->setStyleSheet(style_sheet);
   return lb;
}

// --------------------------------------------------- set qform-min-label-width

void for_each_qform_label(QFormLayout* layout,
                          std::function<void(QWidget*)> f) noexcept
{
   for(auto row = 0; row < layout->rowCount(); ++row) {
      QLayoutItem* item = layout->itemAt(row, QFormLayout::LabelRole);
      QWidget* wgt      = (item == nullptr) ? nullptr : item->widget();
      if(wgt != nullptr) f(wgt);
   }
}

// ------------------------------------------------------------------ show-error

void show_error(QWidget* parent,
                const string_view title,
                const string_view msg) noexcept
{
   LOG_ERR(format("{}: {}", title, msg));
   QMessageBox::critical(parent, to_qstr(title), to_qstr(msg));
}

} // namespace fauna
