#pragma once

// Other QT
#include <QImage>
#include <QMessageBox>

// Widgets
#include <QCheckBox>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSlider>
#include <QSpinBox>
#include <QWidget>

// Layouts
#include <QFormLayout>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QVBoxLayout>

#include "stdinc.hpp"

#include <opencv2/core/core.hpp>

namespace fauna
{
// `im` is CV_8UC1 or CV_8UC3 (RGB)
void to_qimage(const cv::Mat& im, QImage& qim) noexcept(false);

QString to_qstr(string_view s) noexcept;
string from_qstr(const QString& s) noexcept;

void block_signal_set(QCheckBox* cb, bool val) noexcept;
void block_signal_set(QLineEdit* le, const string_view val) noexcept;
void block_signal_set(QComboBox* c, const int val) noexcept;
void block_signal_set(QSpinBox* sb, const int val) noexcept;
void block_signal_set(QDoubleSpinBox* sb, const real val) noexcept;
void block_signal_set(QSlider* s, const int val) noexcept;

QLabel* new_label(const string_view text, const char* style_sheet = nullptr);

void for_each_qform_label(QFormLayout* layout,
                          std::function<void(QWidget*)> f) noexcept;

// Shows `msg` in a modal critical message box, and logs it
void show_error(QWidget* parent,
                const string_view title,
                const string_view msg) noexcept;

} // namespace fauna
