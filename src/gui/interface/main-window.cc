#include "stdinc.hpp"

#include "main-window.hh"

#include <QAction>
#include <QApplication>
#include <QDialog>
#include <QFileDialog>
#include <QKeySequence>
#include <QMenuBar>
#include <QSettings>

#include "fauna/augment/augmenter.hpp"
#include "fauna/io/json-io.hpp"
#include "fauna/utils/file-system.hpp"
#include "fauna/video/video-error.hpp"
#include "gui/app-state.hh"
#include "gui/interface/frame-viewer.hh"
#include "gui/qt-helpers.hpp"
#include "gui/widgets/form-dialog.hh"
#include "gui/widgets/image-viewer.hh"

#define This MainWindow

using namespace fauna;

// ------------------------------------------------------------------ form specs

static const char* k_hdf5_form = R"V0G0N(
[
   {"name": "dataset", "label": "Dataset", "type": "string", "default": "box"},
   {"name": "input_format", "label": "Input Format", "type": "list",
    "options": "channels_last,channels_first", "default": "channels_last"},
   {"name": "convert_range", "label": "Convert Range", "type": "bool",
    "default": true}
]
)V0G0N";

static const char* k_export_form = R"V0G0N(
[
   {"name": "output_dir", "label": "Output Directory", "type": "file_dir",
    "default": ""},
   {"name": "store_name", "label": "Store Name", "type": "string",
    "default": "frames"},
   {"name": "frames", "label": "Frames", "type": "list",
    "options": "all,current", "default": "all"},
   {"name": "format", "label": "Format", "type": "list",
    "options": "default,png,jpg,bmp,mjpeg/avi", "default": "default"},
   {"name": "index_by_original", "label": "Index By Original", "type": "bool",
    "default": true}
]
)V0G0N";

static const char* k_augment_form = R"V0G0N(
[
   {"name": "n_frames", "label": "Frames", "type": "int", "default": 16},
   {"name": "batch_size", "label": "Batch Size", "type": "int", "default": 4},
   {"name": "rotation", "label": "Rotation", "type": "double",
    "default": 180.0},
   {"name": "scale_min", "label": "Scale Min", "type": "double",
    "default": 1.0},
   {"name": "scale_max", "label": "Scale Max", "type": "double",
    "default": 1.0},
   {"name": "seed", "label": "Seed", "type": "int", "default": -1}
]
)V0G0N";

// QSettings keys
static const char* k_pos_key      = "FAUNA_GUI__POS_main_window";
static const char* k_state_key    = "FAUNA_GUI__STATE_main_window";
static const char* k_open_dir_key = "FAUNA_GUI__last_open_dir";
static const char* k_hdf5_key     = "FAUNA_GUI__hdf5_options";
static const char* k_export_key   = "FAUNA_GUI__export_options";
static const char* k_augment_key  = "FAUNA_GUI__augment_options";

// ----------------------------------------------------------------------- Pimpl

struct This::Pimpl
{
   MainWindow* main_window = nullptr;

   // Menus
   QMenuBar* menu_bar = nullptr;
   QMenu* file_menu   = nullptr;
   QMenu* tools_menu  = nullptr;

   // Actions
   QAction* open_action               = nullptr;
   QAction* export_frame_store_action = nullptr;
   QAction* augment_preview_action    = nullptr;
   QAction* quit_action               = nullptr;

   // Widgets
   FrameViewer* frame_viewer     = nullptr;
   QLabel* frame_no_slider_label = nullptr;
   QSlider* frame_no_slider      = nullptr;

   QDialog* augment_dialog     = nullptr;
   ImageViewer* augment_viewer = nullptr;
   shared_ptr<QImage> augment_qim{make_shared<QImage>()};

   // Last used form values, restored from QSettings
   string open_dir = ""s;
   Json::Value hdf5_opts{Json::nullValue};
   Json::Value export_opts{Json::nullValue};
   Json::Value augment_opts{Json::nullValue};

   // Construction
   Pimpl(MainWindow* main_window_)
       : main_window(main_window_)
   {
      Expects(main_window != nullptr);
   }

   void make_ui();
   void make_actions();
   void make_menubar();

   void set_slider_label()
   {
      const int n_frames = app_state()->n_frames();
      if(n_frames > 0) {
         const int val = frame_no_slider->value();
         frame_no_slider_label->setText(
             to_qstr(format("{:4d}/{}", val, n_frames)));
      } else {
         frame_no_slider_label->setText("no video");
      }
   }

   void update_actions()
   {
      const bool has_video = app_state()->has_video();
      export_frame_store_action->setEnabled(has_video);
      augment_preview_action->setEnabled(has_video);
   }

   void show_augmented(const cv::Mat& im);
};

// --------------------------------------------------------------------- make-ui

void This::Pimpl::make_ui()
{
   main_window->setWindowTitle(to_qstr(format("fauna {}", k_version)));

   auto make_slider_widget = [&]() { // main-slider with label
      frame_no_slider_label = new QLabel{};
      frame_no_slider_label->setFixedWidth(75); // pixels for label

      frame_no_slider = new QSlider{};
      frame_no_slider->setTickPosition(QSlider::TicksBelow);
      frame_no_slider->setRange(0, 0);
      frame_no_slider->setOrientation(Qt::Horizontal);

      auto layout = new QHBoxLayout{};
      layout->addWidget(frame_no_slider_label);
      layout->addWidget(frame_no_slider);

      auto wgt = new QWidget{};
      wgt->setLayout(layout);
      return wgt;
   };

   frame_viewer = new FrameViewer{};

   { // -- (*) -- pull everything together in main widget
      auto* layout = new QVBoxLayout;
      layout->addWidget(frame_viewer);
      layout->addWidget(make_slider_widget());
      auto* wgt = new QWidget;
      wgt->setLayout(layout);
      main_window->setCentralWidget(wgt);
   }

   make_actions();
   make_menubar();

   // -- (*) -- Wiring
   connect(app_state(),
           SIGNAL(video_changed()),
           main_window,
           SLOT(on_video_changed()));

   connect(app_state(),
           SIGNAL(frame_changed(int)),
           main_window,
           SLOT(on_frame_changed(int)));

   connect(frame_no_slider,
           SIGNAL(valueChanged(int)),
           main_window,
           SLOT(on_update_frame_slider(int)));

   main_window->on_video_changed();
}

// ---------------------------------------------------------------- make actions

void This::Pimpl::make_actions()
{
   auto make_action = [&](const string_view name,
                          const vector<const char*> shortcuts,
                          const auto f) {
      auto action = new QAction(tr(name.data()), main_window);
      QList<QKeySequence> l;
      for(const auto s : shortcuts) l.append(QKeySequence(QString(s)));
      action->setShortcuts(l);
      connect(action, &QAction::triggered, main_window, f);
      return action;
   };

   open_action
       = make_action("&Open Video", {"Ctrl+O"}, &MainWindow::on_open_action);
   export_frame_store_action
       = make_action("&Export Frame Store",
                     {"Ctrl+E"},
                     &MainWindow::on_export_frame_store_action);
   augment_preview_action
       = make_action("&Augmentation Preview",
                     {"Ctrl+P"},
                     &MainWindow::on_augment_preview_action);
   quit_action = make_action("E&xit", {"Ctrl+Q"}, &MainWindow::on_quit_action);
}

// ---------------------------------------------------------------- make menubar

void This::Pimpl::make_menubar()
{
   menu_bar = new QMenuBar(main_window);
   main_window->setMenuBar(menu_bar);

   file_menu = menu_bar->addMenu(tr("&File"));
   file_menu->addAction(open_action);
   file_menu->addAction(export_frame_store_action);
   file_menu->addSeparator();
   file_menu->addAction(quit_action);

   tools_menu = menu_bar->addMenu(tr("&Tools"));
   tools_menu->addAction(augment_preview_action);
}

// -------------------------------------------------------------- show augmented

void This::Pimpl::show_augmented(const cv::Mat& im)
{
   if(augment_dialog == nullptr) {
      augment_dialog = new QDialog(main_window);
      augment_dialog->setWindowTitle("Augmentation Preview");
      augment_viewer = new ImageViewer{};
      augment_viewer->setSizePolicy(QSizePolicy::Expanding,
                                    QSizePolicy::Expanding);
      augment_viewer->setMinimumSize(320, 240);
      auto layout = new QVBoxLayout;
      layout->addWidget(augment_viewer);
      augment_dialog->setLayout(layout);
   }

   to_qimage(im, *augment_qim);
   augment_viewer->reset_offset_zoom();
   augment_viewer->set_qimage(augment_qim);
   augment_dialog->resize(im.cols + 40, im.rows + 40);
   augment_dialog->show();
   augment_dialog->raise();
}

// ---------------------------------------------------------------- Construction

This::This(QWidget* parent)
    : QMainWindow(parent)
    , pimpl_(make_unique<Pimpl>(this))
{
   pimpl_->make_ui();
   restore_state(); // Restore-state window state from user config
}

This::~This() = default;

// ------------------------------------------------------------------ save state

void This::save_state()
{
   auto& P = *pimpl_;
   QSettings settings;
   if(!isMaximized() && !isFullScreen() && !isMinimized() && isVisible()) {
      settings.setValue(k_pos_key, saveGeometry());
      settings.setValue(k_state_key, saveState());
   }
   settings.setValue(k_open_dir_key, to_qstr(P.open_dir));

   auto save_json = [&](const char* key, const Json::Value& o) {
      if(o.isObject()) settings.setValue(key, to_qstr(json_encode(o)));
   };
   save_json(k_hdf5_key, P.hdf5_opts);
   save_json(k_export_key, P.export_opts);
   save_json(k_augment_key, P.augment_opts);
}

// --------------------------------------------------------------- restore state

void This::restore_state()
{
   auto& P = *pimpl_;
   QSettings settings;
   restoreGeometry(settings.value(k_pos_key).toByteArray());
   restoreState(settings.value(k_state_key).toByteArray());
   P.open_dir = from_qstr(settings.value(k_open_dir_key).toString());

   auto load_json = [&](const char* key, Json::Value& o) {
      const auto s = from_qstr(settings.value(key).toString());
      if(s.empty()) return;
      if(!parse_json(s, o) or !o.isObject()) {
         WARN(format("ignoring bad setting '{}': {}", key, s));
         o = Json::Value{Json::nullValue};
      }
   };
   load_json(k_hdf5_key, P.hdf5_opts);
   load_json(k_export_key, P.export_opts);
   load_json(k_augment_key, P.augment_opts);
}

// ---------------------------------------------------------- on video changed

void This::on_video_changed()
{
   auto& P = *pimpl_;

   const int n_frames = app_state()->n_frames();
   {
      const bool was_blocked = P.frame_no_slider->blockSignals(true);
      P.frame_no_slider->setRange(0, std::max(0, n_frames - 1));
      P.frame_no_slider->setTickInterval(std::max(1, n_frames / 20));
      P.frame_no_slider->setValue(std::max(0, app_state()->frame_no()));
      P.frame_no_slider->blockSignals(was_blocked);
   }

   P.set_slider_label();
   P.update_actions();
}

void This::on_frame_changed(int frame_no)
{
   auto& P = *pimpl_;
   if(frame_no >= 0 and P.frame_no_slider->value() != frame_no)
      block_signal_set(P.frame_no_slider, frame_no);
   P.set_slider_label();
}

void This::on_update_frame_slider(int frame_no)
{
   pimpl_->set_slider_label();
   app_state()->seek_frame(frame_no);
}

// ------------------------------------------------------------------ open video

void This::on_open_action()
{
   auto& P = *pimpl_;

   const QString qfname = QFileDialog::getOpenFileName(
       this,
       "Open Video",
       to_qstr(P.open_dir),
       "Videos (*.h5 *.hdf5 *.npy *.mp4 *.avi metadata.yaml);;All files (*)");
   if(qfname.isEmpty()) return;

   const string fname = from_qstr(qfname);
   P.open_dir         = dirname(fname);

   VideoOptions opts;
   opts.index_by_original = false; // the slider walks frame indices

   const auto ext = string_to_lowercase(file_ext(fname));
   try {
      if(ext == ".h5" or ext == ".hdf5") {
         const auto data = FormDialog::get_form_data(
             this, "HDF5 Options", parse_form_spec(k_hdf5_form), P.hdf5_opts);
         if(data.isNull()) return; // cancelled
         P.hdf5_opts = data;

         const string op    = "reading hdf5 options";
         opts.dataset       = json_load_key<string>(data, "dataset", op);
         opts.input_format  = json_load_key<string>(data, "input_format", op);
         opts.convert_range = json_load_key<bool>(data, "convert_range", op);
      }

      app_state()->open_video(fname, opts);
   } catch(std::exception& e) {
      show_error(this,
                 "Open Video",
                 format("failed to open '{}': {}", fname, e.what()));
   }
}

// ---------------------------------------------------------- export frame store

void This::on_export_frame_store_action()
{
   auto& P          = *pimpl_;
   const auto video = app_state()->video();
   if(video == nullptr) return;

   try {
      const auto fields = parse_form_spec(k_export_form);
      const auto data   = FormDialog::get_form_data(
          this, "Export Frame Store", fields, P.export_opts);
      if(data.isNull()) return; // cancelled
      P.export_opts = data;

      const string op        = "exporting frame store";
      const auto output_dir  = json_load_key<string>(data, "output_dir", op);
      const auto store_name  = json_load_key<string>(data, "store_name", op);
      const auto frames      = json_load_key<string>(data, "frames", op);
      const auto fmt_s       = json_load_key<string>(data, "format", op);
      const auto by_original
          = json_load_key<bool>(data, "index_by_original", op);

      if(output_dir.empty() or store_name.empty())
         throw std::runtime_error("must specify an output directory and name");

      vector<int> frame_numbers;
      if(frames == "current" and app_state()->has_current_frame())
         frame_numbers.push_back(app_state()->frame_no());

      const auto path = path_join(output_dir, store_name);
      const auto out  = video->to_frame_store(path,
                                             frame_numbers,
                                             (fmt_s == "default") ? "" : fmt_s,
                                             by_original);
      INFO(format("wrote frame store '{}', {}", path, str(out)));
   } catch(std::exception& e) {
      show_error(this, "Export Frame Store", e.what());
   }
}

// ---------------------------------------------------------- augment preview

void This::on_augment_preview_action()
{
   auto& P          = *pimpl_;
   const auto video = app_state()->video();
   if(video == nullptr) return;

   try {
      const auto fields = parse_form_spec(k_augment_form);
      const auto data   = FormDialog::get_form_data(
          this, "Augmentation Preview", fields, P.augment_opts);
      if(data.isNull()) return; // cancelled
      P.augment_opts = data;

      const string op     = "reading augmentation parameters";
      const int n_frames  = json_load_key<int>(data, "n_frames", op);
      const auto rotation = json_load_key<double>(data, "rotation", op);
      const auto scale_lo = json_load_key<double>(data, "scale_min", op);
      const auto scale_hi = json_load_key<double>(data, "scale_max", op);

      Augmenter::Params p;
      p.batch_size = json_load_key<int>(data, "batch_size", op);
      p.seed       = json_load_key<int>(data, "seed", op);
      p.set_rotation(rotation);
      p.set_scale(scale_lo, scale_hi);

      const int n = std::min(std::max(1, n_frames), video->num_frames());
      AugmenterData aug_data;
      aug_data.X = video->get_frames(Slice{0, n, 1});

      Augmenter augmenter(std::move(aug_data), p);
      const auto batch = augmenter.get_batch(0);
      INFO(format("augmented batch of {} samples, with params:\n{}",
                  batch.X.size(),
                  str(p)));
      if(!batch.X.empty()) P.show_augmented(batch.X.front());
   } catch(std::exception& e) {
      show_error(this, "Augmentation Preview", e.what());
   }
}

// ----------------------------------------------------------------- close event

void This::closeEvent(QCloseEvent*) { on_quit_action(); }

// ------------------------------------------------------------------------ quit

void This::on_quit_action()
{
   save_state();
   app_state()->close_video();
   QApplication::quit();
}
