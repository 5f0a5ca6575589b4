#pragma once

#include <memory>

#include <QMainWindow>

class MainWindow final : public QMainWindow
{
   Q_OBJECT

 private:
   struct Pimpl;
   std::unique_ptr<Pimpl> pimpl_;

 public:
   MainWindow(QWidget* parent = nullptr);
   MainWindow(const MainWindow&) = delete;
   MainWindow(MainWindow&&)      = delete;
   virtual ~MainWindow();
   MainWindow& operator=(const MainWindow&) = delete;
   MainWindow& operator=(MainWindow&&) = delete;

 public slots:

   // Application-state
   void save_state();
   void restore_state();

   // Video frame-number control
   void on_video_changed();
   void on_frame_changed(int frame_no);

 private slots:

   void on_update_frame_slider(int frame_no);

   // Action Slots
   void on_open_action();
   void on_export_frame_store_action();
   void on_augment_preview_action();
   void on_quit_action();

 protected:
   void closeEvent(QCloseEvent*) override;
};
