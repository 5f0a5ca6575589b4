#include "stdinc.hpp"

#include "app-state.hh"
#include "cmd-line.hpp"
#include "interface/main-window.hh"
#include "qt-helpers.hpp"

#include <QApplication>

int main(int argc, char** argv)
{
   using namespace fauna;

   int ret = 0;
   {
      gui::AppConfig config = gui::parse_command_line(argc, argv);
      if(config.has_error) return EXIT_FAILURE;

      if(config.show_help) {
         gui::show_help(argv[0]);
         return EXIT_SUCCESS;
      }

      // Load environment variables
      load_environment_variables();

      // Output the configuration info
      INFO(format("Fauna Configuration:"));
      std::cout << environment_info() << std::endl;

      QApplication app(argc, argv);
      QApplication::setOrganizationName("fauna");
      QApplication::setApplicationName("fauna-gui");

      MainWindow main_window{};
      app_state()->set_main_window(&main_window);
      if(!app_state()->initialize(config)) return EXIT_FAILURE;
      main_window.show();

      ret = app.exec();

      AppState::dispose_instance();
   }

   return ret;
}
