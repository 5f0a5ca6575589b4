#include <cstdlib>
#include <iostream>

#include "stdinc.hpp"

#include <QApplication>

// ---- Compile in catch
#define CATCH_CONFIG_PREFIX_ALL
#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

// ------------------------------------------------------------------------ main
// Widgets need a QApplication, and the tests need no display
int main(int argc, char** argv)
{
   Catch::Session session;

   auto return_code = session.applyCommandLine(argc, argv);
   if(return_code != EXIT_SUCCESS) return return_code;

   if(qgetenv("QT_QPA_PLATFORM").isEmpty())
      qputenv("QT_QPA_PLATFORM", "offscreen");

   fauna::load_environment_variables();

   int qt_argc = 1;
   QApplication app(qt_argc, argv);

   return session.run();
}
