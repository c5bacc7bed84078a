/**
 * @file desktop_main.cpp
 * @brief Точка входа оконной версии Code Break (Qt6)
 *
 * Использование: code_break_desktop [source_file] [cursor_line]
 */

#include <QApplication>

#include "brick_game/codebreak/cb_codebreak.h"
#include "controller/controller.h"
#include "gui/desktop/qt_view.hpp"

int main(int argc, char** argv) {
  QApplication app(argc, argv);
  QApplication::setQuitOnLastWindowClosed(false);

  codebreak::ControllerOptions options;
  if (!codebreak::parse_options(argc, argv, &options)) return 2;

  codebreak::Controller controller(qt_view, codebreak_get_interface());
  return controller.run(options);
}
