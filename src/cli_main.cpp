/**
 * @file cli_main.cpp
 * @brief Точка входа терминальной версии Code Break
 *
 * Использование: code_break [source_file] [cursor_line]
 */

#include "brick_game/codebreak/cb_codebreak.h"
#include "controller/controller.h"
#include "gui/cli/cli.h"

int main(int argc, char** argv) {
  codebreak::ControllerOptions options;
  if (!codebreak::parse_options(argc, argv, &options)) return 2;

  codebreak::Controller controller(cli_view, codebreak_get_interface());
  return controller.run(options);
}
