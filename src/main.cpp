#include "cli.h"
#include "termination.h"
#include "tui.h"

int main(int argc, char **argv) {
  playpack::tui::init();
  playpack::termination_handler_install();

  auto const args{ playpack::cli_parse(argc, argv) };
  playpack::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  return playpack::cli_run(args);
}
