#include "cli.h"
#include "termination.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <stop_token>
#include <variant>

int main(int argc, char **argv) {
  refpack::tui::init();

  auto args{ refpack::cli_parse(argc, argv) };
  refpack::tui::configure_trace_outputs(args.trace_outputs);

  std::stop_source stop;
  refpack::termination_watch termination{ stop };
  refpack::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      refpack::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    refpack::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit(
      [&args](auto const &cfg) { return refpack::cmd::create(cfg, args.overrides); },
      *args.cmd_cfg) };

  try {
    cmd->execute(stop.get_token());
  } catch (std::exception const &ex) {
    refpack::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
