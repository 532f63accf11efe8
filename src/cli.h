#pragma once

#include "cmds/cmd_extract.h"
#include "cmds/cmd_presets.h"
#include "cmds/cmd_resolve.h"
#include "cmds/cmd_version.h"
#include "settings.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace refpack {

struct cli_args {
  using cmd_cfg_t =
      std::variant<cmd_extract::cfg, cmd_presets::cfg, cmd_resolve::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  settings_overrides overrides;  // --cache-root, --global-packages, --source
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace refpack
