#pragma once

#include "cmd.h"

#include <optional>
#include <string>

namespace refpack {

class cmd_presets : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_presets> {
    std::optional<std::string> name;  // show one preset in detail
  };

  cmd_presets(cfg cfg, settings_overrides const &overrides);

  void execute(std::stop_token const &stop) override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace refpack
