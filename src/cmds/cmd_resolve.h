#pragma once

#include "cmd.h"
#include "descriptor.h"

#include <optional>
#include <string>
#include <vector>

namespace refpack {

class cmd_resolve : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_resolve> {
    std::string target;  // preset name or target framework; empty means net472
    std::optional<std::string> language;
    std::vector<std::string> packages;    // Id@Version
    std::vector<std::string> assemblies;  // simple names
    std::optional<std::string> root_package;
    std::optional<std::string> root_path;
  };

  cmd_resolve(cfg cfg, settings_overrides overrides);

  void execute(std::stop_token const &stop) override;
  cfg const &get_cfg() const { return cfg_; }

  // Preset (when `target` names one) or ad-hoc descriptor, extended with the
  // configured packages and assemblies. Throws parse_error.
  static descriptor make_descriptor(cfg const &cfg);

 private:
  cfg cfg_;
  settings_overrides overrides_;
};

}  // namespace refpack
