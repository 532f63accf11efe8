#pragma once

#include "cmd.h"

namespace refpack {

class cmd_version : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_version> {};

  cmd_version(cfg cfg, settings_overrides const &overrides);

  void execute(std::stop_token const &stop) override;

 private:
  cfg cfg_;
};

}  // namespace refpack
