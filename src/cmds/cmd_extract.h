#pragma once

#include "cmd.h"

#include <filesystem>

namespace refpack {

class cmd_extract : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_extract> {
    std::filesystem::path archive_path;
    std::filesystem::path destination;
  };

  cmd_extract(cfg cfg, settings_overrides const &overrides);

  void execute(std::stop_token const &stop) override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace refpack
