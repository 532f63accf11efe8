#pragma once

#include "settings.h"
#include "util.h"

#include <memory>
#include <stop_token>

namespace refpack {

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;
  virtual void execute(std::stop_token const &stop) = 0;

  // Global options (--cache-root, --global-packages, --source) travel with
  // every command; commands that never touch the cache ignore them.
  template <typename config>
  static ptr_t create(config const &cfg, settings_overrides const &overrides);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, settings_overrides const &overrides) {
  return std::make_unique<typename config::cmd_t>(cfg, overrides);
}

}  // namespace refpack
