#pragma once

#include "asset_selector.h"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace refpack {

// Accumulates absolute, normalized assembly paths for one resolution.
class assembly_set_builder {
 public:
  // Directory that framework and named assemblies resolve against:
  // <root install>/<root asset path>. Without it those names are ignored.
  void set_reference_directory(std::filesystem::path dir);
  std::optional<std::filesystem::path> const &reference_directory() const { return ref_dir_; }

  // Selected .dll items of one package, plus its framework assemblies.
  void add_package(std::filesystem::path const &install_dir, asset_selection const &selection);

  // <reference directory>/<name>.dll for each name whose file exists.
  void add_named(std::vector<std::string> const &names);

  // Every .dll in <reference directory>/Facades.
  void add_facades();

  std::vector<std::filesystem::path> build() const;

 private:
  void insert(std::filesystem::path const &p);

  std::optional<std::filesystem::path> ref_dir_;
  std::set<std::filesystem::path> paths_;
};

}  // namespace refpack
