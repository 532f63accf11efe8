#include "assembly_set_builder.h"

#include "util.h"

#include <system_error>
#include <utility>

namespace refpack {

namespace {

bool is_dll(std::filesystem::path const &p) { return util_iequals(p.extension().string(), ".dll"); }

}  // namespace

void assembly_set_builder::set_reference_directory(std::filesystem::path dir) {
  ref_dir_ = std::move(dir);
}

void assembly_set_builder::insert(std::filesystem::path const &p) {
  paths_.insert(std::filesystem::absolute(p).lexically_normal());
}

void assembly_set_builder::add_package(std::filesystem::path const &install_dir,
                                       asset_selection const &selection) {
  for (auto const &item : selection.compile_items) {
    std::filesystem::path const rel{ item };
    if (is_dll(rel)) { insert(install_dir / rel); }
  }
  add_named(selection.framework_assemblies);
}

void assembly_set_builder::add_named(std::vector<std::string> const &names) {
  if (!ref_dir_) { return; }
  for (auto const &name : names) {
    auto const candidate{ *ref_dir_ / (name + ".dll") };
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) { insert(candidate); }
  }
}

void assembly_set_builder::add_facades() {
  if (!ref_dir_) { return; }
  auto const facades{ *ref_dir_ / "Facades" };

  std::error_code ec;
  if (!std::filesystem::is_directory(facades, ec)) { return; }

  std::filesystem::directory_iterator it{ facades, ec };
  for (std::filesystem::directory_iterator const end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && is_dll(it->path())) { insert(it->path()); }
  }
}

std::vector<std::filesystem::path> assembly_set_builder::build() const {
  return { paths_.begin(), paths_.end() };
}

}  // namespace refpack
