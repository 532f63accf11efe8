#include "cmd_presets.h"

#include "presets.h"
#include "tui.h"

#include <string>
#include <utility>

namespace refpack {
namespace {

void print_list(char const *label, descriptor::assembly_list const &names) {
  if (names.empty()) { return; }
  std::string joined;
  for (auto const &n : names) {
    if (!joined.empty()) { joined += ", "; }
    joined += n;
  }
  tui::print_stdout("  %s: %s\n", label, joined.c_str());
}

void print_details(descriptor const &d) {
  tui::print_stdout("%s\n", d.target_framework().c_str());
  if (auto const &root{ d.root_package() }) {
    tui::print_stdout("  root: %s (%s)\n",
                      root->to_string().c_str(),
                      d.root_asset_path()->c_str());
  }
  if (d.identity_comparer() == assembly_identity_comparer::desktop) {
    tui::print_stdout("  comparer: desktop\n");
  }
  print_list("assemblies", d.assemblies());
  for (auto const &[language, names] : d.language_specific_assemblies()) {
    print_list(language.c_str(), names);
  }
  for (auto const &p : d.packages()) {
    tui::print_stdout("  package: %s\n", p.to_string().c_str());
  }
}

}  // namespace

cmd_presets::cmd_presets(cmd_presets::cfg cfg, settings_overrides const & /*overrides*/)
    : cfg_{ std::move(cfg) } {}

void cmd_presets::execute(std::stop_token const & /*stop*/) {
  if (cfg_.name) {
    print_details(presets::get(*cfg_.name));
    return;
  }
  for (auto const &name : presets::names()) { tui::print_stdout("%s\n", name.c_str()); }
}

}  // namespace refpack
