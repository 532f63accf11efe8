#include "cli.h"
#include "tui.h"

#include "CLI11.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace refpack {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "refpack - reference assembly resolver" };
  app.allow_windows_style_options(false);

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stdout/stderr with timestamp and level)");

  std::string trace_spec;
  auto *trace_option{ app.add_option("--trace",
                                     trace_spec,
                                     "Enable trace logging. Provide a comma-separated "
                                     "list: 'stderr' for human-readable stderr and/or "
                                     "'file:<path>' for JSONL file output. Defaults to "
                                     "stderr if no value provided.") };
  trace_option->expected(0, 1);

  bool version_flag_short{ false };
  bool version_flag_long{ false };
  app.add_flag("-v",
               version_flag_short,
               "Show version information (alias for version subcommand)");
  app.add_flag("--version",
               version_flag_long,
               "Show version information (alias for version subcommand)");

  settings_overrides overrides{};
  app.add_option("--cache-root",
                 overrides.packages_root,
                 "Local package cache (overrides REFPACK_PACKAGES_ROOT)");
  app.add_option("--global-packages",
                 overrides.global_packages,
                 "Read-only global package folder (overrides NUGET_PACKAGES)");
  app.add_option("--source",
                 overrides.sources,
                 "Package source: http(s) feed or local folder; repeatable, first wins");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;

  // Version subcommand
  auto *version{ app.add_subcommand("version", "Show version information") };
  version->callback([&cmd_cfg] { cmd_cfg = cmd_version::cfg{}; });

  // Resolve subcommand
  cmd_resolve::cfg resolve_cfg{};
  auto *resolve{ app.add_subcommand("resolve",
                                    "Resolve a reference assembly set and print its paths") };
  resolve->add_option("target",
                      resolve_cfg.target,
                      "Preset name or target framework (defaults to net472)");
  resolve->add_option("--language", resolve_cfg.language, "Source language, e.g. \"C#\"");
  resolve->add_option("--package,-p", resolve_cfg.packages, "Extra package (Id@Version)");
  resolve->add_option("--assembly,-a", resolve_cfg.assemblies, "Extra assembly name");
  resolve->add_option("--root", resolve_cfg.root_package, "Root reference package (Id@Version)");
  resolve->add_option("--root-path",
                      resolve_cfg.root_path,
                      "Assembly directory inside the root package");
  resolve->callback([&cmd_cfg, &resolve_cfg] { cmd_cfg = resolve_cfg; });

  // Presets subcommand
  cmd_presets::cfg presets_cfg{};
  auto *presets{ app.add_subcommand("presets", "List built-in presets") };
  presets->add_option("name", presets_cfg.name, "Show the contents of one preset");
  presets->callback([&cmd_cfg, &presets_cfg] { cmd_cfg = presets_cfg; });

  // Extract subcommand
  cmd_extract::cfg extract_cfg{};
  auto *extract{ app.add_subcommand("extract", "Extract a .nupkg to destination") };
  extract->add_option("archive", extract_cfg.archive_path, "Package file to extract")
      ->required()
      ->check(CLI::ExistingFile);
  extract->add_option("destination",
                      extract_cfg.destination,
                      "Destination directory (defaults to current directory)");
  extract->callback([&cmd_cfg, &extract_cfg] { cmd_cfg = extract_cfg; });

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  args.overrides = overrides;

  // --trace defaults to stderr if no value provided
  bool const trace_requested{ trace_option->count() > 0 };
  std::vector<std::string> trace_specs_tokens;

  if (trace_requested) {
    if (trace_spec.empty()) {
      trace_specs_tokens.push_back("stderr");
    } else {
      for (std::string_view sv{ trace_spec }; !sv.empty();) {
        auto const pos{ sv.find(',') };
        auto const token{ sv.substr(0, pos) };
        if (!token.empty()) { trace_specs_tokens.emplace_back(token); }
        sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
      }
    }
  }

  if (!trace_specs_tokens.empty()) {
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;
    for (auto const &spec : trace_specs_tokens) {
      if (spec == "stderr") {
        args.trace_outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
      } else if (spec.rfind("file:", 0) == 0 && spec.size() > 5) {
        args.trace_outputs.push_back(
            { tui::trace_output_type::file, std::filesystem::path{ spec.substr(5) } });
      } else {
        args.cli_output = "Invalid trace output spec: " + spec;
        args.trace_outputs.clear();
        cmd_cfg.reset();
        break;
      }
    }
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if ((version_flag_short || version_flag_long) && args.cli_output.empty()) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = *cmd_cfg;
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace refpack
