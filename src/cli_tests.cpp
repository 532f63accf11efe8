#include "cli.h"

#include "doctest.h"

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

// Helper to convert vector of strings to argc/argv
std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

refpack::cli_args parse(std::vector<std::string> args) {
  auto argv{ make_argv(args) };
  return refpack::cli_parse(static_cast<int>(args.size()), argv.data());
}

}  // anonymous namespace

TEST_CASE("cli_parse: no arguments") {
  auto const parsed{ parse({ "refpack" }) };

  // With no arguments, help text returned and no command configuration.
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: cmd_version") {
  SUBCASE("-v flag") {
    auto const parsed{ parse({ "refpack", "-v" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<refpack::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("--version flag") {
    auto const parsed{ parse({ "refpack", "--version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<refpack::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("version subcommand") {
    auto const parsed{ parse({ "refpack", "version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<refpack::cmd_version::cfg>(*parsed.cmd_cfg));
  }
}

TEST_CASE("cli_parse: cmd_resolve") {
  SUBCASE("preset with language") {
    auto const parsed{ parse({ "refpack", "resolve", "net472-wpf", "--language", "C#" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<refpack::cmd_resolve::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg);
    CHECK(cfg->target == "net472-wpf");
    CHECK(cfg->language == std::optional<std::string>{ "C#" });
    CHECK(cfg->packages.empty());
  }

  SUBCASE("repeated packages and assemblies") {
    auto const parsed{ parse({ "refpack",
                               "resolve",
                               "netstandard2.0",
                               "-p",
                               "A@1.0.0",
                               "--package",
                               "B@2.0.0",
                               "-a",
                               "System.Xml" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const &cfg{ std::get<refpack::cmd_resolve::cfg>(*parsed.cmd_cfg) };
    CHECK(cfg.packages == std::vector<std::string>{ "A@1.0.0", "B@2.0.0" });
    CHECK(cfg.assemblies == std::vector<std::string>{ "System.Xml" });
    CHECK_FALSE(cfg.language.has_value());
  }

  SUBCASE("root package") {
    auto const parsed{ parse({ "refpack",
                               "resolve",
                               "net45",
                               "--root",
                               "Ref@1.0.0",
                               "--root-path",
                               "build\\net45" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const &cfg{ std::get<refpack::cmd_resolve::cfg>(*parsed.cmd_cfg) };
    CHECK(cfg.root_package == std::optional<std::string>{ "Ref@1.0.0" });
    CHECK(cfg.root_path == std::optional<std::string>{ "build\\net45" });
  }

  SUBCASE("target defaults to empty") {
    auto const parsed{ parse({ "refpack", "resolve" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::get<refpack::cmd_resolve::cfg>(*parsed.cmd_cfg).target.empty());
  }
}

TEST_CASE("cli_parse: cmd_presets") {
  auto const list{ parse({ "refpack", "presets" }) };
  REQUIRE(list.cmd_cfg.has_value());
  CHECK_FALSE(std::get<refpack::cmd_presets::cfg>(*list.cmd_cfg).name.has_value());

  auto const one{ parse({ "refpack", "presets", "net48" }) };
  REQUIRE(one.cmd_cfg.has_value());
  CHECK(std::get<refpack::cmd_presets::cfg>(*one.cmd_cfg).name ==
        std::optional<std::string>{ "net48" });
}

TEST_CASE("cli_parse: cmd_extract") {
  SUBCASE("missing archive is a parse error") {
    auto const parsed{ parse({ "refpack", "extract", "/nonexistent/pkg.nupkg" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }

  SUBCASE("archive and destination") {
    auto const archive{ std::filesystem::temp_directory_path() / "refpack-cli-test.nupkg" };
    { std::FILE *f{ std::fopen(archive.string().c_str(), "wb") }; if (f) { std::fclose(f); } }

    auto const parsed{ parse({ "refpack", "extract", archive.string(), "out" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const &cfg{ std::get<refpack::cmd_extract::cfg>(*parsed.cmd_cfg) };
    CHECK(cfg.archive_path == archive);
    CHECK(cfg.destination == "out");

    std::filesystem::remove(archive);
  }
}

TEST_CASE("cli_parse: global settings overrides") {
  auto const parsed{ parse({ "refpack",
                             "--cache-root",
                             "/tmp/pkgs",
                             "--global-packages",
                             "/tmp/global",
                             "--source",
                             "https://example.test/v3/",
                             "--source",
                             "/tmp/feed",
                             "presets" }) };
  REQUIRE(parsed.cmd_cfg.has_value());
  CHECK(parsed.overrides.packages_root == std::filesystem::path{ "/tmp/pkgs" });
  CHECK(parsed.overrides.global_packages == std::filesystem::path{ "/tmp/global" });
  CHECK(parsed.overrides.sources ==
        std::vector<std::string>{ "https://example.test/v3/", "/tmp/feed" });
}

TEST_CASE("cli_parse: verbosity") {
  SUBCASE("default") {
    auto const parsed{ parse({ "refpack", "presets" }) };
    CHECK(parsed.verbosity == refpack::tui::level::TUI_INFO);
    CHECK_FALSE(parsed.decorated_logging);
  }

  SUBCASE("--verbose") {
    auto const parsed{ parse({ "refpack", "--verbose", "presets" }) };
    CHECK(parsed.verbosity == refpack::tui::level::TUI_DEBUG);
    CHECK(parsed.decorated_logging);
  }
}

TEST_CASE("cli_parse: trace outputs") {
  SUBCASE("bare --trace defaults to stderr") {
    auto const parsed{ parse({ "refpack", "--trace", "--verbose", "presets" }) };
    REQUIRE(parsed.trace_outputs.size() == 1);
    CHECK(parsed.trace_outputs[0].type == refpack::tui::trace_output_type::std_err);
    CHECK(parsed.verbosity == refpack::tui::level::TUI_TRACE);
  }

  SUBCASE("stderr and file") {
    auto const parsed{ parse({ "refpack", "--trace=stderr,file:/tmp/trace.jsonl", "presets" }) };
    REQUIRE(parsed.trace_outputs.size() == 2);
    CHECK(parsed.trace_outputs[1].type == refpack::tui::trace_output_type::file);
    CHECK(parsed.trace_outputs[1].file_path == std::filesystem::path{ "/tmp/trace.jsonl" });
    CHECK(parsed.cmd_cfg.has_value());
  }

  SUBCASE("invalid spec") {
    auto const parsed{ parse({ "refpack", "--trace=bogus", "presets" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output == "Invalid trace output spec: bogus");
  }
}
