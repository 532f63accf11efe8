#include "cmds/cmd_extract.h"

#include "errors.h"
#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <type_traits>

TEST_CASE("cmd_extract config exposes cmd_t alias") {
  CHECK(std::is_same_v<refpack::cmd_extract::cfg::cmd_t, refpack::cmd_extract>);
  CHECK(std::is_base_of_v<refpack::cmd_cfg<refpack::cmd_extract>, refpack::cmd_extract::cfg>);
}

TEST_CASE_FIXTURE(refpack::test::temp_dir_fixture, "cmd_extract unpacks a package") {
  refpack::cmd_extract::cfg cfg;
  cfg.archive_path = refpack::test::write_package(root / "feed", "Base", "1.0.0",
                                                  { "lib/net45/Core.dll" });
  cfg.destination = root / "out" / "nested";

  refpack::cmd_extract cmd{ cfg, {} };
  cmd.execute({});

  CHECK(std::filesystem::exists(cfg.destination / "Base.nuspec"));
  CHECK(std::filesystem::exists(cfg.destination / "lib" / "net45" / "Core.dll"));
  CHECK_FALSE(std::filesystem::exists(cfg.destination / "_rels"));
}

TEST_CASE_FIXTURE(refpack::test::temp_dir_fixture, "cmd_extract rejects a missing archive") {
  refpack::cmd_extract::cfg cfg;
  cfg.archive_path = root / "missing.nupkg";
  cfg.destination = root / "out";

  refpack::cmd_extract cmd{ cfg, {} };
  CHECK_THROWS_AS(cmd.execute({}), refpack::io_error);
}

TEST_CASE_FIXTURE(refpack::test::temp_dir_fixture,
                  "cmd_extract rejects a destination that is a file") {
  refpack::cmd_extract::cfg cfg;
  cfg.archive_path = refpack::test::write_package(root / "feed", "Base", "1.0.0", {});
  cfg.destination = cfg.archive_path;

  refpack::cmd_extract cmd{ cfg, {} };
  CHECK_THROWS_AS(cmd.execute({}), refpack::io_error);
}
