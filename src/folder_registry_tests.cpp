#include "folder_registry.h"

#include "errors.h"
#include "source_cache_context.h"
#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <string>

namespace {

using refpack::framework;
using refpack::package_identity;

struct feed_fixture : refpack::test::temp_dir_fixture {
  feed_fixture() : feed{ root / "feed" }, registry{ root / "feed" }, scratch{ root } {}

  std::filesystem::path feed;
  refpack::folder_registry registry;
  refpack::source_cache_context scratch;
};

}  // namespace

TEST_CASE_FIXTURE(feed_fixture, "folder_registry reads dependencies from the archive") {
  refpack::test::write_package(feed, "Ext", "1.0.0", { "lib/p1/Ext.dll" },
                               { { "Base", "[1.0.0,)" } });

  auto const info{ registry.resolve_package(package_identity::parse("ext@1.0"),
                                            framework::parse("p1"), scratch, {}) };
  REQUIRE(info.has_value());
  CHECK(info->identity.id == "Ext");
  CHECK(info->source == &registry);
  REQUIRE(info->dependencies.size() == 1);
  CHECK(info->dependencies[0].id == "Base");
  CHECK(info->dependencies[0].range.min_version()->to_string() == "1.0.0");
}

TEST_CASE_FIXTURE(feed_fixture, "folder_registry finds hierarchical layouts") {
  auto const dir{ feed / "base" / "1.0.0" };
  std::filesystem::create_directories(dir);
  refpack::test::write_zip(dir / "base.1.0.0.nupkg",
                           { { "Base.nuspec", refpack::test::make_nuspec("Base", "1.0.0") } });

  auto const found{ registry.find_nupkg(package_identity::parse("Base@1.0.0")) };
  REQUIRE(found.has_value());
  CHECK(*found == dir / "base.1.0.0.nupkg");
}

TEST_CASE_FIXTURE(feed_fixture, "folder_registry misses unknown packages") {
  std::filesystem::create_directories(feed);
  CHECK_FALSE(registry
                  .resolve_package(package_identity::parse("Nope@1.0.0"),
                                   framework::parse("net472"), scratch, {})
                  .has_value());
  CHECK_THROWS_AS(registry.download(package_identity::parse("Nope@1.0.0"), scratch, {}),
                  refpack::package_not_found_error);
}

TEST_CASE_FIXTURE(feed_fixture, "folder_registry rejects a manifest that disagrees with the file") {
  std::filesystem::create_directories(feed);
  refpack::test::write_zip(feed / "Base.1.0.0.nupkg",
                           { { "Base.nuspec", refpack::test::make_nuspec("Base", "9.9.9") } });

  CHECK_FALSE(registry
                  .resolve_package(package_identity::parse("Base@1.0.0"),
                                   framework::parse("net472"), scratch, {})
                  .has_value());
}

TEST_CASE_FIXTURE(feed_fixture, "folder_registry download records in the scratch context") {
  auto const nupkg{ refpack::test::write_package(feed, "Base", "1.0.0", {}) };
  auto const id{ package_identity::parse("Base@1.0.0") };

  CHECK(registry.download(id, scratch, {}) == nupkg);
  CHECK(scratch.find_download(id) == nupkg);
  CHECK(scratch.download_count() == 1);
}
