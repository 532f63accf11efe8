#include "package_cache.h"

#include "errors.h"
#include "sha512.h"
#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

namespace {

using refpack::package_cache;
using refpack::package_identity;
using refpack::package_path_resolver;

struct cache_fixture : refpack::test::temp_dir_fixture {
  cache_fixture()
      : cache{ package_path_resolver{ root / "local", package_path_resolver::layout::side_by_side },
               package_path_resolver{ root / "global",
                                      package_path_resolver::layout::hierarchical } } {}

  package_cache cache;
};

}  // namespace

TEST_CASE_FIXTURE(cache_fixture, "package_cache install extracts and writes the marker") {
  auto const id{ package_identity::parse("Base@1.0.0") };
  auto const nupkg{ refpack::test::write_package(root / "feed", "Base", "1.0.0",
                                                 { "lib/p1/Core.dll" }) };

  CHECK_FALSE(cache.installed_path(id).has_value());

  auto const lock{ cache.lock("test", {}) };
  auto const dir{ cache.install(id, nupkg, {}) };

  CHECK(dir == root / "local" / "Base.1.0.0");
  CHECK(std::filesystem::exists(dir / "lib/p1/Core.dll"));
  CHECK(std::filesystem::exists(dir / "base.1.0.0.nupkg"));
  CHECK_FALSE(std::filesystem::exists(dir / "[Content_Types].xml"));

  auto const marker{ dir / package_path_resolver::marker_file_name(id) };
  REQUIRE(std::filesystem::exists(marker));
  auto const bytes{ refpack::util_load_file(marker) };
  CHECK(std::string(bytes.begin(), bytes.end()) ==
        refpack::sha512_base64(refpack::sha512(nupkg)));

  CHECK(cache.installed_path(id) == dir);
}

TEST_CASE_FIXTURE(cache_fixture, "package_cache install leaves no staging directories") {
  auto const nupkg{ refpack::test::write_package(root / "feed", "Base", "1.0.0", {}) };
  cache.install(package_identity::parse("Base@1.0.0"), nupkg, {});

  for (auto const &entry : std::filesystem::directory_iterator(root / "local")) {
    CHECK(entry.path().filename().string().rfind(".staging-", 0) != 0);
  }
}

TEST_CASE_FIXTURE(cache_fixture, "package_cache replaces an unfinished install") {
  auto const id{ package_identity::parse("Base@1.0.0") };
  auto const leftover{ root / "local" / "Base.1.0.0" };
  std::filesystem::create_directories(leftover);
  refpack::util_write_file(leftover / "partial.txt", "x");

  auto const nupkg{ refpack::test::write_package(root / "feed", "Base", "1.0.0", {}) };
  cache.install(id, nupkg, {});

  CHECK_FALSE(std::filesystem::exists(leftover / "partial.txt"));
  CHECK(cache.installed_path(id).has_value());
}

TEST_CASE_FIXTURE(cache_fixture, "package_cache consults the global folder") {
  auto const id{ package_identity::parse("Shared@2.0.0") };
  auto const dir{ root / "global" / "shared" / "2.0.0" };
  std::filesystem::create_directories(dir);
  refpack::util_write_file(dir / package_path_resolver::marker_file_name(id), "digest");

  CHECK(cache.installed_path(id) == dir);
}

TEST_CASE_FIXTURE(cache_fixture, "package_cache install honors a stop request") {
  auto const nupkg{ refpack::test::write_package(root / "feed", "Base", "1.0.0", {}) };
  std::stop_source source;
  source.request_stop();

  CHECK_THROWS_AS(cache.install(package_identity::parse("Base@1.0.0"), nupkg,
                                source.get_token()),
                  refpack::cancelled_error);
  CHECK_FALSE(cache.installed_path(package_identity::parse("Base@1.0.0")).has_value());
}

TEST_CASE_FIXTURE(cache_fixture, "package_cache lock creates the root and lock file") {
  {
    auto const lock{ cache.lock("test", {}) };
    CHECK(lock->lock_path() == root / "local" / ".lock");
    CHECK(std::filesystem::exists(root / "local" / ".lock"));
  }
  auto const again{ cache.lock("test", {}) };
  CHECK(again != nullptr);
}

TEST_CASE_FIXTURE(cache_fixture, "package_cache lock reports an unusable lock file as io_error") {
  std::filesystem::create_directories(root / "local" / ".lock");
  CHECK_THROWS_AS(cache.lock("test", {}), refpack::io_error);
}

TEST_CASE_FIXTURE(cache_fixture, "package_cache lock warns while waiting for another holder") {
  refpack::test::captured_log log;
  auto held{ cache.lock("descriptor net472", {}) };

  std::unique_ptr<package_cache::scoped_lock> second;
  std::jthread waiter{ [&] { second = cache.lock("descriptor net45", {}); } };

  auto const deadline{ std::chrono::steady_clock::now() + std::chrono::seconds{ 10 } };
  while (!log.contains("waiting for cache lock") && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds{ 5 });
  }
  CHECK(second == nullptr);

  held.reset();
  waiter.join();
  CHECK(second != nullptr);
  second.reset();

  auto const lines{ log.stop() };
  bool warned{ false };
  for (auto const &line : lines) {
    if (line == "descriptor net45: waiting for cache lock " + (root / "local" / ".lock").string() +
                    "\n") {
      warned = true;
    }
  }
  CHECK(warned);
}
