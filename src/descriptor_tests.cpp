#include "descriptor.h"

#include "errors.h"
#include "resolve_context.h"
#include "test_support.h"

#include "doctest.h"

#include <chrono>
#include <exception>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace {

using refpack::descriptor;
using refpack::package_identity;

struct resolve_fixture : refpack::test::temp_dir_fixture {
  resolve_fixture() {
    feed = root / "feed";
    std::filesystem::create_directories(feed);
    ctx = make_context(registry);
  }

  std::unique_ptr<refpack::resolve_context> make_context(
      refpack::test::counting_registry *&out) const {
    return make_context(out, feed);
  }

  std::unique_ptr<refpack::resolve_context> make_context(
      refpack::test::counting_registry *&out,
      std::filesystem::path const &feed_dir) const {
    auto reg{ std::make_unique<refpack::test::counting_registry>(feed_dir) };
    out = reg.get();
    std::vector<std::unique_ptr<refpack::package_registry>> registries;
    registries.push_back(std::move(reg));
    return std::make_unique<refpack::resolve_context>(
        refpack::settings{ root / "cache", std::nullopt, {} }, std::move(registries));
  }

  void write_base() const {
    refpack::test::write_package(feed, "Base", "1.0.0", { "lib/p1/Core.dll" });
  }

  void write_ext() const {
    refpack::test::write_package(feed, "Ext", "1.0.0", { "lib/p1/Ext.dll" },
                                 { { "Base", "[1.0.0,)" } });
  }

  // Reference-assembly package laid out like the .NETFramework packs.
  void write_reference_pack() const {
    std::string const dir{ "build/.NETFramework/v4.7.2/" };
    refpack::test::write_zip(
        feed / "Ref.1.0.0.nupkg",
        { { "Ref.nuspec", refpack::test::make_nuspec("Ref", "1.0.0", {}, {}, { "System.Xml" }) },
          { dir + "mscorlib.dll", "x" },
          { dir + "System.Xml.dll", "x" },
          { dir + "Microsoft.CSharp.dll", "x" },
          { dir + "Facades/System.Runtime.dll", "x" } });
  }

  descriptor base_descriptor() const {
    return descriptor{ "p1", package_identity::parse("Base@1.0.0"), "lib\\p1" };
  }

  descriptor reference_descriptor() const {
    return descriptor{ "net472", package_identity::parse("Ref@1.0.0"),
                       "build\\.NETFramework\\v4.7.2" }
        .add_assemblies({ "mscorlib", "System.Missing" })
        .add_language_specific_assemblies("C#", { "Microsoft.CSharp" });
  }

  std::filesystem::path feed;
  refpack::test::counting_registry *registry{ nullptr };
  std::unique_ptr<refpack::resolve_context> ctx;
};

std::vector<std::string> file_names(refpack::reference_set const &set) {
  std::vector<std::string> names;
  for (auto const &p : set) { names.push_back(p.filename().string()); }
  return names;
}

}  // namespace

TEST_CASE("descriptor transforms return new values") {
  descriptor const base{ "net472" };
  auto const one{ base.add_assemblies({ "A" }) };
  auto const two{ one.add_assemblies({ "B", "A" }) };

  CHECK(base.assemblies().empty());
  CHECK(one.assemblies() == descriptor::assembly_list{ "A" });
  CHECK(two.assemblies() == descriptor::assembly_list{ "A", "B", "A" });
  CHECK(two.with_assemblies({ "C" }).assemblies() == descriptor::assembly_list{ "C" });

  auto const pkgs{ base.add_packages({ package_identity::parse("X@1.0.0") })
                       .add_packages({ package_identity::parse("Y@2.0.0") }) };
  REQUIRE(pkgs.packages().size() == 2);
  CHECK(pkgs.packages()[1].to_string() == "Y@2.0.0");
  CHECK(pkgs.with_packages({}).packages().empty());

  auto const desktop{ base.with_assembly_identity_comparer(
      refpack::assembly_identity_comparer::desktop) };
  CHECK(desktop.identity_comparer() == refpack::assembly_identity_comparer::desktop);
  CHECK(base.identity_comparer() == refpack::assembly_identity_comparer::default_comparer);
}

TEST_CASE("descriptor language-specific assemblies") {
  auto const d{ descriptor{ "net472" }
                    .add_language_specific_assemblies("C#", { "Microsoft.CSharp" })
                    .add_language_specific_assemblies("C#", { "Extra" })
                    .with_language_specific_assemblies("Visual Basic", {}) };

  CHECK(d.language_specific_assemblies().at("C#") ==
        descriptor::assembly_list{ "Microsoft.CSharp", "Extra" });
  CHECK(d.effective_language("C#") == "C#");
  CHECK(d.effective_language("Visual Basic").empty());
  CHECK(d.effective_language("F#").empty());
  CHECK(d.effective_language(std::nullopt).empty());

  CHECK(d.with_language_specific_assemblies(descriptor::language_map{})
            .language_specific_assemblies()
            .empty());
}

TEST_CASE("descriptor value equality") {
  auto const make{ [] {
    return descriptor{ "net45", package_identity::parse("Ref@1.0.0"), "build\\x" }.add_assemblies(
        { "mscorlib" });
  } };
  CHECK(make() == make());
  CHECK_FALSE(make() == make().add_assemblies({ "System" }));
  CHECK(make().root_asset_path() == std::string{ "build/x" });
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor resolves a root package") {
  write_base();
  auto const d{ base_descriptor() };

  auto const result{ d.resolve(std::nullopt, *ctx) };
  REQUIRE(result->size() == 1);
  CHECK(result->front().filename() == "Core.dll");
  CHECK(result->front().is_absolute());
  CHECK(std::filesystem::exists(result->front()));
  CHECK(registry->download_calls.load() == 1);
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor adds extra packages and their dependencies") {
  write_base();
  write_ext();
  auto const d{ base_descriptor().add_packages({ package_identity::parse("Ext@1.0.0") }) };

  auto const result{ d.resolve(std::nullopt, *ctx) };
  CHECK(file_names(*result) == std::vector<std::string>{ "Core.dll", "Ext.dll" });
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor skips dependency-only packages") {
  write_base();
  refpack::test::write_package(feed, "Meta", "1.0.0", { "build/Meta.targets" },
                               { { "Base", "1.0.0" } });
  auto const d{ base_descriptor().add_packages({ package_identity::parse("Meta@1.0.0") }) };

  auto const result{ d.resolve(std::nullopt, *ctx) };
  CHECK(file_names(*result) == std::vector<std::string>{ "Core.dll" });
  CHECK_FALSE(std::filesystem::exists(root / "cache" / "Meta.1.0.0"));
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor resolves named, framework and facade assemblies") {
  write_reference_pack();
  auto const d{ reference_descriptor() };

  auto const defaults{ d.resolve(std::nullopt, *ctx) };
  CHECK(file_names(*defaults) ==
        std::vector<std::string>{ "System.Runtime.dll", "System.Xml.dll", "mscorlib.dll" });

  auto const csharp{ d.resolve("C#", *ctx) };
  CHECK(file_names(*csharp) == std::vector<std::string>{ "System.Runtime.dll",
                                                          "Microsoft.CSharp.dll",
                                                          "System.Xml.dll",
                                                          "mscorlib.dll" });
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor names the cache lock after itself and the language") {
  write_reference_pack();
  auto const d{ reference_descriptor() };

  refpack::test::captured_log log;
  d.resolve(std::nullopt, *ctx);
  d.resolve("C#", *ctx);
  log.stop();

  CHECK(log.contains("lock_acquired owner=descriptor net472 lock_path="));
  CHECK(log.contains("lock_acquired owner=descriptor net472 (C#) lock_path="));
  CHECK(log.contains("lock_released owner=descriptor net472 (C#) lock_path="));
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor memoizes per language") {
  write_reference_pack();
  auto const d{ reference_descriptor() };

  auto const first{ d.resolve(std::nullopt, *ctx) };
  CHECK(d.resolve(std::nullopt, *ctx) == first);
  CHECK(d.resolve("Visual Basic", *ctx) == first);
  CHECK(d.resolve("", *ctx) == first);
  CHECK(d.resolve("C#", *ctx) != first);
  CHECK(registry->resolve_calls.load() == 2);
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor memo is per instance") {
  write_base();
  auto const a{ base_descriptor() };
  auto const b{ base_descriptor() };
  REQUIRE(a == b);

  auto const ra{ a.resolve(std::nullopt, *ctx) };
  auto const rb{ b.resolve(std::nullopt, *ctx) };
  CHECK(ra != rb);
  CHECK(*ra == *rb);
  CHECK(registry->resolve_calls.load() == 2);
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor reuses a warm cache") {
  write_base();
  auto const cold{ base_descriptor().resolve(std::nullopt, *ctx) };
  auto const marker{ root / "cache" / "Base.1.0.0" / "base.1.0.0.nupkg.sha512" };
  REQUIRE(std::filesystem::exists(marker));
  auto const stamp{ std::filesystem::last_write_time(marker) };

  refpack::test::counting_registry *second_registry{ nullptr };
  auto const second_ctx{ make_context(second_registry) };
  auto const warm{ base_descriptor().resolve(std::nullopt, *second_ctx) };

  CHECK(*warm == *cold);
  CHECK(second_registry->download_calls.load() == 0);
  CHECK(std::filesystem::last_write_time(marker) == stamp);
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor computes once under concurrent callers") {
  write_base();
  registry->delay = std::chrono::milliseconds{ 50 };
  auto const d{ base_descriptor() };

  constexpr int kThreads{ 8 };
  std::vector<refpack::reference_set_ptr> results(kThreads);
  {
    std::vector<std::jthread> threads;
    for (int i{ 0 }; i < kThreads; ++i) {
      threads.emplace_back([&, i] { results[i] = d.resolve(std::nullopt, *ctx); });
    }
  }

  CHECK(registry->resolve_calls.load() == 1);
  for (auto const &r : results) { CHECK(r == results[0]); }
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor cancellation leaves no result behind") {
  write_base();
  registry->block_until_stopped = true;
  auto const d{ base_descriptor() };

  std::stop_source source;
  std::exception_ptr failure;
  std::thread worker{ [&] {
    try {
      d.resolve(std::nullopt, *ctx, source.get_token());
    } catch (...) { failure = std::current_exception(); }
  } };

  while (!registry->entered) { std::this_thread::sleep_for(std::chrono::milliseconds{ 1 }); }
  source.request_stop();
  worker.join();

  REQUIRE(failure);
  CHECK_THROWS_AS(std::rethrow_exception(failure), refpack::cancelled_error);

  // Lock released, memo untouched.
  { auto const relock{ ctx->cache().lock("test", {}) }; }
  registry->block_until_stopped = false;
  auto const result{ d.resolve(std::nullopt, *ctx) };
  CHECK(result->size() == 1);
  CHECK(registry->resolve_calls.load() == 2);
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor fails when the root package is neither cached nor known") {
  CHECK_THROWS_AS(base_descriptor().resolve(std::nullopt, *ctx),
                  refpack::package_not_found_error);
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor uses a cached root that no registry knows") {
  write_base();
  auto const cold{ base_descriptor().resolve(std::nullopt, *ctx) };

  auto const empty_feed{ root / "empty" };
  std::filesystem::create_directories(empty_feed);
  refpack::test::counting_registry *offline{ nullptr };
  auto const offline_ctx{ make_context(offline, empty_feed) };
  auto const warm{ base_descriptor().resolve(std::nullopt, *offline_ctx) };

  CHECK(*warm == *cold);
  CHECK(file_names(*warm) == std::vector<std::string>{ "Core.dll" });
  CHECK(offline->download_calls.load() == 0);
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor rejects unsupported target frameworks") {
  CHECK_THROWS_AS(descriptor{ "portable-net45+win8" }.resolve(std::nullopt, *ctx),
                  refpack::parse_error);
}

TEST_CASE_FIXTURE(resolve_fixture, "descriptor surfaces version conflicts") {
  write_base();
  write_ext();
  refpack::test::write_package(feed, "Pin", "1.0.0", { "lib/p1/Pin.dll" },
                               { { "Ext", "[2.0.0,)" } });
  auto const d{ base_descriptor().add_packages(
      { package_identity::parse("Ext@1.0.0"), package_identity::parse("Pin@1.0.0") }) };

  CHECK_THROWS_AS(d.resolve(std::nullopt, *ctx), refpack::conflict_error);
}

TEST_CASE("descriptor moved-from cannot resolve") {
  descriptor a{ "net472" };
  descriptor b{ std::move(a) };
  CHECK(b.target_framework() == "net472");
  CHECK_THROWS_AS(a.resolve(std::nullopt), std::logic_error);
}
