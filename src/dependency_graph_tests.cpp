#include "dependency_graph.h"

#include "errors.h"
#include "source_cache_context.h"
#include "test_support.h"

#include "doctest.h"

#include <stop_token>
#include <string>
#include <vector>

namespace {

using refpack::dependency_graph;
using refpack::framework;
using refpack::package_identity;
using refpack::test::memory_registry;

struct graph_fixture : refpack::test::temp_dir_fixture {
  graph_fixture() : scratch{ root } {}

  dependency_graph build(std::vector<std::string> const &roots,
                         std::vector<refpack::package_registry const *> const &registries,
                         std::stop_token const &stop = {}) {
    std::vector<package_identity> ids;
    for (auto const &r : roots) { ids.push_back(package_identity::parse(r)); }
    return dependency_graph::build(ids, framework::parse("net472"), registries, scratch, stop);
  }

  refpack::source_cache_context scratch;
};

std::vector<std::string> order_strings(dependency_graph const &g) {
  std::vector<std::string> out;
  for (auto const &p : g.order()) { out.push_back(p.to_string()); }
  return out;
}

}  // namespace

TEST_CASE_FIXTURE(graph_fixture, "dependency_graph first responding registry wins") {
  memory_registry first{ "first" };
  memory_registry second{ "second" };
  first.add("Base@1.0.0");
  second.add("Base@1.0.0", { { "Extra", "1.0.0" } });

  auto const g{ build({ "Base@1.0.0" }, { &first, &second }) };

  REQUIRE(g.size() == 1);
  auto const *info{ g.find(package_identity::parse("Base@1.0.0")) };
  REQUIRE(info != nullptr);
  CHECK(info->source == &first);
  CHECK(info->dependencies.empty());
  CHECK(second.queries() == 0);
}

TEST_CASE_FIXTURE(graph_fixture, "dependency_graph falls through to later registries") {
  memory_registry first{ "first" };
  memory_registry second{ "second" };
  first.add("App@1.0.0", { { "Lib", "[1.0.0,)" } });
  second.add("Lib@1.0.0");

  auto const g{ build({ "App@1.0.0" }, { &first, &second }) };

  REQUIRE(g.size() == 2);
  CHECK(g.find(package_identity::parse("Lib@1.0.0"))->source == &second);
  CHECK(g.missing().empty());
}

TEST_CASE_FIXTURE(graph_fixture, "dependency_graph drops identities no registry knows") {
  memory_registry reg{ "feed" };
  reg.add("App@1.0.0", { { "Gone", "2.0.0" }, { "Lib", "1.0.0" } });
  reg.add("Lib@1.0.0");

  auto const g{ build({ "App@1.0.0" }, { &reg }) };

  CHECK(g.size() == 2);
  CHECK_FALSE(g.contains(package_identity::parse("Gone@2.0.0")));
  REQUIRE(g.missing().size() == 1);
  CHECK(g.missing()[0].to_string() == "Gone@2.0.0");
}

TEST_CASE_FIXTURE(graph_fixture, "dependency_graph terminates on cycles") {
  memory_registry reg{ "feed" };
  reg.add("A@1.0.0", { { "B", "1.0.0" } });
  reg.add("B@1.0.0", { { "A", "1.0.0" } });

  auto const g{ build({ "A@1.0.0" }, { &reg }) };

  CHECK(order_strings(g) == std::vector<std::string>{ "A@1.0.0", "B@1.0.0" });
  CHECK(reg.queries() == 2);
}

TEST_CASE_FIXTURE(graph_fixture, "dependency_graph visits depth first in declaration order") {
  memory_registry reg{ "feed" };
  reg.add("Root@1.0.0", { { "X", "1.0.0" }, { "Y", "1.0.0" } });
  reg.add("X@1.0.0", { { "Z", "1.0.0" } });
  reg.add("Y@1.0.0");
  reg.add("Z@1.0.0");

  auto const g{ build({ "Root@1.0.0" }, { &reg }) };

  CHECK(order_strings(g) ==
        std::vector<std::string>{ "Root@1.0.0", "X@1.0.0", "Z@1.0.0", "Y@1.0.0" });
}

TEST_CASE_FIXTURE(graph_fixture, "dependency_graph follows range minimums only") {
  memory_registry reg{ "feed" };
  reg.add("App@1.0.0", { { "Lib", "[1.0.0,2.0.0)" }, { "Capped", "(,3.0.0]" } });
  reg.add("Lib@1.0.0");
  reg.add("Lib@1.5.0");
  reg.add("Capped@3.0.0");

  auto const g{ build({ "App@1.0.0" }, { &reg }) };

  CHECK(g.contains(package_identity::parse("Lib@1.0.0")));
  CHECK_FALSE(g.contains(package_identity::parse("Lib@1.5.0")));
  CHECK_FALSE(g.contains(package_identity::parse("Capped@3.0.0")));
  CHECK(g.size() == 2);
}

TEST_CASE_FIXTURE(graph_fixture, "dependency_graph versions_of sorts ascending") {
  memory_registry reg{ "feed" };
  reg.add("Lib@2.0.0");
  reg.add("Lib@1.0.0");

  auto const g{ build({ "Lib@2.0.0", "lib@1.0.0" }, { &reg }) };
  auto const versions{ g.versions_of("LIB") };
  REQUIRE(versions.size() == 2);
  CHECK(versions[0].version.to_string() == "1.0.0");
  CHECK(versions[1].version.to_string() == "2.0.0");
}

TEST_CASE_FIXTURE(graph_fixture, "dependency_graph honors a stop request") {
  memory_registry reg{ "feed" };
  reg.add("App@1.0.0");
  std::stop_source source;
  source.request_stop();

  CHECK_THROWS_AS(build({ "App@1.0.0" }, { &reg }, source.get_token()),
                  refpack::cancelled_error);
}
