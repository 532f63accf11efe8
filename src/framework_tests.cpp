#include "framework.h"

#include "doctest.h"

#include <vector>

namespace {

using refpack::framework;
using refpack::framework_nearest;
using refpack::framework_version;
using fam = refpack::framework::family;

TEST_CASE("framework: .NETFramework compact names") {
  auto const f{ framework::parse("net472") };
  CHECK(f.get_family() == fam::net_framework);
  CHECK(f.version() == framework_version{ 4, 7, 2 });
  CHECK(f.to_string() == "net472");

  CHECK(framework::parse("net20").version() == framework_version{ 2, 0, 0 });
  CHECK(framework::parse("NET48").to_string() == "net48");
}

TEST_CASE("framework: net5 and later are .NETCoreApp") {
  auto const f{ framework::parse("net6.0-windows") };
  CHECK(f.get_family() == fam::net_core_app);
  CHECK(f.version() == framework_version{ 6, 0, 0 });
  CHECK(f.to_string() == "net6.0");
}

TEST_CASE("framework: netstandard and netcoreapp") {
  CHECK(framework::parse("netstandard2.0").get_family() == fam::net_standard);
  CHECK(framework::parse("netstandard1.3").version() == framework_version{ 1, 3, 0 });
  CHECK(framework::parse("netcoreapp2.1").to_string() == "netcoreapp2.1");
}

TEST_CASE("framework: generic monikers") {
  auto const p1{ framework::parse("p1") };
  CHECK(p1.get_family() == fam::generic);
  CHECK(p1.identifier() == "p");
  CHECK(p1.version() == framework_version{ 1, 0, 0 });
  CHECK(p1.to_string() == "p1.0");

  CHECK(framework::parse("uap10.0").identifier() == "uap");
}

TEST_CASE("framework: nuspec long names") {
  CHECK(framework::parse(".NETFramework4.5") == framework::parse("net45"));
  CHECK(framework::parse(".NETFramework,Version=v4.7.2") == framework::parse("net472"));
  CHECK(framework::parse(".NETStandard2.0") == framework::parse("netstandard2.0"));
  CHECK(framework::parse(".NETCoreApp2.1") == framework::parse("netcoreapp2.1"));
}

TEST_CASE("framework: unsupported names") {
  CHECK(framework::parse("").is_unsupported());
  CHECK(framework::parse("portable-net45+win8").is_unsupported());
  CHECK(framework::parse("123").is_unsupported());
  CHECK(framework::parse("net4x").is_unsupported());
  CHECK(framework::parse("any").get_family() == fam::any);
}

TEST_CASE("framework: same-family compatibility is version bounded") {
  auto const target{ framework::parse("net472") };
  CHECK(framework::parse("net45").is_compatible_with(target));
  CHECK(framework::parse("net472").is_compatible_with(target));
  CHECK_FALSE(framework::parse("net48").is_compatible_with(target));
  CHECK_FALSE(framework::parse("netcoreapp2.0").is_compatible_with(target));
  CHECK_FALSE(framework::parse("p1").is_compatible_with(target));
}

TEST_CASE("framework: netstandard maps onto .NETFramework") {
  CHECK(framework::parse("netstandard2.0").is_compatible_with(framework::parse("net461")));
  CHECK_FALSE(framework::parse("netstandard2.0").is_compatible_with(framework::parse("net46")));
  CHECK(framework::parse("netstandard1.3").is_compatible_with(framework::parse("net46")));
  CHECK(framework::parse("netstandard1.1").is_compatible_with(framework::parse("net45")));
  CHECK_FALSE(framework::parse("netstandard1.0").is_compatible_with(framework::parse("net40")));
}

TEST_CASE("framework: netstandard maps onto .NETCoreApp") {
  CHECK(framework::parse("netstandard1.6").is_compatible_with(framework::parse("netcoreapp1.0")));
  CHECK_FALSE(
      framework::parse("netstandard2.0").is_compatible_with(framework::parse("netcoreapp1.1")));
  CHECK(framework::parse("netstandard2.1").is_compatible_with(framework::parse("netcoreapp3.1")));
  CHECK(framework::parse("netstandard2.0").is_compatible_with(framework::parse("net6.0")));
}

TEST_CASE("framework: any is compatible with everything supported") {
  auto const any{ framework::any_framework() };
  CHECK(any.is_compatible_with(framework::parse("p1")));
  CHECK(any.is_compatible_with(framework::parse("net20")));
  CHECK_FALSE(any.is_compatible_with(framework::parse("portable-foo")));
  CHECK_FALSE(framework::parse("net20").is_compatible_with(any));
}

TEST_CASE("framework_nearest: same family highest version wins") {
  std::vector<framework> const candidates{ framework::parse("net40"),
                                           framework::parse("net46"),
                                           framework::parse("net48"),
                                           framework::parse("netstandard2.0") };
  auto const idx{ framework_nearest(framework::parse("net472"), candidates) };
  REQUIRE(idx.has_value());
  CHECK(*idx == 1);
}

TEST_CASE("framework_nearest: netstandard before any") {
  std::vector<framework> const candidates{ framework::any_framework(),
                                           framework::parse("netstandard1.3"),
                                           framework::parse("netstandard1.0") };
  auto const idx{ framework_nearest(framework::parse("net46"), candidates) };
  REQUIRE(idx.has_value());
  CHECK(*idx == 1);
}

TEST_CASE("framework_nearest: any as last resort, none when incompatible") {
  std::vector<framework> const with_any{ framework::parse("net48"), framework::any_framework() };
  CHECK(framework_nearest(framework::parse("p1"), with_any) == std::optional<std::size_t>{ 1 });

  std::vector<framework> const without{ framework::parse("net48") };
  CHECK_FALSE(framework_nearest(framework::parse("p1"), without).has_value());
}

}  // namespace
