#include "presets.h"

#include "errors.h"

#include "doctest.h"

#include <algorithm>
#include <string>
#include <vector>

namespace {

using refpack::descriptor;
namespace presets = refpack::presets;

bool contains(descriptor::assembly_list const &list, std::string const &name) {
  return std::ranges::find(list, name) != list.end();
}

}  // namespace

TEST_CASE("presets are process-wide singletons") {
  auto const *first{ presets::find("net472") };
  REQUIRE(first != nullptr);
  CHECK(first == presets::find("NET472"));
  CHECK(first == &presets::get("net472"));
  CHECK(first == &presets::default_preset());
}

TEST_CASE("presets catalog names") {
  auto const names{ presets::names() };
  CHECK(names.size() == 47);
  CHECK(names.front() == "net20");
  CHECK(names.back() == "netstandard2.0");
  for (auto const &name : names) { CHECK(presets::find(name) != nullptr); }
  CHECK(presets::find("net35") == nullptr);
  CHECK_THROWS_AS(presets::get("net35"), refpack::parse_error);
}

TEST_CASE("presets .NETFramework reference packs") {
  auto const &d{ presets::get("net472") };
  CHECK(d.target_framework() == "net472");
  REQUIRE(d.root_package().has_value());
  CHECK(d.root_package()->to_string() ==
        "Microsoft.NETFramework.ReferenceAssemblies.net472@1.0.0-preview.2");
  CHECK(d.root_asset_path() == std::string{ "build/.NETFramework/v4.7.2" });
  CHECK(d.identity_comparer() == refpack::assembly_identity_comparer::desktop);
  CHECK(contains(d.assemblies(), "System.Net.Http"));
  CHECK(d.language_specific_assemblies().at(presets::kLanguageCSharp) ==
        descriptor::assembly_list{ "Microsoft.CSharp" });
  CHECK(d.language_specific_assemblies().at(presets::kLanguageVisualBasic) ==
        descriptor::assembly_list{ "Microsoft.VisualBasic" });

  CHECK_FALSE(contains(presets::get("net40").assemblies(), "System.Net.Http"));
}

TEST_CASE("presets net20 has no C# assemblies") {
  auto const &d{ presets::get("net20") };
  CHECK(d.assemblies() == descriptor::assembly_list{ "mscorlib", "System", "System.Data",
                                                     "System.Xml" });
  CHECK_FALSE(d.language_specific_assemblies().contains(presets::kLanguageCSharp));
  CHECK(d.effective_language(presets::kLanguageCSharp).empty());

  auto const &forms{ presets::get("net20-windowsforms") };
  CHECK(contains(forms.assemblies(), "System.Windows.Forms"));
  CHECK_FALSE(contains(forms.assemblies(), "System.Deployment"));
}

TEST_CASE("presets variants extend their base") {
  auto const &base{ presets::get("net48") };
  auto const &wpf{ presets::get("net48-wpf") };
  auto const &forms{ presets::get("net48-windowsforms") };

  CHECK(wpf.assemblies().size() == base.assemblies().size() + 4);
  CHECK(contains(wpf.assemblies(), "PresentationFramework"));
  CHECK(contains(forms.assemblies(), "System.Deployment"));
  CHECK(wpf.root_package() == base.root_package());
}

TEST_CASE("presets package-based targets") {
  auto const &core{ presets::get("netcoreapp2.1") };
  CHECK_FALSE(core.root_package().has_value());
  REQUIRE(core.packages().size() == 1);
  CHECK(core.packages()[0].to_string() == "Microsoft.NETCore.App@2.1.13");

  auto const &ns16{ presets::get("netstandard1.6") };
  REQUIRE(ns16.packages().size() == 1);
  CHECK(ns16.packages()[0].to_string() == "NETStandard.Library@1.6.1");

  auto const &ns20{ presets::get("netstandard2.0") };
  CHECK(ns20.root_package()->to_string() == "NETStandard.Library@2.0.3");
  CHECK(ns20.root_asset_path() == std::string{ "build/netstandard2.0/ref" });
  CHECK(ns20.assemblies() == descriptor::assembly_list{ "netstandard" });
}
