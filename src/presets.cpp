#include "presets.h"

#include "errors.h"
#include "util.h"

#include <iterator>
#include <string>
#include <utility>

namespace refpack::presets {
namespace {

using assembly_list = descriptor::assembly_list;

template <descriptor (*make)()>
descriptor const &lazy_preset() {
  static descriptor const instance{ make() };
  return instance;
}

descriptor reference_assemblies_pack(std::string const &tfm, std::string const &version_dir) {
  package_identity root{ "Microsoft.NETFramework.ReferenceAssemblies." + tfm,
                         package_version::parse(kReferenceAssembliesPackageVersion) };
  return descriptor{ tfm, std::move(root), "build\\.NETFramework\\v" + version_dir }
      .with_assembly_identity_comparer(assembly_identity_comparer::desktop);
}

descriptor net4x(std::string const &tfm, std::string const &version_dir, bool has_net_http) {
  assembly_list assemblies{ "mscorlib", "System", "System.Core", "System.Data",
                            "System.Data.DataSetExtensions" };
  if (has_net_http) { assemblies.emplace_back("System.Net.Http"); }
  assemblies.emplace_back("System.Xml");
  assemblies.emplace_back("System.Xml.Linq");

  return reference_assemblies_pack(tfm, version_dir)
      .add_assemblies(assemblies)
      .add_language_specific_assemblies(kLanguageCSharp, { "Microsoft.CSharp" })
      .add_language_specific_assemblies(kLanguageVisualBasic, { "Microsoft.VisualBasic" });
}

descriptor net20() {
  return reference_assemblies_pack("net20", "2.0")
      .add_assemblies({ "mscorlib", "System", "System.Data", "System.Xml" })
      .add_language_specific_assemblies(kLanguageVisualBasic, { "Microsoft.VisualBasic" });
}

descriptor net20_windows_forms() {
  return lazy_preset<net20>().add_assemblies({ "System.Drawing", "System.Windows.Forms" });
}

descriptor net40() { return net4x("net40", "4.0", false); }
descriptor net45() { return net4x("net45", "4.5", true); }
descriptor net451() { return net4x("net451", "4.5.1", true); }
descriptor net452() { return net4x("net452", "4.5.2", true); }
descriptor net46() { return net4x("net46", "4.6", true); }
descriptor net461() { return net4x("net461", "4.6.1", true); }
descriptor net462() { return net4x("net462", "4.6.2", true); }
descriptor net47() { return net4x("net47", "4.7", true); }
descriptor net471() { return net4x("net471", "4.7.1", true); }
descriptor net472() { return net4x("net472", "4.7.2", true); }
descriptor net48() { return net4x("net48", "4.8", true); }

template <descriptor (*base)()>
descriptor windows_forms() {
  return lazy_preset<base>().add_assemblies(
      { "System.Deployment", "System.Drawing", "System.Windows.Forms" });
}

template <descriptor (*base)()>
descriptor wpf() {
  return lazy_preset<base>().add_assemblies(
      { "PresentationCore", "PresentationFramework", "System.Xaml", "WindowsBase" });
}

descriptor with_package(char const *tfm, char const *id, char const *version) {
  return descriptor{ tfm }.add_packages({ package_identity{ id, package_version::parse(version) } });
}

descriptor netcoreapp10() { return with_package("netcoreapp1.0", "Microsoft.NETCore.App", "1.0.16"); }
descriptor netcoreapp11() { return with_package("netcoreapp1.1", "Microsoft.NETCore.App", "1.1.13"); }
descriptor netcoreapp20() { return with_package("netcoreapp2.0", "Microsoft.NETCore.App", "2.0.9"); }
descriptor netcoreapp21() { return with_package("netcoreapp2.1", "Microsoft.NETCore.App", "2.1.13"); }

descriptor netstandard10() { return with_package("netstandard1.0", "NETStandard.Library", "1.6.1"); }
descriptor netstandard11() { return with_package("netstandard1.1", "NETStandard.Library", "1.6.1"); }
descriptor netstandard12() { return with_package("netstandard1.2", "NETStandard.Library", "1.6.1"); }
descriptor netstandard13() { return with_package("netstandard1.3", "NETStandard.Library", "1.6.1"); }
descriptor netstandard14() { return with_package("netstandard1.4", "NETStandard.Library", "1.6.1"); }
descriptor netstandard15() { return with_package("netstandard1.5", "NETStandard.Library", "1.6.1"); }
descriptor netstandard16() { return with_package("netstandard1.6", "NETStandard.Library", "1.6.1"); }

descriptor netstandard20() {
  return descriptor{ "netstandard2.0",
                     package_identity{ "NETStandard.Library", package_version::parse("2.0.3") },
                     "build\\netstandard2.0\\ref" }
      .add_assemblies({ "netstandard" });
}

struct catalog_entry {
  std::string_view name;
  descriptor const &(*get)();
};

constexpr catalog_entry kCatalog[]{
  { "net20", &lazy_preset<net20> },
  { "net20-windowsforms", &lazy_preset<net20_windows_forms> },
  { "net40", &lazy_preset<net40> },
  { "net40-windowsforms", &lazy_preset<windows_forms<net40>> },
  { "net40-wpf", &lazy_preset<wpf<net40>> },
  { "net45", &lazy_preset<net45> },
  { "net45-windowsforms", &lazy_preset<windows_forms<net45>> },
  { "net45-wpf", &lazy_preset<wpf<net45>> },
  { "net451", &lazy_preset<net451> },
  { "net451-windowsforms", &lazy_preset<windows_forms<net451>> },
  { "net451-wpf", &lazy_preset<wpf<net451>> },
  { "net452", &lazy_preset<net452> },
  { "net452-windowsforms", &lazy_preset<windows_forms<net452>> },
  { "net452-wpf", &lazy_preset<wpf<net452>> },
  { "net46", &lazy_preset<net46> },
  { "net46-windowsforms", &lazy_preset<windows_forms<net46>> },
  { "net46-wpf", &lazy_preset<wpf<net46>> },
  { "net461", &lazy_preset<net461> },
  { "net461-windowsforms", &lazy_preset<windows_forms<net461>> },
  { "net461-wpf", &lazy_preset<wpf<net461>> },
  { "net462", &lazy_preset<net462> },
  { "net462-windowsforms", &lazy_preset<windows_forms<net462>> },
  { "net462-wpf", &lazy_preset<wpf<net462>> },
  { "net47", &lazy_preset<net47> },
  { "net47-windowsforms", &lazy_preset<windows_forms<net47>> },
  { "net47-wpf", &lazy_preset<wpf<net47>> },
  { "net471", &lazy_preset<net471> },
  { "net471-windowsforms", &lazy_preset<windows_forms<net471>> },
  { "net471-wpf", &lazy_preset<wpf<net471>> },
  { "net472", &lazy_preset<net472> },
  { "net472-windowsforms", &lazy_preset<windows_forms<net472>> },
  { "net472-wpf", &lazy_preset<wpf<net472>> },
  { "net48", &lazy_preset<net48> },
  { "net48-windowsforms", &lazy_preset<windows_forms<net48>> },
  { "net48-wpf", &lazy_preset<wpf<net48>> },
  { "netcoreapp1.0", &lazy_preset<netcoreapp10> },
  { "netcoreapp1.1", &lazy_preset<netcoreapp11> },
  { "netcoreapp2.0", &lazy_preset<netcoreapp20> },
  { "netcoreapp2.1", &lazy_preset<netcoreapp21> },
  { "netstandard1.0", &lazy_preset<netstandard10> },
  { "netstandard1.1", &lazy_preset<netstandard11> },
  { "netstandard1.2", &lazy_preset<netstandard12> },
  { "netstandard1.3", &lazy_preset<netstandard13> },
  { "netstandard1.4", &lazy_preset<netstandard14> },
  { "netstandard1.5", &lazy_preset<netstandard15> },
  { "netstandard1.6", &lazy_preset<netstandard16> },
  { "netstandard2.0", &lazy_preset<netstandard20> },
};

}  // namespace

descriptor const *find(std::string_view name) {
  for (auto const &entry : kCatalog) {
    if (util_iequals(entry.name, name)) { return &entry.get(); }
  }
  return nullptr;
}

descriptor const &get(std::string_view name) {
  if (auto const *d{ find(name) }) { return *d; }
  throw parse_error("Unknown preset '" + std::string{ name } + "'");
}

std::vector<std::string> names() {
  std::vector<std::string> result;
  result.reserve(std::size(kCatalog));
  for (auto const &entry : kCatalog) { result.emplace_back(entry.name); }
  return result;
}

descriptor const &default_preset() { return lazy_preset<net472>(); }

}  // namespace refpack::presets
