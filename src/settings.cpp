#include "settings.h"

#include "platform.h"
#include "util.h"

#include <cstdlib>

namespace refpack {

settings settings::load(settings_overrides const &overrides) {
  settings result;

  result.packages_root = overrides.packages_root ? *overrides.packages_root
                                                 : platform::get_default_packages_root();
  result.global_packages = overrides.global_packages
                               ? overrides.global_packages
                               : platform::get_default_global_packages_folder();

  if (!overrides.sources.empty()) {
    result.sources = overrides.sources;
  } else if (char const *env{ std::getenv("REFPACK_SOURCES") }; env && *env) {
    result.sources = util_split(env, ';');
  }
  if (result.sources.empty()) { result.sources.emplace_back(kDefaultPackageSource); }

  return result;
}

}  // namespace refpack
