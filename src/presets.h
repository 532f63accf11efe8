#pragma once

#include "descriptor.h"

#include <string>
#include <string_view>
#include <vector>

namespace refpack::presets {

inline constexpr char kLanguageCSharp[]{ "C#" };
inline constexpr char kLanguageVisualBasic[]{ "Visual Basic" };

// Version of the Microsoft.NETFramework.ReferenceAssemblies.* packages.
inline constexpr char kReferenceAssembliesPackageVersion[]{ "1.0.0-preview.2" };

// Named descriptors for the supported target platforms. Each is created on
// first access and lives for the rest of the process.
descriptor const *find(std::string_view name);

// Throws parse_error for an unknown name.
descriptor const &get(std::string_view name);

// Catalog names in declaration order.
std::vector<std::string> names();

// net472.
descriptor const &default_preset();

}  // namespace refpack::presets
