#include "framework.h"

#include "util.h"

#include <cctype>
#include <string>
#include <utility>

namespace refpack {

namespace {

bool all_digits(std::string_view text) {
  for (char const c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) { return false; }
  }
  return true;
}

// "2.0", "10.0.1"; at most three numeric components.
std::optional<framework_version> parse_dotted(std::string_view text) {
  framework_version v;
  int *const slots[]{ &v.major, &v.minor, &v.build };
  std::size_t index{ 0 };
  while (true) {
    auto const dot{ text.find('.') };
    std::string_view const part{ text.substr(0, dot) };
    if (part.empty() || part.size() > 6 || !all_digits(part) || index >= 3) {
      return std::nullopt;
    }
    int value{ 0 };
    for (char const c : part) { value = value * 10 + (c - '0'); }
    *slots[index++] = value;
    if (dot == std::string_view::npos) { break; }
    text = text.substr(dot + 1);
  }
  return v;
}

// .NETFramework folder names use one digit per component: "472" is 4.7.2.
std::optional<framework_version> parse_compact(std::string_view digits) {
  if (digits.empty() || digits.size() > 3) { return std::nullopt; }
  framework_version v;
  v.major = digits[0] - '0';
  if (digits.size() > 1) { v.minor = digits[1] - '0'; }
  if (digits.size() > 2) { v.build = digits[2] - '0'; }
  return v;
}

std::optional<framework_version> parse_version_part(std::string_view rest, bool compact) {
  if (rest.empty()) { return framework_version{}; }
  if (rest.find('.') == std::string_view::npos && all_digits(rest)) {
    if (compact) { return parse_compact(rest); }
    return parse_dotted(rest);
  }
  return parse_dotted(rest);
}

// Highest netstandard version a framework/coreapp target can consume.
std::optional<framework_version> max_netstandard_for(framework const &target) {
  auto const &v{ target.version() };
  switch (target.get_family()) {
    case framework::family::net_framework:
      if (v >= framework_version{ 4, 6, 1 }) { return framework_version{ 2, 0, 0 }; }
      if (v >= framework_version{ 4, 6, 0 }) { return framework_version{ 1, 3, 0 }; }
      if (v >= framework_version{ 4, 5, 1 }) { return framework_version{ 1, 2, 0 }; }
      if (v >= framework_version{ 4, 5, 0 }) { return framework_version{ 1, 1, 0 }; }
      return std::nullopt;
    case framework::family::net_core_app:
      if (v.major >= 3) { return framework_version{ 2, 1, 0 }; }
      if (v.major == 2) { return framework_version{ 2, 0, 0 }; }
      if (v.major == 1) { return framework_version{ 1, 6, 0 }; }
      return std::nullopt;
    default: return std::nullopt;
  }
}

}  // namespace

framework::framework(family fam, framework_version version, std::string identifier)
    : family_{ fam }, version_{ version }, identifier_{ std::move(identifier) } {
  if (identifier_.empty()) {
    switch (family_) {
      case family::net_framework: identifier_ = "net"; break;
      case family::net_core_app: identifier_ = "netcoreapp"; break;
      case family::net_standard: identifier_ = "netstandard"; break;
      case family::any: identifier_ = "any"; break;
      default: break;
    }
  }
}

framework framework::parse(std::string_view short_folder_name) {
  std::string name{ util_to_lower(util_trim(short_folder_name)) };
  framework unsupported{ family::unsupported, {}, name };

  if (name.empty() || name.starts_with("portable")) { return unsupported; }
  if (auto const dash{ name.find('-') }; dash != std::string::npos) { name.resize(dash); }
  if (name.empty()) { return unsupported; }
  if (name == "any") { return any_framework(); }

  // Long form used in nuspec files: ".NETFramework4.5" or ".NETFramework,Version=v4.5".
  if (name.front() == '.') {
    name.erase(0, 1);
    if (auto const comma{ name.find(",version=v") }; comma != std::string::npos) {
      name = name.substr(0, comma) + name.substr(comma + 10);
    }
    if (name.starts_with("netframework")) {
      auto const v{ parse_dotted(std::string_view{ name }.substr(12)) };
      if (!v) { return unsupported; }
      return framework{ family::net_framework, *v };
    }
  }

  std::size_t letters{ 0 };
  while (letters < name.size() && std::isalpha(static_cast<unsigned char>(name[letters]))) {
    ++letters;
  }
  if (letters == 0) { return unsupported; }

  std::string const moniker{ name.substr(0, letters) };
  std::string_view const rest{ std::string_view{ name }.substr(letters) };

  if (moniker == "net") {
    bool const dotted{ rest.find('.') != std::string_view::npos };
    auto const v{ parse_version_part(rest, !dotted) };
    if (!v) { return unsupported; }
    if (v->major >= 5) { return framework{ family::net_core_app, *v }; }
    return framework{ family::net_framework, *v };
  }

  if (moniker == "netstandard" || moniker == "netcoreapp") {
    bool const dotted{ rest.find('.') != std::string_view::npos };
    auto const v{ parse_version_part(rest, !dotted) };
    if (!v) { return unsupported; }
    return framework{ moniker == "netstandard" ? family::net_standard : family::net_core_app,
                      *v };
  }

  auto const v{ parse_version_part(rest, false) };
  if (!v) { return unsupported; }
  return framework{ family::generic, *v, moniker };
}

bool framework::is_compatible_with(framework const &target) const {
  if (is_unsupported() || target.is_unsupported()) { return false; }
  if (family_ == family::any) { return true; }
  if (target.family_ == family::any) { return false; }

  if (family_ == target.family_ && identifier_ == target.identifier_) {
    return version_ <= target.version_;
  }

  if (family_ == family::net_standard) {
    auto const max{ max_netstandard_for(target) };
    return max && version_ <= *max;
  }
  return false;
}

std::string framework::to_string() const {
  switch (family_) {
    case family::any: return "any";
    case family::unsupported: return identifier_;
    case family::net_framework: {
      std::string out{ "net" + std::to_string(version_.major) + std::to_string(version_.minor) };
      if (version_.build != 0) { out += std::to_string(version_.build); }
      return out;
    }
    case family::net_core_app:
      if (version_.major >= 5) {
        return "net" + std::to_string(version_.major) + "." + std::to_string(version_.minor);
      }
      [[fallthrough]];
    default: {
      std::string out{ identifier_ + std::to_string(version_.major) + "." +
                       std::to_string(version_.minor) };
      if (version_.build != 0) { out += "." + std::to_string(version_.build); }
      return out;
    }
  }
}

std::optional<std::size_t> framework_nearest(framework const &target,
                                             std::vector<framework> const &candidates) {
  auto const tier{ [&](framework const &f) {
    if (f.get_family() == framework::family::any) { return 2; }
    if (f.get_family() == target.get_family() && f.identifier() == target.identifier()) {
      return 0;
    }
    return 1;
  } };

  std::optional<std::size_t> best;
  for (std::size_t i{ 0 }; i < candidates.size(); ++i) {
    auto const &candidate{ candidates[i] };
    if (!candidate.is_compatible_with(target)) { continue; }
    if (!best) {
      best = i;
      continue;
    }
    auto const &current{ candidates[*best] };
    int const ct{ tier(candidate) };
    int const bt{ tier(current) };
    if (ct < bt || (ct == bt && candidate.version() > current.version())) { best = i; }
  }
  return best;
}

}  // namespace refpack
