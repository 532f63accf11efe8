#include "package_version.h"

#include "errors.h"
#include "util.h"

#include <cctype>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace refpack {

namespace {

constexpr std::size_t kMaxComponentDigits{ 9 };

bool parse_component(std::string_view text, int &out) {
  if (text.empty() || text.size() > kMaxComponentDigits) { return false; }
  int value{ 0 };
  for (char const c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) { return false; }
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

bool is_valid_label(std::string_view label) {
  if (label.empty()) { return false; }
  for (auto const &identifier : util_split(label, '.')) {
    for (char const c : identifier) {
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') { return false; }
    }
  }
  // util_split drops empty tokens, so "a..b" and "a." need an explicit check.
  return label.front() != '.' && label.back() != '.' &&
         label.find("..") == std::string_view::npos;
}

semver::version<> make_precedence(int major,
                                  int minor,
                                  int patch,
                                  std::string const &prerelease) {
  std::string text{ std::to_string(major) + "." + std::to_string(minor) + "." +
                    std::to_string(patch) };
  if (!prerelease.empty()) { text += "-" + util_to_lower(prerelease); }

  semver::version<> result;
  if (!semver::parse(text, result)) {
    throw parse_error("invalid package version: '" + text + "'");
  }
  return result;
}

}  // namespace

package_version::package_version() : precedence_{ make_precedence(0, 0, 0, {}) } {}

package_version::package_version(int major, int minor, int patch, std::string prerelease)
    : major_{ major },
      minor_{ minor },
      patch_{ patch },
      prerelease_{ std::move(prerelease) },
      precedence_{ make_precedence(major_, minor_, patch_, prerelease_) } {
  if (major_ < 0 || minor_ < 0 || patch_ < 0) {
    throw parse_error("package version components must be non-negative");
  }
  if (!prerelease_.empty() && !is_valid_label(prerelease_)) {
    throw parse_error("invalid prerelease label: '" + prerelease_ + "'");
  }
}

std::optional<package_version> package_version::try_parse(std::string_view text) {
  try {
    return parse(text);
  } catch (parse_error const &) { return std::nullopt; }
}

package_version package_version::parse(std::string_view text) {
  std::string_view const trimmed{ util_trim(text) };
  if (trimmed.empty()) { throw parse_error("empty package version"); }

  std::string_view core{ trimmed };
  if (auto const plus{ core.find('+') }; plus != std::string_view::npos) {
    if (!is_valid_label(core.substr(plus + 1))) {
      throw parse_error("invalid build metadata in version: '" + std::string{ trimmed } +
                        "'");
    }
    core = core.substr(0, plus);
  }

  std::string prerelease;
  if (auto const dash{ core.find('-') }; dash != std::string_view::npos) {
    prerelease = std::string{ core.substr(dash + 1) };
    if (!is_valid_label(prerelease)) {
      throw parse_error("invalid prerelease label in version: '" + std::string{ trimmed } +
                        "'");
    }
    core = core.substr(0, dash);
  }

  std::vector<int> parts;
  for (std::string_view rest{ core };;) {
    auto const dot{ rest.find('.') };
    int value{ 0 };
    if (!parse_component(rest.substr(0, dot), value)) {
      throw parse_error("invalid package version: '" + std::string{ trimmed } + "'");
    }
    parts.push_back(value);
    if (dot == std::string_view::npos) { break; }
    rest = rest.substr(dot + 1);
  }

  if (parts.size() > 4) {
    throw parse_error("too many version components: '" + std::string{ trimmed } + "'");
  }
  parts.resize(4, 0);

  package_version result{ parts[0], parts[1], parts[2], std::move(prerelease) };
  result.revision_ = parts[3];
  return result;
}

std::string package_version::to_string() const {
  std::string result{ std::to_string(major_) + "." + std::to_string(minor_) + "." +
                      std::to_string(patch_) };
  if (revision_ != 0) { result += "." + std::to_string(revision_); }
  if (!prerelease_.empty()) { result += "-" + prerelease_; }
  return result;
}

std::string package_version::to_lower_string() const { return util_to_lower(to_string()); }

bool operator==(package_version const &lhs, package_version const &rhs) {
  return lhs.revision_ == rhs.revision_ && lhs.precedence_ == rhs.precedence_;
}

std::strong_ordering operator<=>(package_version const &lhs, package_version const &rhs) {
  if (auto const core{ std::tie(lhs.major_, lhs.minor_, lhs.patch_, lhs.revision_) <=>
                       std::tie(rhs.major_, rhs.minor_, rhs.patch_, rhs.revision_) };
      core != 0) {
    return core;
  }
  if (lhs.precedence_ < rhs.precedence_) { return std::strong_ordering::less; }
  if (rhs.precedence_ < lhs.precedence_) { return std::strong_ordering::greater; }
  return std::strong_ordering::equal;
}

}  // namespace refpack
