#include "version_range.h"

#include "errors.h"
#include "util.h"

#include <string>

namespace refpack {

namespace {

[[noreturn]] void throw_bad_range(std::string_view text, char const *why) {
  throw parse_error("invalid version range '" + std::string{ text } + "': " + why);
}

}  // namespace

version_range version_range::exact(package_version const &v) {
  version_range r;
  r.min_ = v;
  r.max_ = v;
  r.min_inclusive_ = true;
  r.max_inclusive_ = true;
  return r;
}

version_range version_range::at_least(package_version const &v) {
  version_range r;
  r.min_ = v;
  r.min_inclusive_ = true;
  return r;
}

version_range version_range::parse(std::string_view text) {
  std::string_view const trimmed{ util_trim(text) };
  if (trimmed.empty() || trimmed == "*") { return version_range{}; }

  char const open{ trimmed.front() };
  if (open != '[' && open != '(') { return at_least(package_version::parse(trimmed)); }

  if (trimmed.size() < 2) { throw_bad_range(trimmed, "missing closing bracket"); }
  char const close{ trimmed.back() };
  if (close != ']' && close != ')') { throw_bad_range(trimmed, "missing closing bracket"); }

  std::string_view const body{ util_trim(trimmed.substr(1, trimmed.size() - 2)) };
  auto const comma{ body.find(',') };

  version_range r;
  if (comma == std::string_view::npos) {
    if (open != '[' || close != ']' || body.empty()) {
      throw_bad_range(trimmed, "single-version ranges must use [x]");
    }
    return exact(package_version::parse(body));
  }
  if (body.find(',', comma + 1) != std::string_view::npos) {
    throw_bad_range(trimmed, "too many commas");
  }

  std::string_view const lo{ util_trim(body.substr(0, comma)) };
  std::string_view const hi{ util_trim(body.substr(comma + 1)) };
  if (lo.empty() && hi.empty()) { throw_bad_range(trimmed, "no bounds"); }

  if (!lo.empty()) {
    r.min_ = package_version::parse(lo);
    r.min_inclusive_ = open == '[';
  }
  if (!hi.empty()) {
    r.max_ = package_version::parse(hi);
    r.max_inclusive_ = close == ']';
  }

  if (r.min_ && r.max_) {
    if (*r.min_ > *r.max_) { throw_bad_range(trimmed, "minimum exceeds maximum"); }
    if (*r.min_ == *r.max_ && !(r.min_inclusive_ && r.max_inclusive_)) {
      throw_bad_range(trimmed, "empty range");
    }
  }
  return r;
}

bool version_range::satisfies(package_version const &v) const {
  if (min_) {
    if (min_inclusive_ ? v < *min_ : v <= *min_) { return false; }
  }
  if (max_) {
    if (max_inclusive_ ? v > *max_ : v >= *max_) { return false; }
  }
  return true;
}

std::string version_range::to_string() const {
  if (!min_ && !max_) { return "*"; }
  if (min_ && !max_ && min_inclusive_) { return min_->to_string(); }
  if (min_ && max_ && min_inclusive_ && max_inclusive_ && *min_ == *max_) {
    return "[" + min_->to_string() + "]";
  }

  std::string out{ min_inclusive_ ? "[" : "(" };
  if (min_) { out += min_->to_string(); }
  out += ", ";
  if (max_) { out += max_->to_string(); }
  out += max_inclusive_ ? "]" : ")";
  return out;
}

}  // namespace refpack
