#include "uri.h"

#include "util.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace refpack {
namespace {

std::string strip_file_scheme(std::string_view uri) {
  std::string cand{ uri.substr(7) };

  if (!cand.empty() && cand[0] == '/' && cand.size() > 1 && cand[1] == '/') { return cand; }

  auto const slash{ cand.find('/') };
  if (slash == std::string::npos) { return cand; }

  std::string_view const host{ std::string_view{ cand }.substr(0, slash) };
  std::string_view const tail{ std::string_view{ cand }.substr(slash) };

  if (host.empty() || util_iequals(host, "localhost")) { return std::string{ tail }; }
  if (host.find(':') != std::string_view::npos) { return cand; }

  return std::string{ "//" }.append(host).append(tail);
}

std::filesystem::path base_directory(std::optional<std::filesystem::path> const &root) {
  if (root && !root->empty()) { return std::filesystem::absolute(*root); }
  return std::filesystem::current_path();
}

}  // namespace

uri_info uri_classify(std::string_view value) {
  auto canonical{ std::string{ util_trim(value) } };
  if (canonical.empty()) { return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) }; }

  if (util_istarts_with(canonical, "https://")) {
    return uri_info{ uri_scheme::HTTPS, std::move(canonical) };
  }
  if (util_istarts_with(canonical, "http://")) {
    return uri_info{ uri_scheme::HTTP, std::move(canonical) };
  }

  std::string local_source{};

  if (util_istarts_with(canonical, "file://")) {
    local_source = strip_file_scheme(canonical);
  } else {
    if (canonical.find("://") != std::string_view::npos) {
      return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) };
    }
    local_source = canonical;
  }

  uri_scheme const scheme{ std::filesystem::path{ local_source }.is_absolute()
                               ? uri_scheme::LOCAL_FILE_ABSOLUTE
                               : uri_scheme::LOCAL_FILE_RELATIVE };
  return uri_info{ scheme, std::move(local_source) };
}

std::filesystem::path uri_resolve_local_file_relative(
    std::string_view local_file,
    std::optional<std::filesystem::path> const &anchor) {
  auto const trimmed{ util_trim(local_file) };
  if (trimmed.empty()) { throw std::invalid_argument("resolve_local_uri: empty value"); }

  auto const info{ uri_classify(trimmed) };
  auto const scheme{ info.scheme };
  if (scheme != uri_scheme::LOCAL_FILE_ABSOLUTE &&
      scheme != uri_scheme::LOCAL_FILE_RELATIVE) {
    throw std::invalid_argument("resolve_local_uri: value is not a local file");
  }

  auto const &raw_path{ info.canonical };
  if (raw_path.empty()) {
    throw std::invalid_argument("resolve_local_uri: resolved path is empty");
  }

  std::filesystem::path resolved{ raw_path };
  if (scheme == uri_scheme::LOCAL_FILE_RELATIVE) {
    resolved = std::filesystem::absolute(base_directory(anchor) / resolved);
  }
  return resolved.lexically_normal();
}

std::string uri_join(std::string_view base, std::string_view segment) {
  std::string result{ base };
  while (!result.empty() && result.back() == '/') { result.pop_back(); }
  while (!segment.empty() && segment.front() == '/') { segment.remove_prefix(1); }
  result.push_back('/');
  result.append(segment);
  return result;
}

}  // namespace refpack
