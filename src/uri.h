#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace refpack {

enum class uri_scheme { HTTP, HTTPS, LOCAL_FILE_ABSOLUTE, LOCAL_FILE_RELATIVE, UNKNOWN };

struct uri_info {
  uri_scheme scheme;
  std::string canonical;
};

// Classifies a package source: http(s) feeds, or local folders given as paths
// or file:// URIs (canonical is then the local path).
uri_info uri_classify(std::string_view value);

std::filesystem::path uri_resolve_local_file_relative(
    std::string_view local_file,
    std::optional<std::filesystem::path> const &anchor);

// Appends a path segment, inserting exactly one '/' between the two.
std::string uri_join(std::string_view base, std::string_view segment);

}  // namespace refpack
