#pragma once

#include <filesystem>
#include <optional>
#include <stop_token>
#include <string_view>

namespace refpack {

void libcurl_ensure_initialized();

// Downloads `url` into `destination`. Returns nullopt when the server answers
// 404, throws io_error for every other failure and cancelled_error on stop.
std::optional<std::filesystem::path> libcurl_download(std::string_view url,
                                                      std::filesystem::path const &destination,
                                                      std::stop_token const &stop = {});

}  // namespace refpack
