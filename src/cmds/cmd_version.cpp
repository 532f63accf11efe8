#include "cmd_version.h"

#include "platform.h"
#include "tui.h"

#include "CLI11.hpp"
#include "archive.h"
#include "mbedtls/version.h"
#include "semver.hpp"

#include <curl/curl.h>

#include <array>
#include <string>
#include <utility>
#include <vector>

#ifndef REFPACK_VERSION_STR
#error "REFPACK_VERSION_STR must be defined by the build system"
#endif

namespace refpack {

cmd_version::cmd_version(cmd_version::cfg cfg, settings_overrides const & /*overrides*/)
    : cfg_{ std::move(cfg) } {}

void cmd_version::execute(std::stop_token const & /*stop*/) {
  tui::info("refpack version %s (%s)",
            REFPACK_VERSION_STR,
            platform::get_exe_path().string().c_str());
  tui::info("");
  tui::info("Third-party component versions:");

  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  std::vector<std::string> curl_features;
  if (curl_info->features & CURL_VERSION_SSL) { curl_features.push_back("ssl"); }
  if (curl_info->features & CURL_VERSION_LIBZ) { curl_features.push_back("zlib"); }
  if (curl_info->features & CURL_VERSION_HTTP2) { curl_features.push_back("http2"); }
  if (!curl_features.empty()) {
    std::string features;
    for (size_t i{ 0 }; i < curl_features.size(); ++i) {
      if (i > 0) features.append(", ");
      features.append(curl_features[i]);
    }
    tui::info("  libcurl: %s (%s)", curl_info->version, features.c_str());
  } else {
    tui::info("  libcurl: %s", curl_info->version);
  }

  std::array<char, 32> mbedtls_version{};
  mbedtls_version_get_string_full(mbedtls_version.data());
  tui::info("  mbedTLS: %s", mbedtls_version.data());

  tui::info("  libarchive: %s", archive_version_details());
  tui::info("  Semver: %d.%d.%d",
            SEMVER_VERSION_MAJOR,
            SEMVER_VERSION_MINOR,
            SEMVER_VERSION_PATCH);
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace refpack
