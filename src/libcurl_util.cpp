#include "libcurl_util.h"

#include "errors.h"
#include "tui.h"

#include <curl/curl.h>

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#ifndef REFPACK_VERSION_STR
#error "REFPACK_VERSION_STR must be defined by the build system"
#endif

namespace refpack {

namespace {

constexpr char kDefaultUserAgent[]{ "refpack/" REFPACK_VERSION_STR };
constexpr long kHttpNotFound{ 404 };

size_t curl_write_file(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *stream{ static_cast<std::ofstream *>(userdata) };
  size_t const total{ size * nmemb };
  stream->write(ptr, static_cast<std::streamsize>(total));
  if (!*stream) { return 0; }
  return total;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int curl_xferinfo(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto const *stop{ static_cast<std::stop_token const *>(userdata) };
  return stop->stop_requested() ? 1 : 0;
}

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw io_error(std::string("curl_global_init failed: ") + curl_easy_strerror(code));
    }
  });
}

std::optional<std::filesystem::path> libcurl_download(std::string_view url,
                                                      std::filesystem::path const &destination,
                                                      std::stop_token const &stop) {
  throw_if_stopped(stop);
  libcurl_ensure_initialized();

  std::string const url_copy{ url };

  if (destination.empty()) { throw io_error("libcurl_download: destination is empty"); }

  std::filesystem::path resolved_destination{ destination };
  if (!resolved_destination.is_absolute()) {
    resolved_destination = std::filesystem::absolute(resolved_destination);
  }
  resolved_destination = resolved_destination.lexically_normal();

  std::error_code ec;
  auto const parent{ resolved_destination.parent_path() };
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw io_error("libcurl_download: failed to create parent directory: " +
                     parent.string() + ": " + ec.message());
    }
  }

  std::ofstream output{ resolved_destination, std::ios::binary | std::ios::trunc };
  if (!output.is_open()) {
    throw io_error("libcurl_download: failed to open destination: " +
                   resolved_destination.string());
  }

  auto const discard{ [&] {
    output.close();
    std::filesystem::remove(resolved_destination, ec);
  } };

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{ curl_easy_init(),
                                                              &curl_easy_cleanup };
  if (!handle) {
    discard();
    throw io_error("curl_easy_init failed");
  }

  auto const setopt = [handle = handle.get()](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(handle, option, value) };
    if (rc != CURLE_OK) {
      throw io_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
    }
  };

  try {
    setopt(CURLOPT_URL, url_copy.c_str());
    setopt(CURLOPT_FOLLOWLOCATION, 1L);
    setopt(CURLOPT_NOSIGNAL, 1L);
    setopt(CURLOPT_USERAGENT, kDefaultUserAgent);
    setopt(CURLOPT_WRITEFUNCTION, curl_write_file);
    setopt(CURLOPT_WRITEDATA, &output);
    setopt(CURLOPT_NOPROGRESS, 0L);
    setopt(CURLOPT_XFERINFOFUNCTION, curl_xferinfo);
    setopt(CURLOPT_XFERINFODATA, const_cast<std::stop_token *>(&stop));
  } catch (io_error const &) {
    discard();
    throw;
  }

  tui::debug("GET %s", url_copy.c_str());
  CURLcode const perform_result{ curl_easy_perform(handle.get()) };

  if (perform_result == CURLE_ABORTED_BY_CALLBACK && stop.stop_requested()) {
    discard();
    throw cancelled_error{};
  }
  if (perform_result != CURLE_OK) {
    discard();
    throw io_error("GET " + url_copy + " failed: " + curl_easy_strerror(perform_result));
  }

  long status{ 0 };
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status == kHttpNotFound) {
    discard();
    return std::nullopt;
  }
  if (status >= 400) {
    discard();
    throw io_error("GET " + url_copy + " failed: HTTP " + std::to_string(status));
  }

  output.flush();
  if (!output) {
    discard();
    throw io_error("libcurl_download: failed to flush destination file");
  }
  output.close();

  return resolved_destination;
}

}  // namespace refpack
