#include "util.h"

#include "errors.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <random>
#include <ranges>
#include <string>
#include <system_error>
#include <utility>

namespace refpack {

namespace {

constexpr auto to_lower = [](unsigned char c) { return std::tolower(c); };

}  // namespace

std::string util_to_lower(std::string_view value) {
  std::string result{ value };
  std::ranges::transform(result, result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

bool util_iequals(std::string_view lhs, std::string_view rhs) {
  return std::ranges::equal(lhs, rhs, {}, to_lower, to_lower);
}

bool util_istarts_with(std::string_view value, std::string_view prefix) {
  if (prefix.size() > value.size()) { return false; }
  return util_iequals(value.substr(0, prefix.size()), prefix);
}

bool util_iends_with(std::string_view value, std::string_view suffix) {
  if (suffix.size() > value.size()) { return false; }
  return util_iequals(value.substr(value.size() - suffix.size()), suffix);
}

std::string_view util_trim(std::string_view value) {
  auto const first{ value.find_first_not_of(" \t\n\r\f\v") };
  if (first == std::string_view::npos) { return {}; }

  auto const last{ value.find_last_not_of(" \t\n\r\f\v") };
  return value.substr(first, last - first + 1);
}

std::vector<std::string> util_split(std::string_view value, char delimiter) {
  std::vector<std::string> tokens;
  for (std::string_view sv{ value }; !sv.empty();) {
    auto const pos{ sv.find(delimiter) };
    auto const token{ util_trim(sv.substr(0, pos)) };
    if (!token.empty()) { tokens.emplace_back(token); }
    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
  }
  return tokens;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) { throw io_error("util_load_file: failed to open file: " + path.string()); }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw io_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw io_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw io_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw io_error("util_load_file: failed to read entire file: " + path.string());
    }
  }

  return buffer;
}

void util_write_file(std::filesystem::path const &path, std::string_view content) {
  auto file{ util_open_file(path, "wb") };
  if (!file) { throw io_error("util_write_file: failed to open file: " + path.string()); }

  if (!content.empty() &&
      std::fwrite(content.data(), 1, content.size(), file.get()) != content.size()) {
    throw io_error("util_write_file: failed to write file: " + path.string());
  }

  if (std::fflush(file.get()) != 0) {
    throw io_error("util_write_file: failed to flush file: " + path.string());
  }
}

std::string util_bytes_to_hex(void const *data, std::size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (std::size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

std::string util_random_suffix() {
  static thread_local std::mt19937_64 rng{ std::random_device{}() };
  char buf[17]{};
  std::snprintf(buf, sizeof buf, "%016llx", static_cast<unsigned long long>(rng()));
  return buf;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace refpack
