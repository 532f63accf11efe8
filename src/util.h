#pragma once

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace refpack {

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// ASCII lowercase copy; package ids and framework names are ASCII by convention.
std::string util_to_lower(std::string_view value);

bool util_iequals(std::string_view lhs, std::string_view rhs);
bool util_istarts_with(std::string_view value, std::string_view prefix);
bool util_iends_with(std::string_view value, std::string_view suffix);

std::string_view util_trim(std::string_view value);

// Split on a single delimiter, dropping empty (after trim) tokens.
std::vector<std::string> util_split(std::string_view value, char delimiter);

std::string util_bytes_to_hex(void const *data, std::size_t length);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as bytes.
// Throws io_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Write bytes to path, replacing existing content. Throws io_error on failure.
void util_write_file(std::filesystem::path const &path, std::string_view content);

// Random hex suffix for scratch directory names.
std::string util_random_suffix();

// Removes the path (recursively) on destruction unless reset to empty.
class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  void release() { path_.clear(); }
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace refpack
