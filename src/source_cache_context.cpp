#include "source_cache_context.h"

#include "errors.h"
#include "tui.h"

#include <system_error>

namespace refpack {

source_cache_context::source_cache_context(path const &scratch_root)
    : dir_{ scratch_root / (".scratch-" + util_random_suffix()) } {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    throw io_error("Failed to create scratch directory " + dir_.string() + ": " +
                   ec.message());
  }
}

source_cache_context::~source_cache_context() {
  std::error_code ec;
  std::filesystem::remove_all(dir_, ec);
  if (ec) { tui::warn("Failed to remove %s: %s", dir_.string().c_str(), ec.message().c_str()); }
}

source_cache_context::path source_cache_context::file_for(package_identity const &identity,
                                                          char const *extension) const {
  return dir_ / (util_to_lower(identity.id) + "." + identity.version.to_lower_string() + "." +
                 extension);
}

std::optional<source_cache_context::path> source_cache_context::find_download(
    package_identity const &identity) const {
  std::lock_guard const lock{ mutex_ };
  if (auto const it{ downloads_.find(identity) }; it != downloads_.end()) { return it->second; }
  return std::nullopt;
}

void source_cache_context::record_download(package_identity const &identity,
                                           path const &nupkg) {
  std::lock_guard const lock{ mutex_ };
  downloads_.insert_or_assign(identity, nupkg);
}

std::size_t source_cache_context::download_count() const {
  std::lock_guard const lock{ mutex_ };
  return downloads_.size();
}

}  // namespace refpack
