#include "package_cache.h"

#include "errors.h"
#include "extract.h"
#include "sha512.h"
#include "trace.h"
#include "tui.h"

#include <cstdint>
#include <system_error>
#include <utility>

namespace refpack {

namespace {

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

void create_root(std::filesystem::path const &root) {
  std::error_code ec;
  std::filesystem::create_directories(root, ec);
  if (ec) {
    throw io_error("Failed to create package cache " + root.string() + ": " + ec.message());
  }
}

// Reports a held lock before blocking on it and turns OS failures into io_error.
platform::file_lock acquire(std::filesystem::path const &lock_path,
                            std::string const &owner,
                            std::stop_token const &stop) {
  try {
    return platform::file_lock{ lock_path, stop, [&] {
      tui::warn("%s: waiting for cache lock %s", owner.c_str(), lock_path.string().c_str());
    } };
  } catch (std::system_error const &e) {
    throw io_error("Failed to lock package cache " + lock_path.string() + ": " + e.what());
  }
}

}  // namespace

package_cache::scoped_lock::scoped_lock(path lock_path,
                                        std::string owner,
                                        std::stop_token const &stop)
    : lock_path_{ std::move(lock_path) },
      owner_{ std::move(owner) },
      wait_start_{ std::chrono::steady_clock::now() },
      lock_{ acquire(lock_path_, owner_, stop) },
      acquired_at_{ std::chrono::steady_clock::now() } {
  REFPACK_TRACE_LOCK_ACQUIRED(owner_, lock_path_.string(), elapsed_ms(wait_start_));
}

package_cache::scoped_lock::~scoped_lock() {
  REFPACK_TRACE_LOCK_RELEASED(owner_, lock_path_.string(), elapsed_ms(acquired_at_));
}

package_cache::package_cache(package_path_resolver local,
                             std::optional<package_path_resolver> global)
    : local_{ std::move(local) }, global_{ std::move(global) } {}

std::unique_ptr<package_cache::scoped_lock> package_cache::lock(
    std::string owner,
    std::stop_token const &stop) const {
  create_root(local_.root());
  return std::make_unique<scoped_lock>(lock_path(), std::move(owner), stop);
}

std::optional<package_cache::path> package_cache::installed_path(
    package_identity const &identity) const {
  if (auto const local{ local_.installed_path(identity) }) {
    REFPACK_TRACE_CACHE_HIT(identity.to_string(), local->string(), "local");
    return local;
  }
  if (global_) {
    if (auto const global{ global_->installed_path(identity) }) {
      REFPACK_TRACE_CACHE_HIT(identity.to_string(), global->string(), "global");
      return global;
    }
  }
  REFPACK_TRACE_CACHE_MISS(identity.to_string());
  return std::nullopt;
}

package_cache::path package_cache::install(package_identity const &identity,
                                           path const &nupkg,
                                           std::stop_token const &stop) const {
  throw_if_stopped(stop);
  create_root(local_.root());

  auto const start{ std::chrono::steady_clock::now() };
  auto const target{ local_.install_path(identity) };
  auto const staging{ local_.root() / (".staging-" + util_random_suffix()) };
  scoped_path_cleanup cleanup{ staging };

  std::error_code ec;
  std::filesystem::create_directories(staging, ec);
  if (ec) {
    throw io_error("Failed to create staging directory " + staging.string() + ": " +
                   ec.message());
  }

  auto const files{ extract_nupkg(nupkg, staging, stop) };

  std::filesystem::copy_file(nupkg,
                             staging / package_path_resolver::nupkg_file_name(identity),
                             std::filesystem::copy_options::overwrite_existing,
                             ec);
  if (ec) {
    throw io_error("Failed to copy " + nupkg.string() + " into cache: " + ec.message());
  }
  std::string const digest{ sha512_base64(sha512(nupkg)) };
  throw_if_stopped(stop);

  // A directory without a marker is a leftover from an interrupted install.
  std::filesystem::remove_all(target, ec);
  if (ec) { throw io_error("Failed to remove " + target.string() + ": " + ec.message()); }

  try {
    platform::atomic_rename(staging, target);
    cleanup.release();

    auto const marker{ target / package_path_resolver::marker_file_name(identity) };
    auto const marker_tmp{ marker.string() + ".tmp" };
    util_write_file(marker_tmp, digest);
    platform::atomic_rename(marker_tmp, marker);
  } catch (std::system_error const &e) {
    throw io_error(std::string{ "Failed to install " } + identity.to_string() + ": " + e.what());
  }

  auto const duration{ elapsed_ms(start) };
  REFPACK_TRACE_PACKAGE_EXTRACTED(identity.to_string(),
                                  target.string(),
                                  static_cast<std::int64_t>(files),
                                  duration);
  tui::debug("installed %s into %s (%llu files, %lld ms)",
             identity.to_string().c_str(),
             target.string().c_str(),
             static_cast<unsigned long long>(files),
             static_cast<long long>(duration));
  return target;
}

}  // namespace refpack
