#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace refpack {

namespace trace_events {

struct registry_query {
  std::string package;
  std::string registry;
  bool found;
  std::int64_t duration_ms;
};

struct registry_miss {
  std::string package;
};

struct cache_hit {
  std::string package;
  std::string installed_path;
  std::string tier;  // "local" or "global"
};

struct cache_miss {
  std::string package;
};

struct lock_acquired {
  std::string owner;
  std::string lock_path;
  std::int64_t wait_duration_ms;
};

struct lock_released {
  std::string owner;
  std::string lock_path;
  std::int64_t hold_duration_ms;
};

struct package_downloaded {
  std::string package;
  std::string registry;
  std::string path;
  std::int64_t duration_ms;
};

struct package_extracted {
  std::string package;
  std::string destination;
  std::int64_t files_extracted;
  std::int64_t duration_ms;
};

struct package_skipped {
  std::string package;
  std::string reason;
};

struct memo_hit {
  std::string target_framework;
  std::string language;
  bool after_lock;
};

struct resolve_complete {
  std::string target_framework;
  std::string language;
  std::int64_t assembly_count;
  std::int64_t duration_ms;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::registry_query,
                                   trace_events::registry_miss,
                                   trace_events::cache_hit,
                                   trace_events::cache_miss,
                                   trace_events::lock_acquired,
                                   trace_events::lock_released,
                                   trace_events::package_downloaded,
                                   trace_events::package_extracted,
                                   trace_events::package_skipped,
                                   trace_events::memo_hit,
                                   trace_events::resolve_complete>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace refpack

#define REFPACK_TRACE_UNLIKELY [[unlikely]]

#define REFPACK_TRACE_EMIT(event_expr) \
  do { \
    if (::refpack::tui::g_trace_enabled) REFPACK_TRACE_UNLIKELY { \
        ::refpack::tui::trace event_expr; \
      } \
  } while (0)

#define REFPACK_TRACE_REGISTRY_QUERY(package_value, \
                                     registry_value, \
                                     found_value, \
                                     duration_value) \
  REFPACK_TRACE_EMIT((::refpack::trace_events::registry_query{ \
      .package = (package_value), \
      .registry = (registry_value), \
      .found = (found_value), \
      .duration_ms = (duration_value), \
  }))

#define REFPACK_TRACE_REGISTRY_MISS(package_value) \
  REFPACK_TRACE_EMIT((::refpack::trace_events::registry_miss{ \
      .package = (package_value), \
  }))

#define REFPACK_TRACE_CACHE_HIT(package_value, installed_path_value, tier_value) \
  REFPACK_TRACE_EMIT((::refpack::trace_events::cache_hit{ \
      .package = (package_value), \
      .installed_path = (installed_path_value), \
      .tier = (tier_value), \
  }))

#define REFPACK_TRACE_CACHE_MISS(package_value) \
  REFPACK_TRACE_EMIT((::refpack::trace_events::cache_miss{ \
      .package = (package_value), \
  }))

#define REFPACK_TRACE_LOCK_ACQUIRED(owner_value, lock_path_value, wait_duration_value) \
  REFPACK_TRACE_EMIT((::refpack::trace_events::lock_acquired{ \
      .owner = (owner_value), \
      .lock_path = (lock_path_value), \
      .wait_duration_ms = (wait_duration_value), \
  }))

#define REFPACK_TRACE_LOCK_RELEASED(owner_value, lock_path_value, hold_duration_value) \
  REFPACK_TRACE_EMIT((::refpack::trace_events::lock_released{ \
      .owner = (owner_value), \
      .lock_path = (lock_path_value), \
      .hold_duration_ms = (hold_duration_value), \
  }))

#define REFPACK_TRACE_PACKAGE_DOWNLOADED(package_value, \
                                         registry_value, \
                                         path_value, \
                                         duration_value) \
  REFPACK_TRACE_EMIT((::refpack::trace_events::package_downloaded{ \
      .package = (package_value), \
      .registry = (registry_value), \
      .path = (path_value), \
      .duration_ms = (duration_value), \
  }))

#define REFPACK_TRACE_PACKAGE_EXTRACTED(package_value, \
                                        destination_value, \
                                        files_extracted_value, \
                                        duration_value) \
  REFPACK_TRACE_EMIT((::refpack::trace_events::package_extracted{ \
      .package = (package_value), \
      .destination = (destination_value), \
      .files_extracted = (files_extracted_value), \
      .duration_ms = (duration_value), \
  }))

#define REFPACK_TRACE_PACKAGE_SKIPPED(package_value, reason_value) \
  REFPACK_TRACE_EMIT((::refpack::trace_events::package_skipped{ \
      .package = (package_value), \
      .reason = (reason_value), \
  }))

#define REFPACK_TRACE_MEMO_HIT(target_framework_value, language_value, after_lock_value) \
  REFPACK_TRACE_EMIT((::refpack::trace_events::memo_hit{ \
      .target_framework = (target_framework_value), \
      .language = (language_value), \
      .after_lock = (after_lock_value), \
  }))

#define REFPACK_TRACE_RESOLVE_COMPLETE(target_framework_value, \
                                       language_value, \
                                       assembly_count_value, \
                                       duration_value) \
  REFPACK_TRACE_EMIT((::refpack::trace_events::resolve_complete{ \
      .target_framework = (target_framework_value), \
      .language = (language_value), \
      .assembly_count = (assembly_count_value), \
      .duration_ms = (duration_value), \
  }))
