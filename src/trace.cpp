#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace refpack {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(value ? "true" : "false");
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(registry_query),
          TRACE_NAME(registry_miss),
          TRACE_NAME(cache_hit),
          TRACE_NAME(cache_miss),
          TRACE_NAME(lock_acquired),
          TRACE_NAME(lock_released),
          TRACE_NAME(package_downloaded),
          TRACE_NAME(package_extracted),
          TRACE_NAME(package_skipped),
          TRACE_NAME(memo_hit),
          TRACE_NAME(resolve_complete),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::registry_query const &value) {
            std::ostringstream oss;
            oss << "registry_query package=" << value.package
                << " registry=" << value.registry
                << " found=" << bool_string(value.found)
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::registry_miss const &value) {
            std::ostringstream oss;
            oss << "registry_miss package=" << value.package;
            return oss.str();
          },
          [](trace_events::cache_hit const &value) {
            std::ostringstream oss;
            oss << "cache_hit package=" << value.package
                << " installed_path=" << value.installed_path << " tier=" << value.tier;
            return oss.str();
          },
          [](trace_events::cache_miss const &value) {
            std::ostringstream oss;
            oss << "cache_miss package=" << value.package;
            return oss.str();
          },
          [](trace_events::lock_acquired const &value) {
            std::ostringstream oss;
            oss << "lock_acquired owner=" << value.owner
                << " lock_path=" << value.lock_path
                << " wait_ms=" << value.wait_duration_ms;
            return oss.str();
          },
          [](trace_events::lock_released const &value) {
            std::ostringstream oss;
            oss << "lock_released owner=" << value.owner
                << " lock_path=" << value.lock_path
                << " hold_ms=" << value.hold_duration_ms;
            return oss.str();
          },
          [](trace_events::package_downloaded const &value) {
            std::ostringstream oss;
            oss << "package_downloaded package=" << value.package
                << " registry=" << value.registry << " path=" << value.path
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::package_extracted const &value) {
            std::ostringstream oss;
            oss << "package_extracted package=" << value.package
                << " destination=" << value.destination
                << " files_extracted=" << value.files_extracted
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::package_skipped const &value) {
            std::ostringstream oss;
            oss << "package_skipped package=" << value.package
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::memo_hit const &value) {
            std::ostringstream oss;
            oss << "memo_hit target_framework=" << value.target_framework
                << " language=" << value.language
                << " after_lock=" << bool_string(value.after_lock);
            return oss.str();
          },
          [](trace_events::resolve_complete const &value) {
            std::ostringstream oss;
            oss << "resolve_complete target_framework=" << value.target_framework
                << " language=" << value.language
                << " assembly_count=" << value.assembly_count
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::registry_query const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "registry", value.registry);
            append_kv(output, "found", value.found);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::registry_miss const &value) {
            append_kv(output, "package", value.package);
          },
          [&](trace_events::cache_hit const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "installed_path", value.installed_path);
            append_kv(output, "tier", value.tier);
          },
          [&](trace_events::cache_miss const &value) {
            append_kv(output, "package", value.package);
          },
          [&](trace_events::lock_acquired const &value) {
            append_kv(output, "owner", value.owner);
            append_kv(output, "lock_path", value.lock_path);
            append_kv(output, "wait_duration_ms", value.wait_duration_ms);
          },
          [&](trace_events::lock_released const &value) {
            append_kv(output, "owner", value.owner);
            append_kv(output, "lock_path", value.lock_path);
            append_kv(output, "hold_duration_ms", value.hold_duration_ms);
          },
          [&](trace_events::package_downloaded const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "registry", value.registry);
            append_kv(output, "path", value.path);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::package_extracted const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "destination", value.destination);
            append_kv(output, "files_extracted", value.files_extracted);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::package_skipped const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::memo_hit const &value) {
            append_kv(output, "target_framework", value.target_framework);
            append_kv(output, "language", value.language);
            append_kv(output, "after_lock", value.after_lock);
          },
          [&](trace_events::resolve_complete const &value) {
            append_kv(output, "target_framework", value.target_framework);
            append_kv(output, "language", value.language);
            append_kv(output, "assembly_count", value.assembly_count);
            append_kv(output, "duration_ms", value.duration_ms);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace refpack
