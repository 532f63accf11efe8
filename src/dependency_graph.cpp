#include "dependency_graph.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace refpack {

namespace {

std::optional<dependency_info> query_registries(
    package_identity const &identity,
    framework const &target,
    std::vector<package_registry const *> const &registries,
    source_cache_context &ctx,
    std::stop_token const &stop) {
  for (auto const *registry : registries) {
    throw_if_stopped(stop);

    auto const start{ std::chrono::steady_clock::now() };
    auto info{ registry->resolve_package(identity, target, ctx, stop) };
    auto const duration{ std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - start)
                             .count() };
    REFPACK_TRACE_REGISTRY_QUERY(identity.to_string(),
                                 registry->name(),
                                 info.has_value(),
                                 static_cast<std::int64_t>(duration));

    if (info) {
      info->identity = identity;
      info->source = registry;
      return info;
    }
  }
  return std::nullopt;
}

}  // namespace

dependency_graph dependency_graph::build(std::vector<package_identity> const &roots,
                                         framework const &target,
                                         std::vector<package_registry const *> const &registries,
                                         source_cache_context &ctx,
                                         std::stop_token const &stop) {
  dependency_graph graph;
  std::unordered_set<package_identity> visited;

  // Explicit stack; pushing children in reverse keeps recursive visiting order.
  std::vector<package_identity> stack(roots.rbegin(), roots.rend());

  while (!stack.empty()) {
    throw_if_stopped(stop);

    package_identity const identity{ std::move(stack.back()) };
    stack.pop_back();
    if (!visited.insert(identity).second) { continue; }

    auto info{ query_registries(identity, target, registries, ctx, stop) };
    if (!info) {
      tui::warn("No registry has %s; continuing without it", identity.to_string().c_str());
      REFPACK_TRACE_REGISTRY_MISS(identity.to_string());
      graph.missing_.push_back(identity);
      continue;
    }

    for (auto it{ info->dependencies.rbegin() }; it != info->dependencies.rend(); ++it) {
      auto const &min{ it->range.min_version() };
      if (!min) {
        tui::warn("%s: dependency %s %s has no minimum version; skipped",
                  identity.to_string().c_str(),
                  it->id.c_str(),
                  it->range.to_string().c_str());
        continue;
      }
      package_identity candidate{ it->id, *min };
      if (!visited.contains(candidate)) { stack.push_back(std::move(candidate)); }
    }

    graph.order_.push_back(identity);
    graph.nodes_.emplace(identity, std::move(*info));
  }

  return graph;
}

bool dependency_graph::contains(package_identity const &identity) const {
  return nodes_.contains(identity);
}

dependency_info const *dependency_graph::find(package_identity const &identity) const {
  auto const it{ nodes_.find(identity) };
  return it == nodes_.end() ? nullptr : &it->second;
}

std::vector<package_identity> dependency_graph::versions_of(std::string const &id) const {
  std::vector<package_identity> result;
  for (auto const &identity : order_) {
    if (util_iequals(identity.id, id)) { result.push_back(identity); }
  }
  std::ranges::sort(result, [](package_identity const &a, package_identity const &b) {
    return a.version < b.version;
  });
  return result;
}

}  // namespace refpack
