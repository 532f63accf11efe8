#pragma once

#include "framework.h"
#include "package_identity.h"
#include "package_registry.h"

#include <optional>
#include <stop_token>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace refpack {

class source_cache_context;

// Packages reachable from the starting identities, each described by the first
// registry that knew it. Identities no registry knows are dropped; ranges are
// followed through their minimum version.
class dependency_graph {
 public:
  // Registries are queried in order. Throws cancelled_error on stop.
  static dependency_graph build(std::vector<package_identity> const &roots,
                                framework const &target,
                                std::vector<package_registry const *> const &registries,
                                source_cache_context &ctx,
                                std::stop_token const &stop);

  bool contains(package_identity const &identity) const;
  dependency_info const *find(package_identity const &identity) const;

  // Graph nodes with this id, ascending by version.
  std::vector<package_identity> versions_of(std::string const &id) const;

  // Identities no registry returned.
  std::vector<package_identity> const &missing() const { return missing_; }

  // Nodes in discovery order.
  std::vector<package_identity> const &order() const { return order_; }
  std::size_t size() const { return nodes_.size(); }

 private:
  std::unordered_map<package_identity, dependency_info> nodes_;
  std::vector<package_identity> order_;
  std::vector<package_identity> missing_;
};

}  // namespace refpack
