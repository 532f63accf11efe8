#pragma once

#include "dependency_graph.h"
#include "package_identity.h"

#include <stop_token>
#include <vector>

namespace refpack {

// Lowest-acceptable-version selection over a dependency graph, solved with
// pubgrub. Requested identities are pinned; every other id reachable from them
// gets the lowest graph version satisfying all ranges imposed by the selected
// packages.
class version_resolver {
 public:
  explicit version_resolver(dependency_graph const &graph) : graph_{ graph } {}

  // Selected identities, dependencies before dependents. Throws conflict_error
  // when no assignment satisfies every range, cancelled_error on stop.
  std::vector<package_identity> resolve(std::vector<package_identity> const &requested,
                                        std::stop_token const &stop = {}) const;

 private:
  dependency_graph const &graph_;
};

}  // namespace refpack
