#include "version_resolver.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include <pubgrub/failure.hpp>
#include <pubgrub/interval.hpp>
#include <pubgrub/solve.hpp>

#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace refpack {

namespace {

// Graph versions of one id, ascending. Requirements range over indices into
// this list. Index size() stands for "no graph version", the target of a
// dependency range that no candidate satisfies.
using candidate_list = std::vector<package_identity>;
using index_set = pubgrub::interval_set<int>;

int sole_index(index_set const &versions) { return (*versions.iter_intervals().begin()).low; }

struct requirement {
  std::string key_;  // lowercase id
  candidate_list const *candidates{ nullptr };
  index_set versions;
  std::string range_text;  // dependency range, shown when no candidate is allowed

  requirement(std::string key, candidate_list const *cands, index_set vs, std::string range = {})
      : key_{ std::move(key) },
        candidates{ cands },
        versions{ std::move(vs) },
        range_text{ std::move(range) } {}

  std::string const &key() const noexcept { return key_; }

  bool implied_by(requirement const &other) const noexcept {
    return versions.contains(other.versions);
  }

  bool excludes(requirement const &other) const noexcept {
    return versions.disjoint(other.versions);
  }

  std::optional<requirement> intersection(requirement const &other) const noexcept {
    auto range{ versions.intersection(other.versions) };
    if (range.empty()) { return std::nullopt; }
    return requirement{ key_, candidates, std::move(range), range_text };
  }

  std::optional<requirement> union_(requirement const &other) const noexcept {
    auto range{ versions.union_(other.versions) };
    if (range.empty()) { return std::nullopt; }
    return requirement{ key_, candidates, std::move(range), range_text };
  }

  std::optional<requirement> difference(requirement const &other) const noexcept {
    auto range{ versions.difference(other.versions) };
    if (range.empty()) { return std::nullopt; }
    return requirement{ key_, candidates, std::move(range), range_text };
  }

  package_identity const &identity() const { return (*candidates)[sole_index(versions)]; }

  // "Id@1.0.0" for a single version, "Id (1.0.0 or 2.0.0)" otherwise.
  std::string to_string() const {
    std::vector<std::string> allowed;
    for (int i{ 0 }; i < static_cast<int>(candidates->size()); ++i) {
      if (versions.contains(i)) { allowed.push_back((*candidates)[i].version.to_string()); }
    }
    std::string const &id{ candidates->front().id };
    if (allowed.size() == 1) { return id + "@" + allowed.front(); }
    if (allowed.empty()) { return id + " " + (range_text.empty() ? "(no version)" : range_text); }
    std::string joined;
    for (auto const &v : allowed) { joined += (joined.empty() ? "" : " or ") + v; }
    return id + " (" + joined + ")";
  }

  friend std::ostream &operator<<(std::ostream &out, requirement const &self) {
    return out << self.to_string();
  }

  friend void do_repr(auto out, requirement const *self) noexcept {
    out.type("refpack-requirement");
    if (self) { out.value(self->to_string()); }
  }
};

// Answers pubgrub's queries from the dependency graph.
class graph_provider {
 public:
  graph_provider(dependency_graph const &graph, std::stop_token stop)
      : graph_{ graph }, stop_{ std::move(stop) } {}

  // Empty when the graph has no version of `id`.
  candidate_list const &candidates_for(std::string const &id) const {
    auto const key{ util_to_lower(id) };
    auto it{ candidates_.find(key) };
    if (it == candidates_.end()) { it = candidates_.emplace(key, graph_.versions_of(id)).first; }
    return it->second;
  }

  requirement exactly(package_identity const &p) const {
    auto const &cands{ candidates_for(p.id) };
    for (int i{ 0 }; i < static_cast<int>(cands.size()); ++i) {
      if (cands[i].version == p.version) {
        return requirement{ util_to_lower(p.id), &cands, index_set{ i, i + 1 } };
      }
    }
    throw conflict_error(p.to_string() + " is not in the dependency graph");
  }

  std::optional<requirement> best_candidate(requirement const &req) const {
    throw_if_stopped(stop_);
    for (int i{ 0 }; i < static_cast<int>(req.candidates->size()); ++i) {
      if (req.versions.contains(i)) {
        return requirement{ req.key(), req.candidates, index_set{ i, i + 1 } };
      }
    }
    return std::nullopt;
  }

  std::vector<requirement> requirements_of(requirement const &req) const {
    throw_if_stopped(stop_);
    std::vector<requirement> result;
    auto const *info{ graph_.find(req.identity()) };
    if (!info) { return result; }

    for (auto const &dep : info->dependencies) {
      auto const &cands{ candidates_for(dep.id) };
      if (cands.empty()) {
        if (warned_.insert(util_to_lower(dep.id)).second) {
          tui::warn("No version of %s is available; ignoring the dependency", dep.id.c_str());
        }
        continue;
      }

      int const none{ static_cast<int>(cands.size()) };
      index_set allowed;
      for (int i{ 0 }; i < none; ++i) {
        if (dep.range.satisfies(cands[i].version)) {
          allowed = allowed.union_(index_set{ i, i + 1 });
        }
      }
      if (allowed.empty()) { allowed = index_set{ none, none + 1 }; }
      result.emplace_back(util_to_lower(dep.id), &cands, std::move(allowed), dep.range.to_string());
    }
    return result;
  }

  void debug(std::string_view sv) const noexcept {
    tui::debug("pubgrub: %.*s", static_cast<int>(sv.size()), sv.data());
  }

 private:
  dependency_graph const &graph_;
  std::stop_token stop_;
  mutable std::map<std::string, candidate_list> candidates_;
  mutable std::set<std::string> warned_;
};

using solve_failure_exception = pubgrub::solve_failure_type_t<requirement>;

struct failure_explainer {
  std::ostringstream part;
  std::ostringstream strm;
  bool at_head{ true };

  void put(pubgrub::explain::no_solution) { part << "the requested packages cannot coexist"; }

  void put(pubgrub::explain::dependency<requirement> dep) {
    part << dep.dependent << " requires " << dep.dependency;
  }

  void put(pubgrub::explain::unavailable<requirement> un) {
    part << un.requirement << " is not available";
  }

  void put(pubgrub::explain::conflict<requirement> cf) {
    part << cf.a << " conflicts with " << cf.b;
  }

  void put(pubgrub::explain::needed<requirement> req) {
    part << req.requirement << " is requested";
  }

  void put(pubgrub::explain::disallowed<requirement> dis) {
    part << dis.requirement << " cannot be used";
  }

  void put(pubgrub::explain::compromise<requirement> cmpr) {
    part << cmpr.left << " and " << cmpr.right << " agree on " << cmpr.result;
  }

  template <typename T>
  void operator()(pubgrub::explain::premise<T> pr) {
    part.str("");
    put(pr.value);
    strm << (at_head ? "given that " : "and that ") << part.str() << ", ";
    at_head = false;
  }

  template <typename T>
  void operator()(pubgrub::explain::conclusion<T> cncl) {
    at_head = true;
    part.str("");
    put(cncl.value);
    strm << "then " << part.str() << ". ";
  }

  void operator()(pubgrub::explain::separator) {}
};

std::string explain(solve_failure_exception const &failure) {
  failure_explainer e;
  pubgrub::generate_explaination(failure, e);
  auto msg{ e.strm.str() };
  while (!msg.empty() && msg.back() == ' ') { msg.pop_back(); }
  return msg;
}

}  // namespace

std::vector<package_identity> version_resolver::resolve(
    std::vector<package_identity> const &requested,
    std::stop_token const &stop) const {
  graph_provider provider{ graph_, stop };

  std::map<std::string, package_identity> pinned;
  std::vector<requirement> roots;
  for (auto const &p : requested) {
    if (!graph_.contains(p)) {
      tui::warn("%s is not in the dependency graph; skipping", p.to_string().c_str());
      continue;
    }
    auto const [it, inserted]{ pinned.try_emplace(util_to_lower(p.id), p) };
    if (!inserted) {
      if (it->second.version != p.version) {
        throw conflict_error("Conflicting requests for " + p.id + ": " +
                             it->second.version.to_string() + " and " +
                             p.version.to_string());
      }
      continue;
    }
    roots.push_back(provider.exactly(p));
  }
  if (roots.empty()) { return {}; }

  std::map<std::string, package_identity> selected;
  try {
    for (auto const &req : pubgrub::solve(roots, provider)) {
      selected.insert_or_assign(req.key(), req.identity());
    }
  } catch (solve_failure_exception const &failure) {
    throw conflict_error("Unable to resolve package versions: " + explain(failure));
  }

  // Dependencies before dependents, ties broken by request order.
  std::vector<package_identity> result;
  std::unordered_set<std::string> seen;
  auto const visit{ [&](auto const &self, package_identity const &p) -> void {
    if (!seen.insert(util_to_lower(p.id)).second) { return; }
    if (auto const *info{ graph_.find(p) }) {
      for (auto const &dep : info->dependencies) {
        auto const it{ selected.find(util_to_lower(dep.id)) };
        if (it != selected.end()) { self(self, it->second); }
      }
    }
    result.push_back(p);
  } };
  for (auto const &req : roots) { visit(visit, req.identity()); }

  return result;
}

}  // namespace refpack
