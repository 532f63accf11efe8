#pragma once

#include <stdexcept>
#include <stop_token>
#include <string>

namespace refpack {

// Base of every failure raised while resolving a descriptor.
struct error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Malformed version, version range, package identity or framework name.
struct parse_error : error {
  using error::error;
};

// No assignment of versions satisfies the constraints in the dependency graph.
struct conflict_error : error {
  using error::error;
};

// A stop was requested on the token passed to a resolve call.
struct cancelled_error : error {
  cancelled_error() : error{ "operation cancelled" } {}
  using error::error;
};

// Download, extraction, hashing or file-system failure.
struct io_error : error {
  using error::error;
};

// A package that must be installed has no registry to download it from.
struct package_not_found_error : error {
  using error::error;
};

inline void throw_if_stopped(std::stop_token const &stop) {
  if (stop.stop_requested()) { throw cancelled_error{}; }
}

}  // namespace refpack
