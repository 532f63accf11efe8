#pragma once

#include "package_identity.h"
#include "util.h"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace refpack {

class resolve_context;

// How the consuming compiler should unify assembly identities. Carried as part
// of the descriptor value; resolution itself does not depend on it.
enum class assembly_identity_comparer { default_comparer, desktop };

// Absolute, normalized assembly paths in sorted order.
using reference_set = std::vector<std::filesystem::path>;
using reference_set_ptr = std::shared_ptr<reference_set const>;

// Immutable description of a reference-assembly set: a target framework, an
// optional root reference package and extra assemblies/packages. Every with_*
// and add_* call returns a new descriptor; the original is never modified.
//
// resolve() results are memoized per descriptor instance and language. A
// descriptor is movable but not copyable, since a copy would have to either
// share or silently drop the memo.
class descriptor : uncopyable {
 public:
  using assembly_list = std::vector<std::string>;
  using language_map = std::map<std::string, assembly_list>;

  explicit descriptor(std::string target_framework);

  // `root_asset_path` is relative to the root package's install directory;
  // backslashes are accepted as separators.
  descriptor(std::string target_framework,
             package_identity root_package,
             std::string root_asset_path);

  ~descriptor();
  descriptor(descriptor &&) noexcept;
  descriptor &operator=(descriptor &&) noexcept;

  std::string const &target_framework() const { return cfg_.target_framework; }
  assembly_identity_comparer identity_comparer() const { return cfg_.comparer; }
  std::optional<package_identity> const &root_package() const { return cfg_.root_package; }
  std::optional<std::string> const &root_asset_path() const { return cfg_.root_asset_path; }
  assembly_list const &assemblies() const { return cfg_.assemblies; }
  language_map const &language_specific_assemblies() const { return cfg_.language_assemblies; }
  std::vector<package_identity> const &packages() const { return cfg_.packages; }

  descriptor with_assembly_identity_comparer(assembly_identity_comparer comparer) const;

  descriptor with_assemblies(assembly_list assemblies) const;
  descriptor add_assemblies(assembly_list const &assemblies) const;

  descriptor with_language_specific_assemblies(language_map assemblies) const;
  descriptor with_language_specific_assemblies(std::string const &language,
                                               assembly_list assemblies) const;
  descriptor add_language_specific_assemblies(std::string const &language,
                                              assembly_list const &assemblies) const;

  descriptor with_packages(std::vector<package_identity> packages) const;
  descriptor add_packages(std::vector<package_identity> const &packages) const;

  // Memo slot serving `language`: the language itself when it has
  // language-specific assemblies, otherwise "" (the default set).
  std::string effective_language(std::optional<std::string> const &language) const;

  // Resolves (once per effective language) and returns the shared result.
  // Throws conflict_error, io_error, package_not_found_error, parse_error, or
  // cancelled_error; a failed or cancelled call leaves the memo untouched.
  reference_set_ptr resolve(std::optional<std::string> const &language,
                            resolve_context const &ctx,
                            std::stop_token const &stop = {}) const;

  // Same, against resolve_context::shared().
  reference_set_ptr resolve(std::optional<std::string> const &language = std::nullopt) const;

  // Value equality; memo state is not part of the value.
  friend bool operator==(descriptor const &lhs, descriptor const &rhs);

 private:
  struct config {
    std::string target_framework;
    assembly_identity_comparer comparer{ assembly_identity_comparer::default_comparer };
    std::optional<package_identity> root_package;
    std::optional<std::string> root_asset_path;
    assembly_list assemblies;
    language_map language_assemblies;
    std::vector<package_identity> packages;

    bool operator==(config const &) const = default;
  };

  explicit descriptor(config cfg);

  reference_set_ptr compute(std::string const &language,
                            resolve_context const &ctx,
                            std::stop_token const &stop) const;

  struct memo;

  config cfg_;
  std::unique_ptr<memo> memo_;
};

}  // namespace refpack
