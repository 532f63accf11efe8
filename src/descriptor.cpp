#include "descriptor.h"

#include "assembly_set_builder.h"
#include "asset_selector.h"
#include "dependency_graph.h"
#include "errors.h"
#include "framework.h"
#include "package_contents.h"
#include "resolve_context.h"
#include "source_cache_context.h"
#include "trace.h"
#include "tui.h"
#include "version_resolver.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace refpack {

struct descriptor::memo {
  std::mutex mutex;
  std::map<std::string, reference_set_ptr> results;

  reference_set_ptr find(std::string const &language) {
    std::lock_guard const lock{ mutex };
    auto const it{ results.find(language) };
    return it == results.end() ? nullptr : it->second;
  }

  void store(std::string const &language, reference_set_ptr value) {
    std::lock_guard const lock{ mutex };
    results.emplace(language, std::move(value));
  }
};

namespace {

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

std::string normalize_asset_path(std::string value) {
  for (auto &c : value) {
    if (c == '\\') { c = '/'; }
  }
  return value;
}

std::string lock_owner(std::string const &target_framework, std::string const &language) {
  std::string owner{ "descriptor " + target_framework };
  if (!language.empty()) { owner += " (" + language + ")"; }
  return owner;
}

template <typename T>
std::vector<T> concat(std::vector<T> lhs, std::vector<T> const &rhs) {
  lhs.insert(lhs.end(), rhs.begin(), rhs.end());
  return lhs;
}

}  // namespace

descriptor::descriptor(config cfg) : cfg_{ std::move(cfg) }, memo_{ std::make_unique<memo>() } {}

descriptor::descriptor(std::string target_framework)
    : descriptor{ config{ .target_framework = std::move(target_framework) } } {}

descriptor::descriptor(std::string target_framework,
                       package_identity root_package,
                       std::string root_asset_path)
    : descriptor{ config{ .target_framework = std::move(target_framework),
                          .root_package = std::move(root_package),
                          .root_asset_path = normalize_asset_path(std::move(root_asset_path)) } } {}

descriptor::~descriptor() = default;
descriptor::descriptor(descriptor &&) noexcept = default;
descriptor &descriptor::operator=(descriptor &&) noexcept = default;

bool operator==(descriptor const &lhs, descriptor const &rhs) { return lhs.cfg_ == rhs.cfg_; }

descriptor descriptor::with_assembly_identity_comparer(assembly_identity_comparer comparer) const {
  config next{ cfg_ };
  next.comparer = comparer;
  return descriptor{ std::move(next) };
}

descriptor descriptor::with_assemblies(assembly_list assemblies) const {
  config next{ cfg_ };
  next.assemblies = std::move(assemblies);
  return descriptor{ std::move(next) };
}

descriptor descriptor::add_assemblies(assembly_list const &assemblies) const {
  return with_assemblies(concat(cfg_.assemblies, assemblies));
}

descriptor descriptor::with_language_specific_assemblies(language_map assemblies) const {
  config next{ cfg_ };
  next.language_assemblies = std::move(assemblies);
  return descriptor{ std::move(next) };
}

descriptor descriptor::with_language_specific_assemblies(std::string const &language,
                                                         assembly_list assemblies) const {
  config next{ cfg_ };
  next.language_assemblies.insert_or_assign(language, std::move(assemblies));
  return descriptor{ std::move(next) };
}

descriptor descriptor::add_language_specific_assemblies(std::string const &language,
                                                        assembly_list const &assemblies) const {
  auto const it{ cfg_.language_assemblies.find(language) };
  assembly_list current{ it == cfg_.language_assemblies.end() ? assembly_list{} : it->second };
  return with_language_specific_assemblies(language, concat(std::move(current), assemblies));
}

descriptor descriptor::with_packages(std::vector<package_identity> packages) const {
  config next{ cfg_ };
  next.packages = std::move(packages);
  return descriptor{ std::move(next) };
}

descriptor descriptor::add_packages(std::vector<package_identity> const &packages) const {
  return with_packages(concat(cfg_.packages, packages));
}

std::string descriptor::effective_language(std::optional<std::string> const &language) const {
  if (!language || language->empty()) { return {}; }
  auto const it{ cfg_.language_assemblies.find(*language) };
  if (it == cfg_.language_assemblies.end() || it->second.empty()) { return {}; }
  return *language;
}

reference_set_ptr descriptor::resolve(std::optional<std::string> const &language) const {
  return resolve(language, resolve_context::shared());
}

reference_set_ptr descriptor::resolve(std::optional<std::string> const &language,
                                      resolve_context const &ctx,
                                      std::stop_token const &stop) const {
  if (!memo_) { throw std::logic_error("descriptor::resolve on a moved-from descriptor"); }

  std::string const key{ effective_language(language) };
  if (auto cached{ memo_->find(key) }) {
    REFPACK_TRACE_MEMO_HIT(cfg_.target_framework, key, false);
    return cached;
  }

  auto const lock{ ctx.cache().lock(lock_owner(cfg_.target_framework, key), stop) };

  if (auto cached{ memo_->find(key) }) {
    REFPACK_TRACE_MEMO_HIT(cfg_.target_framework, key, true);
    return cached;
  }

  auto result{ compute(key, ctx, stop) };
  memo_->store(key, result);
  return result;
}

reference_set_ptr descriptor::compute(std::string const &language,
                                      resolve_context const &ctx,
                                      std::stop_token const &stop) const {
  auto const start{ std::chrono::steady_clock::now() };

  auto const target{ framework::parse(cfg_.target_framework) };
  if (target.is_unsupported()) {
    throw parse_error("Unsupported target framework '" + cfg_.target_framework + "'");
  }

  source_cache_context scratch{ ctx.cache().local().root() };

  std::vector<package_identity> roots;
  if (cfg_.root_package) { roots.push_back(*cfg_.root_package); }
  roots.insert(roots.end(), cfg_.packages.begin(), cfg_.packages.end());

  auto const graph{ dependency_graph::build(roots, target, ctx.registries(), scratch, stop) };

  // The root is installed even when no registry knows it: an installed copy
  // needs no registry, and a missing one fails at download time.
  std::vector<package_identity> install;
  if (cfg_.root_package) { install.push_back(*cfg_.root_package); }
  if (!cfg_.packages.empty()) {
    for (auto &p : version_resolver{ graph }.resolve(cfg_.packages, stop)) {
      if (cfg_.root_package && p == *cfg_.root_package) { continue; }
      install.push_back(std::move(p));
    }
  }

  assembly_set_builder builder;
  for (auto const &identity : install) {
    throw_if_stopped(stop);
    bool const is_root{ cfg_.root_package && identity == *cfg_.root_package };

    auto installed{ ctx.cache().installed_path(identity) };
    if (!installed) {
      auto const *info{ graph.find(identity) };
      if (!info || !info->source) {
        throw package_not_found_error("No registry provides " + identity.to_string());
      }

      auto const download_start{ std::chrono::steady_clock::now() };
      auto const nupkg{ info->source->download(identity, scratch, stop) };
      REFPACK_TRACE_PACKAGE_DOWNLOADED(identity.to_string(),
                                       info->source->name(),
                                       nupkg.string(),
                                       elapsed_ms(download_start));

      if (!is_root && !package_contents::from_archive(nupkg).has_compile_assets()) {
        tui::debug("%s has no lib/ or ref/ assets; skipping", identity.to_string().c_str());
        REFPACK_TRACE_PACKAGE_SKIPPED(identity.to_string(), "no compile assets");
        continue;
      }
      installed = ctx.cache().install(identity, nupkg, stop);
    }

    if (is_root) {
      builder.set_reference_directory(cfg_.root_asset_path ? *installed / *cfg_.root_asset_path
                                                           : *installed);
    }

    auto const contents{ package_contents::from_folder(*installed) };
    builder.add_package(*installed, select_assets(contents, target));
  }

  builder.add_named(cfg_.assemblies);
  if (!language.empty()) { builder.add_named(cfg_.language_assemblies.at(language)); }
  builder.add_facades();

  auto result{ std::make_shared<reference_set const>(builder.build()) };

  auto const duration{ elapsed_ms(start) };
  REFPACK_TRACE_RESOLVE_COMPLETE(cfg_.target_framework,
                                 language,
                                 static_cast<std::int64_t>(result->size()),
                                 duration);
  tui::debug("resolved %s [%s]: %zu assemblies in %lld ms",
             cfg_.target_framework.c_str(),
             language.empty() ? "default" : language.c_str(),
             result->size(),
             static_cast<long long>(duration));
  return result;
}

}  // namespace refpack
