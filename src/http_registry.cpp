#include "http_registry.h"

#include "errors.h"
#include "libcurl_util.h"
#include "source_cache_context.h"
#include "uri.h"
#include "util.h"

#include <string>
#include <utility>

namespace refpack {

namespace {

std::string package_dir(std::string const &base, package_identity const &identity) {
  return uri_join(uri_join(base, util_to_lower(identity.id)),
                  identity.version.to_lower_string());
}

}  // namespace

http_registry::http_registry(std::string base_url) : base_url_{ std::move(base_url) } {}

std::string http_registry::nuspec_url(package_identity const &identity) const {
  return uri_join(package_dir(base_url_, identity), util_to_lower(identity.id) + ".nuspec");
}

std::string http_registry::nupkg_url(package_identity const &identity) const {
  return uri_join(package_dir(base_url_, identity),
                  util_to_lower(identity.id) + "." + identity.version.to_lower_string() +
                      ".nupkg");
}

std::optional<dependency_info> http_registry::resolve_package(package_identity const &identity,
                                                              framework const &target,
                                                              source_cache_context &ctx,
                                                              std::stop_token const &stop) const {
  auto const nuspec_path{ libcurl_download(nuspec_url(identity),
                                           ctx.file_for(identity, "nuspec"),
                                           stop) };
  if (!nuspec_path) { return std::nullopt; }

  auto const bytes{ util_load_file(*nuspec_path) };
  auto const spec{ nuspec::parse(
      std::string_view{ reinterpret_cast<char const *>(bytes.data()), bytes.size() }) };

  return dependency_info{ package_identity{ spec.id, spec.version },
                          spec.dependencies_for(target),
                          this };
}

std::filesystem::path http_registry::download(package_identity const &identity,
                                              source_cache_context &ctx,
                                              std::stop_token const &stop) const {
  if (auto const cached{ ctx.find_download(identity) }) { return *cached; }

  auto const nupkg{ libcurl_download(nupkg_url(identity), ctx.file_for(identity, "nupkg"), stop) };
  if (!nupkg) {
    throw package_not_found_error(identity.to_string() + " not found at " + base_url_);
  }
  ctx.record_download(identity, *nupkg);
  return *nupkg;
}

}  // namespace refpack
