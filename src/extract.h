#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace refpack {

// Package archives (.nupkg) are zip files. Entry names are percent-decoded and
// the packaging bookkeeping parts ([Content_Types].xml, _rels/, package/) are
// never surfaced.

// Extracts into `destination`, returning the number of regular files written.
// Throws io_error on archive or file-system failure, cancelled_error on stop.
std::uint64_t extract_nupkg(std::filesystem::path const &archive_path,
                            std::filesystem::path const &destination,
                            std::stop_token const &stop = {});

// Decoded, forward-slash entry names of regular files.
std::vector<std::string> extract_list_entries(std::filesystem::path const &archive_path);

// Contents of the first entry whose decoded name equals `name` (case-insensitive).
std::optional<std::string> extract_read_entry(std::filesystem::path const &archive_path,
                                              std::string_view name);

// Contents of the root-level .nuspec. Throws io_error if there is none.
std::string extract_read_nuspec(std::filesystem::path const &archive_path);

// "%2B" -> "+"; malformed escapes are kept verbatim.
std::string extract_decode_entry_name(std::string_view name);

bool extract_is_packaging_part(std::string_view decoded_name);

}  // namespace refpack
