#include "extract.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <cctype>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace refpack {
namespace {

struct archive_reader : unmovable {
  archive_reader() : handle(archive_read_new()) {
    if (!handle) { throw io_error("archive_read_new failed"); }
    archive_read_support_filter_all(handle);
    archive_read_support_format_zip(handle);
  }

  ~archive_reader() {
    if (handle) {
      archive_read_close(handle);
      archive_read_free(handle);
    }
  }

  void open(std::filesystem::path const &archive_path) {
    if (archive_read_open_filename(handle, archive_path.string().c_str(), 10240) !=
        ARCHIVE_OK) {
      throw io_error("Failed to open package archive " + archive_path.string() + ": " +
                     archive_error_string(handle));
    }
  }

  archive *handle{ nullptr };
};

struct archive_writer : unmovable {
  archive_writer() : handle(archive_write_disk_new()) {
    if (!handle) { throw io_error("archive_write_disk_new failed"); }
    archive_write_disk_set_options(handle,
                                   ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                       ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(handle);
  }

  ~archive_writer() {
    if (handle) {
      archive_write_close(handle);
      archive_write_free(handle);
    }
  }

  archive *handle{ nullptr };
};

int hex_value(char c) {
  if (c >= '0' && c <= '9') { return c - '0'; }
  if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
  if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
  return -1;
}

void ensure_directory(std::filesystem::path const &path) {
  auto const dir{ path.parent_path() };
  if (dir.empty()) { return; }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw io_error(std::string("Failed to create directory ") + dir.string() + ": " +
                   ec.message());
  }
}

// Normalized relative entry name, or empty when the entry must not be written.
std::string safe_entry_name(char const *raw) {
  std::string name{ extract_decode_entry_name(raw) };
  for (auto &c : name) {
    if (c == '\\') { c = '/'; }
  }
  while (!name.empty() && name.front() == '/') { name.erase(0, 1); }

  for (auto const &part : util_split(name, '/')) {
    if (part == "..") { throw io_error("Package entry escapes destination: " + name); }
  }
  return name;
}

// Calls `visit` for every regular, non-packaging entry; stops early when it returns false.
void for_each_entry(archive_reader &reader,
                    std::function<bool(std::string const &, archive_entry *)> const &visit) {
  archive_entry *entry{ nullptr };
  while (true) {
    int const r{ archive_read_next_header(reader.handle, &entry) };
    if (r == ARCHIVE_EOF) { return; }
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
      throw io_error(std::string("Failed to read archive header: ") +
                     archive_error_string(reader.handle));
    }

    char const *entry_path{ archive_entry_pathname(entry) };
    if (!entry_path) { throw io_error("Archive entry has null pathname"); }
    if (archive_entry_filetype(entry) != AE_IFREG) { continue; }

    std::string const name{ safe_entry_name(entry_path) };
    if (name.empty() || extract_is_packaging_part(name)) { continue; }
    if (!visit(name, entry)) { return; }
  }
}

}  // namespace

std::string extract_decode_entry_name(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  for (std::size_t i{ 0 }; i < name.size(); ++i) {
    if (name[i] == '%' && i + 2 < name.size()) {
      int const hi{ hex_value(name[i + 1]) };
      int const lo{ hex_value(name[i + 2]) };
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(name[i]);
  }
  return out;
}

bool extract_is_packaging_part(std::string_view decoded_name) {
  return util_iequals(decoded_name, "[Content_Types].xml") ||
         util_istarts_with(decoded_name, "_rels/") ||
         util_istarts_with(decoded_name, "package/");
}

std::uint64_t extract_nupkg(std::filesystem::path const &archive_path,
                            std::filesystem::path const &destination,
                            std::stop_token const &stop) {
  throw_if_stopped(stop);

  archive_reader reader;
  archive_writer writer;
  reader.open(archive_path);

  std::uint64_t files_extracted{ 0 };
  std::vector<char> buffer(256 * 1024);

  for_each_entry(reader, [&](std::string const &name, archive_entry *entry) {
    throw_if_stopped(stop);

    std::filesystem::path const full_path{ destination / std::filesystem::path{ name } };
    ensure_directory(full_path);
    {
      std::string const full_path_str{ full_path.string() };
      archive_entry_copy_pathname(entry, full_path_str.c_str());
    }
    archive_entry_set_perm(entry, 0644);

    if (int const write_header_result{ archive_write_header(writer.handle, entry) };
        write_header_result != ARCHIVE_OK && write_header_result != ARCHIVE_WARN) {
      throw io_error(std::string("Failed to write entry header: ") +
                     archive_error_string(writer.handle));
    }

    la_ssize_t bytes_read{ 0 };
    while ((bytes_read = archive_read_data(reader.handle, buffer.data(), buffer.size())) > 0) {
      if (la_ssize_t const bytes_written{ archive_write_data(
              writer.handle, buffer.data(), static_cast<size_t>(bytes_read)) };
          bytes_written < 0) {
        throw io_error(std::string("Failed to write entry data: ") +
                       archive_error_string(writer.handle));
      }
    }
    if (bytes_read < 0) {
      throw io_error(std::string("Failed to read entry data: ") +
                     archive_error_string(reader.handle));
    }

    if (archive_write_finish_entry(writer.handle) != ARCHIVE_OK) {
      throw io_error(std::string("Failed to finish entry: ") +
                     archive_error_string(writer.handle));
    }

    ++files_extracted;
    return true;
  });

  tui::debug("extract_nupkg: %llu files from %s",
             static_cast<unsigned long long>(files_extracted),
             archive_path.filename().string().c_str());
  return files_extracted;
}

std::vector<std::string> extract_list_entries(std::filesystem::path const &archive_path) {
  archive_reader reader;
  reader.open(archive_path);

  std::vector<std::string> names;
  for_each_entry(reader, [&](std::string const &name, archive_entry *) {
    names.push_back(name);
    return true;
  });
  return names;
}

std::optional<std::string> extract_read_entry(std::filesystem::path const &archive_path,
                                              std::string_view name) {
  archive_reader reader;
  reader.open(archive_path);

  std::optional<std::string> result;
  for_each_entry(reader, [&](std::string const &entry_name, archive_entry *) {
    if (!util_iequals(entry_name, name)) { return true; }

    std::string content;
    std::vector<char> buffer(64 * 1024);
    la_ssize_t n{ 0 };
    while ((n = archive_read_data(reader.handle, buffer.data(), buffer.size())) > 0) {
      content.append(buffer.data(), static_cast<std::size_t>(n));
    }
    if (n < 0) {
      throw io_error(std::string("Failed to read entry data: ") +
                     archive_error_string(reader.handle));
    }
    result = std::move(content);
    return false;
  });
  return result;
}

std::string extract_read_nuspec(std::filesystem::path const &archive_path) {
  std::optional<std::string> nuspec_name;
  for (auto const &name : extract_list_entries(archive_path)) {
    if (name.find('/') == std::string::npos && util_iends_with(name, ".nuspec")) {
      nuspec_name = name;
      break;
    }
  }
  if (!nuspec_name) { throw io_error("No .nuspec found in " + archive_path.string()); }

  auto content{ extract_read_entry(archive_path, *nuspec_name) };
  if (!content) { throw io_error("Failed to read " + *nuspec_name); }
  return std::move(*content);
}

}  // namespace refpack
