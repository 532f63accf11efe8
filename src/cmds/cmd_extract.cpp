#include "cmd_extract.h"

#include "errors.h"
#include "extract.h"
#include "tui.h"

#include <filesystem>
#include <string>
#include <utility>

namespace refpack {

cmd_extract::cmd_extract(cmd_extract::cfg cfg, settings_overrides const & /*overrides*/)
    : cfg_{ std::move(cfg) } {}

void cmd_extract::execute(std::stop_token const &stop) {
  std::filesystem::path destination{ cfg_.destination };
  if (destination.empty()) { destination = std::filesystem::current_path(); }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(cfg_.archive_path, ec)) {
    throw io_error("extract: not a package file: " + cfg_.archive_path.string());
  }

  std::filesystem::create_directories(destination, ec);
  if (ec) {
    throw io_error("extract: failed to create destination directory: " + ec.message());
  }

  tui::info("Extracting %s to %s",
            cfg_.archive_path.filename().string().c_str(),
            destination.string().c_str());

  auto const file_count{ extract_nupkg(cfg_.archive_path, destination, stop) };
  tui::info("Extracted %llu files", static_cast<unsigned long long>(file_count));
}

}  // namespace refpack
