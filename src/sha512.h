#pragma once

#include <array>
#include <filesystem>
#include <string>

namespace refpack {

using sha512_t = std::array<unsigned char, 64>;

sha512_t sha512(std::filesystem::path const &file_path);

// Base64 digest, the format NuGet writes into <id>.<version>.nupkg.sha512.
std::string sha512_base64(sha512_t const &digest);

}  // namespace refpack
