#include "sha512.h"

#include "errors.h"
#include "util.h"

#include "mbedtls/base64.h"
#include "mbedtls/sha512.h"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace refpack {

sha512_t sha512(std::filesystem::path const &file_path) {
  mbedtls_sha512_context ctx;
  mbedtls_sha512_init(&ctx);

  std::unique_ptr<decltype(ctx), decltype(&mbedtls_sha512_free)> ctx_scope(
      &ctx,
      &mbedtls_sha512_free);

  if (mbedtls_sha512_starts(&ctx, 0)) { throw io_error("sha512: mbedtls_sha512_starts failed"); }

  file_ptr_t file{ util_open_file(file_path, "rb") };
  if (!file) { throw io_error("sha512: failed to open file: " + file_path.string()); }

  std::vector<unsigned char> buffer(1024 * 1024);
  while (true) {
    auto const read_bytes{
      std::fread(buffer.data(), sizeof(unsigned char), buffer.size(), file.get())
    };

    if (read_bytes > 0) {
      if (mbedtls_sha512_update(&ctx, buffer.data(), read_bytes)) {
        throw io_error("sha512: mbedtls_sha512_update failed");
      }
    }

    if (read_bytes < buffer.size()) {
      if (std::ferror(file.get())) { throw io_error("sha512: fread failed"); }
      break;
    }
  }

  sha512_t digest{};
  if (mbedtls_sha512_finish(&ctx, digest.data())) {
    throw io_error("sha512: mbedtls_sha512_finish failed");
  }
  return digest;
}

std::string sha512_base64(sha512_t const &digest) {
  unsigned char out[128]{};
  size_t written{ 0 };
  if (mbedtls_base64_encode(out, sizeof out, &written, digest.data(), digest.size()) != 0) {
    throw io_error("sha512: base64 encoding failed");
  }
  return std::string{ reinterpret_cast<char const *>(out), written };
}

}  // namespace refpack
