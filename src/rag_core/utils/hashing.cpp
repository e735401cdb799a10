#include "rag_core/utils/hashing.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

}  // namespace

std::string sha256_hex(const std::string& content) {
  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw RagError("Failed to create EVP context for hashing");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), content.data(), content.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw RagError("SHA-256 digest failed");
  }

  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex << std::setw(2) << static_cast<int>(digest[i]);
  }
  return hex.str();
}

}  // namespace rag_core
