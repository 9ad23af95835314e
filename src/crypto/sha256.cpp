#include <verdict/common/critical.hpp>
#include <verdict/crypto/sha256.hpp>

#include <openssl/evp.h>

#include <memory>

namespace verdict::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

verdict::schema::hash32_t sha256(
    std::initializer_list<verdict::schema::bytes_view_t> parts) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    verdict::common::critical("failed to initialise SHA-256 context");
  }
  for (const auto& part : parts) {
    if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
      verdict::common::critical("failed to update SHA-256 digest");
    }
  }
  auto output = verdict::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(ctx.get(), output.data(), &length) != 1 ||
      length != output.size()) {
    verdict::common::critical("failed to finalise SHA-256 digest");
  }
  return output;
}

verdict::schema::hash32_t sha256(const verdict::schema::bytes_view_t& bytes) {
  return sha256({bytes});
}

verdict::schema::hash32_t sha256(const std::string_view& str) {
  return sha256({verdict::schema::make_bytes_view(str)});
}

}  // namespace verdict::crypto
