#include <verdict/common/critical.hpp>
#include <verdict/crypto/keypair.hpp>

#include <openssl/evp.h>

#include <memory>

namespace verdict::crypto {

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_pkey_ptr load_private_key(const seed_t& seed) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(),
                                   seed.size()),
      EVP_PKEY_free};
  if (!pkey) {
    verdict::common::critical("failed to load ed25519 private key");
  }
  return pkey;
}

}  // namespace

keypair_t make_keypair(const seed_t& seed) {
  auto pkey = load_private_key(seed);
  auto out = keypair_t{.seed = seed};
  auto length = out.public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), out.public_key.data(),
                                  &length) != 1 ||
      length != out.public_key.size()) {
    verdict::common::critical("failed to derive ed25519 public key");
  }
  return out;
}

verdict::schema::signature_t sign(
    const keypair_t& signer,
    const verdict::schema::bytes_view_t& message) {
  auto pkey = load_private_key(signer.seed);
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1) {
    verdict::common::critical("failed to initialise ed25519 signer");
  }
  auto signature = verdict::schema::signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    verdict::common::critical("failed to produce ed25519 signature");
  }
  return signature;
}

}  // namespace verdict::crypto
