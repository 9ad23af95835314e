#pragma once

#include <verdict/schema/primitives.hpp>
#include <array>

namespace verdict::crypto {

using seed_t = std::array<uint8_t, 32>;

/// ed25519 signing key derived from a 32-byte seed.
struct keypair final {
  seed_t seed{};
  verdict::schema::pubkey_t public_key{};
};

using keypair_t = keypair;

keypair_t make_keypair(const seed_t& seed);

verdict::schema::signature_t sign(const keypair_t& signer,
                                  const verdict::schema::bytes_view_t& message);

}  // namespace verdict::crypto
