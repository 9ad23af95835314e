#pragma once
#include <verdict/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

// Program-derived addresses: 32-byte identities computed from seeds and the
// owning program's identity, guaranteed to lie off the ed25519 curve so that
// no private key can ever sign for them.
namespace verdict::address {

inline constexpr auto kMaxSeedLength = std::size_t{32};
inline constexpr auto kMaxSeeds = std::size_t{16};
inline constexpr auto kDerivedAddressMarker =
    std::string_view{"ProgramDerivedAddress"};

using seeds_t = std::vector<verdict::schema::bytes_t>;

/// Derived-authority token: the seeds and nonce that reproduce an address
/// under a given program. Handed to the slot-creation service in place of a
/// signature.
struct derivation_proof final {
  seeds_t seeds;
  uint8_t bump{};
};

using derivation_proof_t = derivation_proof;

struct derived_address final {
  verdict::schema::pubkey_t address{};
  uint8_t bump{};
};

using derived_address_t = derived_address;

/// Hash seeds (the last of which is normally the bump) with the program
/// identity. std::nullopt when the digest lands on the curve. Throws
/// program_error(seed_too_long) when a seed or the seed count is too large.
std::optional<verdict::schema::pubkey_t> create_program_address(
    std::span<const verdict::schema::bytes_view_t> seeds,
    const verdict::schema::pubkey_t& program_id);

/// Search bumps from 255 down to 0 and return the first off-curve address.
/// std::nullopt when every bump lands on the curve.
std::optional<derived_address_t> find_program_address(
    const seeds_t& seeds,
    const verdict::schema::pubkey_t& program_id);

/// Re-derive `proof` under `program_id` and compare with `address`.
bool verify(const derivation_proof_t& proof,
            const verdict::schema::pubkey_t& program_id,
            const verdict::schema::pubkey_t& address);

}  // namespace verdict::address
