#pragma once
#include <verdict/address/derive.hpp>
#include <verdict/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace verdict::address {

/// Accumulates derivation seeds in order.
struct builder final {
  seeds_t seeds;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(uint8_t value);

  /// Run the bump search under `program_id`.
  std::optional<derived_address_t> derive(
      const verdict::schema::pubkey_t& program_id) const;

  /// Package the seeds and a found bump as a derived-authority token.
  derivation_proof_t proof(uint8_t bump) const;
};

}  // namespace verdict::address
