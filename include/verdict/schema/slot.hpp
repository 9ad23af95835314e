#pragma once

#include <verdict/schema/primitives.hpp>
#include <cstdint>

// Schema type: slot.
// Ledger storage unit: balance, owning program, and raw data bytes. A slot
// that was never created reads as the default value owned by the system
// program.
namespace verdict::schema {

/// Identity of the native slot-creation service (all-zero key).
inline constexpr auto kSystemProgramId = pubkey_t{};

template <uint16_t Version>
struct slot;

template <>
struct slot<1> final {
  lamports_t lamports{};
  pubkey_t owner{kSystemProgramId};
  bytes_t data;

  bool operator==(const slot<1>&) const = default;
};

using slot_t = slot<1>;

/// True when nothing has been provisioned at the address yet.
inline bool is_vacant(const slot_t& value) {
  return value.lamports == 0 && value.data.empty() &&
         value.owner == kSystemProgramId;
}

}  // namespace verdict::schema
