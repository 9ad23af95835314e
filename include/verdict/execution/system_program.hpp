#pragma once

#include <verdict/address/derive.hpp>
#include <verdict/schema/primitives.hpp>
#include <verdict/schema/slot.hpp>
#include <cstdint>
#include <span>

// Native slot-creation service. It is the only code allowed to materialise a
// slot, move its balance out of the funder and hand ownership to a program.
namespace verdict::execution::system_program {

/// Largest data size a single slot may be created with.
inline constexpr auto kMaxSlotDataSize = uint64_t{10240};

struct create_slot_request final {
  verdict::schema::pubkey_t funder{};
  verdict::schema::pubkey_t target{};
  verdict::schema::lamports_t lamports{};
  uint64_t space{};
  verdict::schema::pubkey_t owner{};
};

using create_slot_request_t = create_slot_request;

/// Authority evidence for one create_slot call. The target is authorised
/// either by its own signature or by a derivation proof under `invoker`.
struct create_slot_authority final {
  verdict::schema::pubkey_t invoker{};
  bool funder_signed{};
  bool target_signed{};
  std::span<const verdict::address::derivation_proof_t> proofs;
};

using create_slot_authority_t = create_slot_authority;

/// Fund, size and assign `target` from `funder`. Both slots are updated in
/// place only after every check passed. Throws program_error.
void create_slot(const create_slot_request_t& request,
                 const create_slot_authority_t& authority,
                 verdict::schema::slot_t& funder,
                 verdict::schema::slot_t& target);

}  // namespace verdict::execution::system_program
