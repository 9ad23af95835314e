#pragma once

#include <verdict/address/derive.hpp>
#include <verdict/execution/invoke_context.hpp>
#include <verdict/schema/primitives.hpp>
#include <cstdint>

namespace verdict::program {

/// Create the record slot at `target`, funded by `authority` with the
/// rent-exempt minimum for `space` bytes and owned by the invoking program.
/// The derivation proof stands in for the target's signature.
void provision_slot(verdict::execution::invoke_context& context,
                    const verdict::schema::pubkey_t& authority,
                    const verdict::schema::pubkey_t& target,
                    uint64_t space,
                    const verdict::address::derivation_proof_t& proof);

}  // namespace verdict::program
