#pragma once

#include <verdict/address/builder.hpp>
#include <verdict/address/derive.hpp>
#include <verdict/program/config.hpp>
#include <verdict/schema/record_request.hpp>

namespace verdict::program {

struct derivation_result final {
  verdict::address::derived_address_t derived;
  verdict::address::derivation_proof_t proof;
};

using derivation_result_t = derivation_result;

/// Seed list for a request: the domain tag, then the subject hash (fixed
/// schema) or token address, chain and scan hash (variable schema).
verdict::address::builder make_seeds(
    const program_config_t& config,
    const verdict::schema::record_request_t& record);

/// Storage address and bump for a request. Throws
/// program_error(address_space_exhausted) when no bump lands off the curve.
derivation_result_t derive_address(
    const program_config_t& config,
    const verdict::schema::record_request_t& record);

/// Throws program_error(address_mismatch) unless `target` is the derived
/// address.
void check_target(const derivation_result_t& derivation,
                  const verdict::schema::pubkey_t& target);

}  // namespace verdict::program
