#pragma once

#include <verdict/program/config.hpp>
#include <verdict/schema/primitives.hpp>
#include <verdict/schema/record_request.hpp>
#include <verdict/schema/transaction.hpp>

// Client-side helpers that assemble registration instructions.
namespace verdict::program {

/// 40-byte request data: subject hash, payload, discriminator.
verdict::schema::bytes_t make_request_data(
    const verdict::schema::fixed_record_request& request);

/// Instruction data for either schema.
verdict::schema::bytes_t make_request_data(
    const verdict::schema::record_request_t& record);

/// Registration instruction with accounts [caller (signer, writable),
/// derived target (writable), slot-creation service].
verdict::schema::instruction_t make_register_instruction(
    const program_config_t& config,
    const verdict::schema::pubkey_t& authority,
    const verdict::schema::record_request_t& record);

}  // namespace verdict::program
