#pragma once

#include <verdict/schema/primitives.hpp>
#include <verdict/schema/record_request.hpp>
#include <cstdint>
#include <span>

namespace verdict::program {

/// Values the pipeline learns after validation and bakes into the record.
struct record_context final {
  verdict::schema::pubkey_t authority{};
  uint8_t bump{};
  verdict::schema::unix_timestamp_t timestamp{};
};

using record_context_t = record_context;

/// Serialised record bytes for a request: the 73-byte fixed layout, or the
/// tagged SCALE entry for the variable schema.
verdict::schema::bytes_t encode_record(
    const verdict::schema::record_request_t& record,
    const record_context_t& context);

/// Exact slot size the record needs.
std::size_t record_size(const verdict::schema::record_request_t& record);

/// Write the record into freshly provisioned slot data. Throws
/// program_error(slot_too_small) when the slot size does not match.
void write_record(std::span<uint8_t> slot_data,
                  const verdict::schema::record_request_t& record,
                  const record_context_t& context);

}  // namespace verdict::program
