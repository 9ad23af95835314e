#pragma once
#include <verdict/schema/primitives.hpp>
#include <verdict/schema/verdict_record.hpp>
#include <cstdint>
#include <optional>
#include <span>

// Raw fixed-offset codec for the 73-byte verdict record. Plain byte copies:
// no padding, no length prefixes, no endianness conversion.
namespace verdict::schema::encoding::fixed {

/// Write `record` into `slot_data`. Throws program_error(slot_too_small)
/// unless the buffer is exactly kVerdictRecordSize bytes.
void write(const verdict::schema::verdict_record_t& record,
           std::span<uint8_t> slot_data);

/// Serialise into a fresh 73-byte buffer.
verdict::schema::bytes_t encode(
    const verdict::schema::verdict_record_t& record);

/// Inverse of write(); std::nullopt when the size is not exactly 73 bytes.
std::optional<verdict::schema::verdict_record_t> try_read(
    const verdict::schema::bytes_view_t& slot_data);

/// Like try_read() but throws program_error(slot_too_small).
verdict::schema::verdict_record_t read(
    const verdict::schema::bytes_view_t& slot_data);

}  // namespace verdict::schema::encoding::fixed
