#pragma once
#include <verdict/schema/primitives.hpp>
#include <verdict/schema/verdict_entry.hpp>
#include <optional>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Tagged SCALE framing for the variable-layout schema: an 8-byte type tag
// followed by the SCALE encoding of the value.
namespace verdict::schema::encoding::scale {

void encode(store_verdict_args<1>&& o, ::scale::Encoder& encoder);
void decode(store_verdict_args<1>&& o, ::scale::Decoder& decoder);

void encode(verdict_entry<1>&& o, ::scale::Encoder& encoder);
void decode(verdict_entry<1>&& o, ::scale::Decoder& decoder);

verdict::schema::bytes_t encode_store_verdict(
    const verdict::schema::store_verdict_args_t& args);

/// std::nullopt on a wrong tag or an undecodable body.
std::optional<verdict::schema::store_verdict_args_t> try_decode_store_verdict(
    const verdict::schema::bytes_view_t& instruction_data);

verdict::schema::bytes_t encode_verdict_entry(
    const verdict::schema::verdict_entry_t& entry);

std::optional<verdict::schema::verdict_entry_t> try_decode_verdict_entry(
    const verdict::schema::bytes_view_t& slot_data);

}  // namespace verdict::schema::encoding::scale
