#include <verdict/schema/encoding/scale/encoder.hpp>
#include <verdict/schema/encoding/scale/verdict_entry.hpp>

#include <algorithm>
#include <iterator>

using namespace verdict::schema;

namespace verdict::schema::encoding::scale {

namespace {

bytes_t encode_tagged(const type_tag_t& tag, const auto& value) {
  auto out = bytes_t{std::begin(tag), std::end(tag)};
  auto encoder = scale_encoder_t{};
  encoder.encode(value, out);
  return out;
}

template <typename T>
std::optional<T> try_decode_tagged(const type_tag_t& tag,
                                   const bytes_view_t& bytes) {
  if (bytes.size() < tag.size() ||
      !std::equal(std::begin(tag), std::end(tag), std::begin(bytes))) {
    return std::nullopt;
  }
  auto encoder = scale_encoder_t{};
  return encoder.try_decode<T>(bytes.subspan(tag.size()));
}

}  // namespace

void encode(store_verdict_args<1>&& o, ::scale::Encoder& encoder) {
  encode(o.token_address, encoder);
  encode(o.chain, encoder);
  encode(o.score, encoder);
  encode(o.grade, encoder);
  encode(o.agent_count, encoder);
  encode(o.tier, encoder);
  encode(o.scan_hash, encoder);
}

void decode(store_verdict_args<1>&& o, ::scale::Decoder& decoder) {
  decode(o.token_address, decoder);
  decode(o.chain, decoder);
  decode(o.score, decoder);
  decode(o.grade, decoder);
  decode(o.agent_count, decoder);
  decode(o.tier, decoder);
  decode(o.scan_hash, decoder);
}

void encode(verdict_entry<1>&& o, ::scale::Encoder& encoder) {
  encode(o.authority, encoder);
  encode(o.token_address, encoder);
  encode(o.chain, encoder);
  encode(o.score, encoder);
  encode(o.grade, encoder);
  encode(o.agent_count, encoder);
  encode(o.tier, encoder);
  encode(o.timestamp, encoder);
  encode(o.scan_hash, encoder);
  encode(o.bump, encoder);
}

void decode(verdict_entry<1>&& o, ::scale::Decoder& decoder) {
  decode(o.authority, decoder);
  decode(o.token_address, decoder);
  decode(o.chain, decoder);
  decode(o.score, decoder);
  decode(o.grade, decoder);
  decode(o.agent_count, decoder);
  decode(o.tier, decoder);
  decode(o.timestamp, decoder);
  decode(o.scan_hash, decoder);
  decode(o.bump, decoder);
}

bytes_t encode_store_verdict(const store_verdict_args_t& args) {
  return encode_tagged(kStoreVerdictInstructionTag, args);
}

std::optional<store_verdict_args_t> try_decode_store_verdict(
    const bytes_view_t& instruction_data) {
  return try_decode_tagged<store_verdict_args_t>(kStoreVerdictInstructionTag,
                                                 instruction_data);
}

bytes_t encode_verdict_entry(const verdict_entry_t& entry) {
  return encode_tagged(kVerdictEntryTag, entry);
}

std::optional<verdict_entry_t> try_decode_verdict_entry(
    const bytes_view_t& slot_data) {
  return try_decode_tagged<verdict_entry_t>(kVerdictEntryTag, slot_data);
}

}  // namespace verdict::schema::encoding::scale
