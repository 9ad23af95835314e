#include <verdict/schema/encoding/scale/transaction.hpp>

using namespace verdict::schema;

namespace verdict::schema::encoding::scale {

void encode(account_meta&& o, ::scale::Encoder& encoder) {
  encode(o.key, encoder);
  encode(o.is_signer, encoder);
  encode(o.is_writable, encoder);
}

void decode(account_meta&& o, ::scale::Decoder& decoder) {
  decode(o.key, decoder);
  decode(o.is_signer, decoder);
  decode(o.is_writable, decoder);
}

void encode(instruction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.program_id, encoder);
  encode(o.accounts, encoder);
  encode(o.data, encoder);
}

void decode(instruction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.program_id, decoder);
  decode(o.accounts, decoder);
  decode(o.data, decoder);
}

// Signatures cover exactly these bytes.
void encode(message<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.recent_blockhash, encoder);
  encode(o.instructions, encoder);
}

void decode(message<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.recent_blockhash, decoder);
  decode(o.instructions, decoder);
}

void encode(signature_entry&& o, ::scale::Encoder& encoder) {
  encode(o.signer, encoder);
  encode(o.signature, encoder);
}

void decode(signature_entry&& o, ::scale::Decoder& decoder) {
  decode(o.signer, decoder);
  decode(o.signature, decoder);
}

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.message, encoder);
  encode(o.signatures, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.message, decoder);
  decode(o.signatures, decoder);
}

}  // namespace verdict::schema::encoding::scale
