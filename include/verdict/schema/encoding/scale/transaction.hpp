#pragma once
#include <verdict/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verdict::schema::encoding::scale {

void encode(account_meta&& o, ::scale::Encoder& encoder);
void decode(account_meta&& o, ::scale::Decoder& decoder);

void encode(instruction<1>&& o, ::scale::Encoder& encoder);
void decode(instruction<1>&& o, ::scale::Decoder& decoder);

void encode(message<1>&& o, ::scale::Encoder& encoder);
void decode(message<1>&& o, ::scale::Decoder& decoder);

void encode(signature_entry&& o, ::scale::Encoder& encoder);
void decode(signature_entry&& o, ::scale::Decoder& decoder);

void encode(transaction<1>&& o, ::scale::Encoder& encoder);
void decode(transaction<1>&& o, ::scale::Decoder& decoder);

}  // namespace verdict::schema::encoding::scale
