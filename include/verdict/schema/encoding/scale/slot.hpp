#pragma once
#include <verdict/schema/slot.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verdict::schema::encoding::scale {

void encode(slot<1>&& o, ::scale::Encoder& encoder);
void decode(slot<1>&& o, ::scale::Decoder& decoder);

}  // namespace verdict::schema::encoding::scale
