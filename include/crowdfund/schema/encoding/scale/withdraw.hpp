#pragma once
#include <crowdfund/schema/withdraw.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema::encoding::scale {

void encode(crowdfund::schema::withdraw<1>&& o, ::scale::Encoder& encoder);
void decode(crowdfund::schema::withdraw<1>&& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema::encoding::scale
