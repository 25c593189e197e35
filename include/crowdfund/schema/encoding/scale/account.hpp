#pragma once
#include <crowdfund/schema/account.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema::encoding::scale {

void encode(crowdfund::schema::account<1>&& o, ::scale::Encoder& encoder);
void decode(crowdfund::schema::account<1>&& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema::encoding::scale
