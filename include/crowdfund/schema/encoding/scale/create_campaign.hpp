#pragma once
#include <crowdfund/schema/create_campaign.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema::encoding::scale {

void encode(crowdfund::schema::create_campaign<1>&& o, ::scale::Encoder& encoder);
void decode(crowdfund::schema::create_campaign<1>&& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema::encoding::scale
