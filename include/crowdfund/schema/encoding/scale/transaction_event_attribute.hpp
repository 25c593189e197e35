#pragma once
#include <crowdfund/schema/transaction_event_attribute.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema::encoding::scale {

void encode(crowdfund::schema::transaction_event_attribute<1>&& o, ::scale::Encoder& encoder);
void decode(crowdfund::schema::transaction_event_attribute<1>&& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema::encoding::scale
