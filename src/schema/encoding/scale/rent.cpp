#include <crowdfund/schema/encoding/scale/rent.hpp>

using namespace crowdfund::schema;

namespace crowdfund::schema::encoding::scale {

void encode(rent<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.lamports_per_byte_year, encoder);
  encode(o.exemption_threshold_years, encoder);
  encode(o.account_storage_overhead, encoder);
}

void decode(rent<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.lamports_per_byte_year, decoder);
  decode(o.exemption_threshold_years, decoder);
  decode(o.account_storage_overhead, decoder);
}

}  // namespace crowdfund::schema::encoding::scale
