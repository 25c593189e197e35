#pragma once
#include <crowdfund/schema/primitives.hpp>
#include <optional>
#include <span>

namespace crowdfund::schema::encoding {

// Wire encoding is a build time choice made through the Library tag; callers
// name encoder<scale_encoder_tag> and never the codec library directly.
template <typename Library>
struct encoder {
  template <typename T>
  crowdfund::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, crowdfund::schema::bytes_t& out);

  template <typename T>
  T decode(const crowdfund::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const crowdfund::schema::bytes_view_t& bytes);
};

}  // namespace crowdfund::schema::encoding
