#pragma once
#include <casper/schema/primitives.hpp>
#include <optional>
#include <span>

namespace casper::schema::encoding {

// The wire format is picked at build time through the tag type, e.g.
// encoder<bytesrepr_encoder_tag>.
template <typename Library>
struct encoder {
  template <typename T>
  casper::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, casper::schema::bytes_t& out);

  template <typename T>
  T decode(const casper::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const casper::schema::bytes_view_t& bytes);
};

}  // namespace casper::schema::encoding
