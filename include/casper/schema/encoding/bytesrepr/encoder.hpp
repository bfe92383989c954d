#pragma once
#include <casper/common/error.hpp>
#include <casper/schema/encoding/bytesrepr/approval.hpp>
#include <casper/schema/encoding/bytesrepr/cl_type.hpp>
#include <casper/schema/encoding/bytesrepr/cl_value.hpp>
#include <casper/schema/encoding/bytesrepr/deploy.hpp>
#include <casper/schema/encoding/bytesrepr/deploy_header.hpp>
#include <casper/schema/encoding/bytesrepr/executable_deploy_item.hpp>
#include <casper/schema/encoding/bytesrepr/primitives.hpp>
#include <casper/schema/encoding/bytesrepr/runtime_arg.hpp>
#include <casper/schema/encoding/encoder.hpp>
#include <string>

namespace casper::schema::encoding {

struct bytesrepr_encoder_tag {};

template <>
struct encoder<bytesrepr_encoder_tag> final {
  template <typename T>
  casper::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, casper::schema::bytes_t& out);

  // Throws common::encoding_error on malformed or trailing bytes.
  template <typename T>
  T decode(const casper::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const casper::schema::bytes_view_t& bytes);
};

template <typename T>
casper::schema::bytes_t encoder<bytesrepr_encoder_tag>::encode(const T& obj) {
  auto out = casper::schema::bytes_t{};
  encode(obj, out);
  return out;
}

template <typename T>
void encoder<bytesrepr_encoder_tag>::encode(const T& obj,
                                            casper::schema::bytes_t& out) {
  bytesrepr::encode(obj, out);
}

template <typename T>
T encoder<bytesrepr_encoder_tag>::decode(
    const casper::schema::bytes_view_t& bytes) {
  auto in = bytesrepr::decoder{bytes};
  auto decoded = T{};
  bytesrepr::decode(decoded, in);
  if (!in.empty()) {
    throw common::encoding_error{std::to_string(in.remaining()) +
                                 " trailing bytes after bytesrepr value"};
  }
  return decoded;
}

template <typename T>
std::optional<T> encoder<bytesrepr_encoder_tag>::try_decode(
    const casper::schema::bytes_view_t& bytes) {
  try {
    return decode<T>(bytes);
  } catch (const common::encoding_error&) {
    return std::nullopt;
  }
}

}  // namespace casper::schema::encoding
