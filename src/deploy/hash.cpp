#include <casper/blake2b/hash.hpp>
#include <casper/deploy/hash.hpp>
#include <casper/schema/encoding/bytesrepr/encoder.hpp>

namespace casper::deploy {

namespace {

using bytesrepr_encoder = casper::schema::encoding::encoder<
    casper::schema::encoding::bytesrepr_encoder_tag>;

}  // namespace

casper::schema::hash32_t compute_body_hash(
    const casper::schema::executable_deploy_item_t& payment,
    const casper::schema::executable_deploy_item_t& session) {
  auto encoder = bytesrepr_encoder{};
  auto body = encoder.encode(payment);
  encoder.encode(session, body);
  return casper::blake2b::hash(casper::schema::make_bytes_view(body));
}

casper::schema::hash32_t compute_deploy_hash(
    const casper::schema::deploy_header_t& header) {
  auto encoder = bytesrepr_encoder{};
  auto bytes = encoder.encode(header);
  return casper::blake2b::hash(casper::schema::make_bytes_view(bytes));
}

}  // namespace casper::deploy
