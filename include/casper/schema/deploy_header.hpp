#pragma once
#include <casper/schema/primitives.hpp>
#include <casper/schema/public_key.hpp>
#include <string>
#include <vector>

// Schema type: deploy header.
// Hashed to produce the deploy hash. body_hash commits to payment and
// session.
namespace casper::schema {

template <uint16_t Version>
struct deploy_header;

template <>
struct deploy_header<1> final {
  public_key_t account;
  timestamp_milliseconds_t timestamp{};
  duration_milliseconds_t ttl{};
  uint64_t gas_price{};
  hash32_t body_hash{};
  std::vector<hash32_t> dependencies;
  std::string chain_name;
};

using deploy_header_t = deploy_header<1>;

}  // namespace casper::schema
