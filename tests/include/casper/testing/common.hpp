#pragma once

#include <casper/crypto/key_pair.hpp>
#include <casper/deploy/builder.hpp>
#include <casper/schema/deploy.hpp>
#include <casper/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace casper::testing {

// RFC 8032 section 7.1, test 1.
inline constexpr std::string_view kEd25519Secret =
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
inline constexpr std::string_view kEd25519Public =
    "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";
inline constexpr std::string_view kEd25519EmptyMessageSignature =
    "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
    "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b";

// Scalar 1, whose public point is the curve generator.
inline constexpr std::string_view kSecp256k1ScalarOne =
    "0000000000000000000000000000000000000000000000000000000000000001";
inline constexpr std::string_view kSecp256k1Generator =
    "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";

// 33 byte secp256k1-shaped key, not a valid curve point.
inline const std::string kAllATarget = "02" + std::string(66, 'a');

inline constexpr casper::schema::timestamp_milliseconds_t kPinnedReference =
    1'700'000'030'000;

inline casper::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = casper::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline casper::crypto::key_pair_t make_ed25519_key_pair() {
  return casper::crypto::import_key_pair(casper::schema::key_algorithm::ed25519,
                                         kEd25519Secret);
}

inline casper::crypto::key_pair_t make_secp256k1_key_pair() {
  return casper::crypto::import_key_pair(
      casper::schema::key_algorithm::secp256k1, kSecp256k1ScalarOne);
}

// Transfer of 2.5 CSPR to kAllATarget paid with 0.1 CSPR, from the RFC 8032
// key, at a pinned reference time.
inline casper::deploy::deploy_builder make_transfer_builder() {
  auto builder = casper::deploy::deploy_builder{};
  builder.account(make_ed25519_key_pair().public_key)
      .timestamp(kPinnedReference)
      .standard_payment("100000000")
      .transfer(kAllATarget, "2500000000");
  return builder;
}

inline casper::schema::deploy_t make_transfer_deploy() {
  return make_transfer_builder().build();
}

}  // namespace casper::testing
