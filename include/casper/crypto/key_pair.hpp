#pragma once

#include <array>
#include <casper/schema/key_algorithm.hpp>
#include <casper/schema/primitives.hpp>
#include <casper/schema/public_key.hpp>
#include <cstdint>
#include <string_view>

namespace casper::crypto {

// Ed25519 seed or secp256k1 big-endian scalar.
using private_key_t = std::array<uint8_t, 32>;

struct key_pair_t final {
  casper::schema::key_algorithm algorithm{casper::schema::key_algorithm::ed25519};
  private_key_t private_key{};
  casper::schema::public_key_t public_key;
};

// Fresh key material from the OpenSSL private random source.
// Throws common::signing_error.
key_pair_t generate_key_pair(casper::schema::key_algorithm algorithm);

// Derives the public key. Throws common::signing_error when the private key
// has the wrong length or is not a valid scalar.
key_pair_t import_key_pair(casper::schema::key_algorithm algorithm,
                           const casper::schema::bytes_view_t& private_key);
key_pair_t import_key_pair(casper::schema::key_algorithm algorithm,
                           std::string_view private_key_hex);

}  // namespace casper::crypto
