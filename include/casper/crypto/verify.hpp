#pragma once

#include <casper/schema/primitives.hpp>
#include <casper/schema/public_key.hpp>
#include <string_view>

namespace casper::crypto {

bool available();

// `signature` is either tagged with the signer's algorithm or the bare 64
// bytes. Mismatches and malformed key material yield false.
bool verify_signature(const casper::schema::bytes_view_t& message,
                      const casper::schema::public_key_t& signer,
                      const casper::schema::bytes_view_t& signature);

// Hex inputs. The algorithm follows the public key prefix: "01" is Ed25519,
// anything else secp256k1. Throws common::encoding_error on malformed hex.
bool verify_signature(std::string_view message_hex,
                      std::string_view signature_hex,
                      std::string_view public_key_hex);

}  // namespace casper::crypto
