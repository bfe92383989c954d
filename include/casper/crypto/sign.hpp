#pragma once

#include <casper/crypto/key_pair.hpp>
#include <casper/schema/primitives.hpp>

namespace casper::crypto {

// Returns the algorithm tag followed by 64 signature bytes.
// Ed25519 signs `message` directly. secp256k1 signs SHA-256(message) with
// ECDSA and emits r || s big-endian with s normalized to the lower half of
// the group order.
// Throws common::signing_error.
casper::schema::bytes_t sign(const casper::schema::bytes_view_t& message,
                             const key_pair_t& key_pair);

}  // namespace casper::crypto
