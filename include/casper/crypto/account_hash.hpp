#pragma once

#include <casper/schema/primitives.hpp>
#include <casper/schema/public_key.hpp>
#include <string>
#include <string_view>

namespace casper::crypto {

// blake2b(lowercase algorithm name || 0x00 || raw key bytes).
casper::schema::hash32_t account_hash(const casper::schema::public_key_t& key);

// "account-hash-<hex>".
std::string to_account_hash_string(const casper::schema::public_key_t& key);

// "account-hash-" followed by 64 hex characters.
bool is_valid_account_hash(std::string_view text);

// Tag-prefixed hex of a well-formed Ed25519 or secp256k1 public key.
bool is_valid_public_key(std::string_view text);

}  // namespace casper::crypto
