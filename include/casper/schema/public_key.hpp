#pragma once

#include <array>
#include <casper/schema/key_algorithm.hpp>
#include <casper/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace casper::schema {

struct ed25519_public_key final {
  std::array<uint8_t, 32> bytes{};

  bool operator==(const ed25519_public_key&) const = default;
};

// Compressed SEC1 point.
struct secp256k1_public_key final {
  std::array<uint8_t, 33> bytes{};

  bool operator==(const secp256k1_public_key&) const = default;
};

using public_key_t = std::variant<ed25519_public_key, secp256k1_public_key>;

key_algorithm algorithm_of(const public_key_t& key);

// Key bytes without the algorithm tag.
bytes_view_t raw_bytes(const public_key_t& key);

// Tag-prefixed bytes, the form used in headers, approvals and CLValues.
bytes_t to_bytes(const public_key_t& key);
std::string to_hex(const public_key_t& key);

std::optional<public_key_t> try_make_public_key(const bytes_view_t& prefixed);
std::optional<public_key_t> try_make_public_key(std::string_view prefixed_hex);

// Throws common::encoding_error on malformed input.
public_key_t make_public_key(const bytes_view_t& prefixed);
public_key_t make_public_key(std::string_view prefixed_hex);
public_key_t make_public_key(key_algorithm algorithm, const bytes_view_t& raw);

}  // namespace casper::schema
