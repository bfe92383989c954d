#pragma once

#include <array>
#include <cstddef>
#include <casper/schema/enum_string.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: key_algorithm.
// The numeric value is the one-byte tag that prefixes public keys and
// signatures on the wire.
namespace casper::schema {

enum class key_algorithm : uint8_t {
  ed25519 = 1,
  secp256k1 = 2,
};

inline constexpr auto kKeyAlgorithmMappings = std::array{
    std::pair<std::string_view, key_algorithm>{"ed25519",
                                               key_algorithm::ed25519},
    std::pair<std::string_view, key_algorithm>{"secp256k1",
                                               key_algorithm::secp256k1},
};

template <>
inline std::optional<key_algorithm> try_from_string<key_algorithm>(
    const std::string_view value) {
  return from_string_icase(value, kKeyAlgorithmMappings);
}

inline constexpr std::string_view to_string(const key_algorithm value) {
  return to_string(value, kKeyAlgorithmMappings).value_or("unknown");
}

inline constexpr uint8_t tag(const key_algorithm value) {
  return static_cast<uint8_t>(value);
}

inline constexpr std::optional<key_algorithm> try_from_tag(const uint8_t value) {
  switch (value) {
    case tag(key_algorithm::ed25519):
      return key_algorithm::ed25519;
    case tag(key_algorithm::secp256k1):
      return key_algorithm::secp256k1;
    default:
      return std::nullopt;
  }
}

inline constexpr std::size_t public_key_size(const key_algorithm value) {
  return value == key_algorithm::ed25519 ? 32 : 33;
}

}  // namespace casper::schema
