#include <casper/common/error.hpp>
#include <casper/schema/public_key.hpp>

#include <algorithm>
#include <iterator>

namespace casper::schema {

key_algorithm algorithm_of(const public_key_t& key) {
  return std::holds_alternative<ed25519_public_key>(key)
             ? key_algorithm::ed25519
             : key_algorithm::secp256k1;
}

bytes_view_t raw_bytes(const public_key_t& key) {
  return std::visit(
      [](const auto& value) {
        return bytes_view_t{value.bytes.data(), value.bytes.size()};
      },
      key);
}

bytes_t to_bytes(const public_key_t& key) {
  auto raw = raw_bytes(key);
  auto out = bytes_t{};
  out.reserve(raw.size() + 1);
  out.push_back(tag(algorithm_of(key)));
  out.insert(std::end(out), std::begin(raw), std::end(raw));
  return out;
}

std::string to_hex(const public_key_t& key) {
  return to_hex(to_bytes(key));
}

std::optional<public_key_t> try_make_public_key(const bytes_view_t& prefixed) {
  if (prefixed.empty()) {
    return std::nullopt;
  }
  auto raw = prefixed.subspan(1);
  if (prefixed[0] == tag(key_algorithm::ed25519)) {
    auto key = ed25519_public_key{};
    if (raw.size() != key.bytes.size()) {
      return std::nullopt;
    }
    std::copy(std::begin(raw), std::end(raw), std::begin(key.bytes));
    return key;
  }
  if (prefixed[0] == tag(key_algorithm::secp256k1)) {
    auto key = secp256k1_public_key{};
    if (raw.size() != key.bytes.size()) {
      return std::nullopt;
    }
    std::copy(std::begin(raw), std::end(raw), std::begin(key.bytes));
    return key;
  }
  return std::nullopt;
}

std::optional<public_key_t> try_make_public_key(
    const std::string_view prefixed_hex) {
  auto decoded = try_from_hex(prefixed_hex);
  if (!decoded) {
    return std::nullopt;
  }
  return try_make_public_key(bytes_view_t{decoded->data(), decoded->size()});
}

public_key_t make_public_key(const bytes_view_t& prefixed) {
  auto key = try_make_public_key(prefixed);
  if (!key) {
    throw common::encoding_error{"malformed public key: '" +
                                 to_hex(prefixed) + "'"};
  }
  return *key;
}

public_key_t make_public_key(const std::string_view prefixed_hex) {
  auto decoded = from_hex(prefixed_hex);
  return make_public_key(bytes_view_t{decoded.data(), decoded.size()});
}

public_key_t make_public_key(const key_algorithm algorithm,
                             const bytes_view_t& raw) {
  auto prefixed = bytes_t{};
  prefixed.reserve(raw.size() + 1);
  prefixed.push_back(tag(algorithm));
  prefixed.insert(std::end(prefixed), std::begin(raw), std::end(raw));
  return make_public_key(bytes_view_t{prefixed.data(), prefixed.size()});
}

}  // namespace casper::schema
