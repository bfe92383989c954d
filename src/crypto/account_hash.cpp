#include <casper/blake2b/hash.hpp>
#include <casper/crypto/account_hash.hpp>
#include <casper/crypto/openssl.hpp>
#include <casper/schema/cl_value.hpp>

namespace casper::crypto {

casper::schema::hash32_t account_hash(const casper::schema::public_key_t& key) {
  auto name = casper::schema::to_string(casper::schema::algorithm_of(key));
  auto raw = casper::schema::raw_bytes(key);
  auto hasher = casper::blake2b::hasher{};
  hasher.update(casper::schema::make_bytes_view(name));
  auto separator = uint8_t{0};
  hasher.update(casper::schema::bytes_view_t{&separator, 1});
  hasher.update(raw);
  return hasher.finalize();
}

std::string to_account_hash_string(const casper::schema::public_key_t& key) {
  return std::string{casper::schema::kAccountHashPrefix} +
         casper::schema::to_hex(account_hash(key));
}

bool is_valid_account_hash(std::string_view text) {
  if (!text.starts_with(casper::schema::kAccountHashPrefix)) {
    return false;
  }
  text.remove_prefix(casper::schema::kAccountHashPrefix.size());
  return text.size() == 64 && casper::schema::try_make_hash32(text).has_value();
}

bool is_valid_public_key(const std::string_view text) {
  auto key = casper::schema::try_make_public_key(text);
  if (!key) {
    return false;
  }
  if (std::holds_alternative<casper::schema::secp256k1_public_key>(*key)) {
    return static_cast<bool>(
        openssl::make_secp256k1_public_key(casper::schema::raw_bytes(*key)));
  }
  return true;
}

}  // namespace casper::crypto
