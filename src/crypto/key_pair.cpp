#include <casper/common/error.hpp>
#include <casper/crypto/key_pair.hpp>
#include <casper/crypto/openssl.hpp>

#include <openssl/rand.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace casper::crypto {

namespace {

constexpr auto kMaxScalarAttempts = 64;

casper::schema::ed25519_public_key derive_ed25519(
    const casper::schema::bytes_view_t& private_key) {
  auto pkey = openssl::make_ed25519_private_key(private_key);
  if (!pkey) {
    throw common::signing_error{"invalid ed25519 private key: " +
                                openssl::last_error()};
  }
  auto public_key = casper::schema::ed25519_public_key{};
  auto size = public_key.bytes.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.bytes.data(),
                                  &size) != 1 ||
      size != public_key.bytes.size()) {
    throw common::signing_error{"failed to derive ed25519 public key: " +
                                openssl::last_error()};
  }
  return public_key;
}

casper::schema::secp256k1_public_key derive_secp256k1(
    const casper::schema::bytes_view_t& private_key) {
  auto point = openssl::derive_secp256k1_public_key(private_key);
  if (!point) {
    throw common::signing_error{
        "secp256k1 private key is not a valid curve scalar"};
  }
  return casper::schema::secp256k1_public_key{.bytes = *point};
}

private_key_t random_private_key() {
  auto private_key = private_key_t{};
  if (RAND_priv_bytes(private_key.data(),
                      static_cast<int>(private_key.size())) != 1) {
    throw common::signing_error{"secure random source failed: " +
                                openssl::last_error()};
  }
  return private_key;
}

}  // namespace

key_pair_t generate_key_pair(const casper::schema::key_algorithm algorithm) {
  if (algorithm == casper::schema::key_algorithm::ed25519) {
    auto private_key = random_private_key();
    return import_key_pair(algorithm, casper::schema::bytes_view_t{private_key});
  }
  // Redraw scalars outside [1, n).
  for (auto attempt = 0; attempt < kMaxScalarAttempts; ++attempt) {
    auto private_key = random_private_key();
    auto view = casper::schema::bytes_view_t{private_key};
    if (openssl::derive_secp256k1_public_key(view)) {
      return import_key_pair(algorithm, view);
    }
  }
  throw common::signing_error{"could not draw a valid secp256k1 scalar"};
}

key_pair_t import_key_pair(const casper::schema::key_algorithm algorithm,
                           const casper::schema::bytes_view_t& private_key) {
  auto pair = key_pair_t{.algorithm = algorithm};
  if (private_key.size() != pair.private_key.size()) {
    throw common::signing_error{
        fmt::format("{} private key must be {} bytes, got {}",
                    casper::schema::to_string(algorithm),
                    pair.private_key.size(), private_key.size())};
  }
  std::copy(std::begin(private_key), std::end(private_key),
            std::begin(pair.private_key));
  switch (algorithm) {
    case casper::schema::key_algorithm::ed25519:
      pair.public_key = derive_ed25519(private_key);
      break;
    case casper::schema::key_algorithm::secp256k1:
      pair.public_key = derive_secp256k1(private_key);
      break;
    default:
      throw common::signing_error{"unsupported key algorithm"};
  }
  return pair;
}

key_pair_t import_key_pair(const casper::schema::key_algorithm algorithm,
                           const std::string_view private_key_hex) {
  auto decoded = casper::schema::try_from_hex(private_key_hex);
  if (!decoded) {
    throw common::signing_error{"private key is not valid hex"};
  }
  return import_key_pair(algorithm, casper::schema::make_bytes_view(*decoded));
}

}  // namespace casper::crypto
