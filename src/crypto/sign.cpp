#include <casper/common/error.hpp>
#include <casper/crypto/openssl.hpp>
#include <casper/crypto/sign.hpp>

#include <array>
#include <vector>

namespace casper::crypto {

namespace {

constexpr std::size_t kSignatureSize = 64;
constexpr int kScalarSize = 32;

void sign_ed25519(const casper::schema::bytes_view_t& message,
                  const key_pair_t& key_pair,
                  casper::schema::bytes_t& out) {
  auto pkey = openssl::make_ed25519_private_key(
      casper::schema::bytes_view_t{key_pair.private_key});
  if (!pkey) {
    throw common::signing_error{"invalid ed25519 private key: " +
                                openssl::last_error()};
  }
  auto ctx = openssl::evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr,
                                 pkey.get()) != 1) {
    throw common::signing_error{"ed25519 sign init failed: " +
                                openssl::last_error()};
  }
  auto signature = std::array<uint8_t, kSignatureSize>{};
  auto size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                     message.size()) != 1 ||
      size != signature.size()) {
    throw common::signing_error{"ed25519 sign failed: " +
                                openssl::last_error()};
  }
  out.insert(std::end(out), std::begin(signature), std::end(signature));
}

void sign_secp256k1(const casper::schema::bytes_view_t& message,
                    const key_pair_t& key_pair,
                    casper::schema::bytes_t& out) {
  auto public_key = casper::schema::raw_bytes(key_pair.public_key);
  auto pkey = openssl::make_secp256k1_private_key(
      casper::schema::bytes_view_t{key_pair.private_key}, public_key);
  if (!pkey) {
    throw common::signing_error{"invalid secp256k1 private key: " +
                                openssl::last_error()};
  }

  auto ctx = openssl::evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                                 pkey.get()) != 1) {
    throw common::signing_error{"secp256k1 sign init failed: " +
                                openssl::last_error()};
  }
  auto der_size = std::size_t{};
  if (EVP_DigestSign(ctx.get(), nullptr, &der_size, message.data(),
                     message.size()) != 1) {
    throw common::signing_error{"secp256k1 sign failed: " +
                                openssl::last_error()};
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_DigestSign(ctx.get(), der.data(), &der_size, message.data(),
                     message.size()) != 1) {
    throw common::signing_error{"secp256k1 sign failed: " +
                                openssl::last_error()};
  }

  const auto* der_ptr = der.data();
  auto ecdsa_sig =
      openssl::ecdsa_sig_ptr{d2i_ECDSA_SIG(nullptr, &der_ptr,
                                           static_cast<long>(der_size)),
                             ECDSA_SIG_free};
  if (!ecdsa_sig) {
    throw common::signing_error{"secp256k1 signature is not valid DER"};
  }
  const auto* r = ECDSA_SIG_get0_r(ecdsa_sig.get());
  const auto* s = ECDSA_SIG_get0_s(ecdsa_sig.get());

  auto group = openssl::make_secp256k1_group();
  auto half_order = openssl::bignum_ptr{BN_new(), BN_free};
  auto low_s = openssl::bignum_ptr{BN_dup(s), BN_free};
  if (!group || !half_order || !low_s ||
      BN_rshift1(half_order.get(), EC_GROUP_get0_order(group.get())) != 1) {
    throw common::signing_error{"secp256k1 group setup failed: " +
                                openssl::last_error()};
  }
  if (BN_cmp(low_s.get(), half_order.get()) > 0 &&
      BN_sub(low_s.get(), EC_GROUP_get0_order(group.get()), s) != 1) {
    throw common::signing_error{"secp256k1 low-s normalization failed"};
  }

  auto compact = std::array<uint8_t, kSignatureSize>{};
  if (BN_bn2binpad(r, compact.data(), kScalarSize) != kScalarSize ||
      BN_bn2binpad(low_s.get(), compact.data() + kScalarSize, kScalarSize) !=
          kScalarSize) {
    throw common::signing_error{"secp256k1 signature scalar overflow"};
  }
  out.insert(std::end(out), std::begin(compact), std::end(compact));
}

}  // namespace

casper::schema::bytes_t sign(const casper::schema::bytes_view_t& message,
                             const key_pair_t& key_pair) {
  if (casper::schema::algorithm_of(key_pair.public_key) != key_pair.algorithm) {
    throw common::signing_error{"key pair algorithm does not match its public key"};
  }
  auto out = casper::schema::bytes_t{};
  out.reserve(kSignatureSize + 1);
  out.push_back(casper::schema::tag(key_pair.algorithm));
  switch (key_pair.algorithm) {
    case casper::schema::key_algorithm::ed25519:
      sign_ed25519(message, key_pair, out);
      break;
    case casper::schema::key_algorithm::secp256k1:
      sign_secp256k1(message, key_pair, out);
      break;
    default:
      throw common::signing_error{"unsupported key algorithm"};
  }
  return out;
}

}  // namespace casper::crypto
