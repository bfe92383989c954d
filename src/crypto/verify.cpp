#include <casper/crypto/openssl.hpp>
#include <casper/crypto/verify.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <optional>
#include <vector>

namespace casper::crypto {

namespace {

constexpr std::size_t kSignatureSize = 64;

bool openssl_has_ed25519() {
  auto ctx = openssl::evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool openssl_has_secp256k1() {
  return static_cast<bool>(openssl::make_secp256k1_group());
}

std::optional<casper::schema::bytes_view_t> strip_signature_tag(
    const casper::schema::bytes_view_t& signature,
    const casper::schema::key_algorithm algorithm) {
  if (signature.size() == kSignatureSize) {
    return signature;
  }
  if (signature.size() == kSignatureSize + 1 &&
      signature[0] == casper::schema::tag(algorithm)) {
    return signature.subspan(1);
  }
  return std::nullopt;
}

bool verify_ed25519(const casper::schema::bytes_view_t& message,
                    const casper::schema::bytes_view_t& public_key,
                    const casper::schema::bytes_view_t& signature) {
  auto pkey = openssl::make_ed25519_public_key(public_key);
  if (!pkey) {
    spdlog::warn("rejecting malformed ed25519 public key: {}",
                 openssl::last_error());
    return false;
  }

  auto ctx = openssl::evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

bool verify_secp256k1(const casper::schema::bytes_view_t& message,
                      const casper::schema::bytes_view_t& public_key,
                      const casper::schema::bytes_view_t& signature) {
  auto pkey = openssl::make_secp256k1_public_key(public_key);
  if (!pkey) {
    spdlog::warn("rejecting malformed secp256k1 public key: {}",
                 openssl::last_error());
    return false;
  }

  auto ecdsa_sig = openssl::ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return false;
  }

  auto r = openssl::bignum_ptr{BN_bin2bn(signature.data(), 32, nullptr),
                               BN_free};
  auto s = openssl::bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr),
                               BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return false;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return false;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr) != der_len) {
    return false;
  }

  auto ctx = openssl::evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                           pkey.get()) == 1) {
    ok = EVP_DigestVerify(ctx.get(), der.data(), der.size(), message.data(),
                          message.size()) == 1;
  }
  return ok;
}

bool verify_raw(const casper::schema::bytes_view_t& message,
                const casper::schema::key_algorithm algorithm,
                const casper::schema::bytes_view_t& public_key,
                const casper::schema::bytes_view_t& signature) {
  auto compact = strip_signature_tag(signature, algorithm);
  if (!compact) {
    return false;
  }
  if (algorithm == casper::schema::key_algorithm::ed25519) {
    return verify_ed25519(message, public_key, *compact);
  }
  return verify_secp256k1(message, public_key, *compact);
}

}  // namespace

bool available() {
  static const auto available_now =
      openssl_has_ed25519() && openssl_has_secp256k1();
  return available_now;
}

bool verify_signature(const casper::schema::bytes_view_t& message,
                      const casper::schema::public_key_t& signer,
                      const casper::schema::bytes_view_t& signature) {
  return verify_raw(message, casper::schema::algorithm_of(signer),
                    casper::schema::raw_bytes(signer), signature);
}

bool verify_signature(const std::string_view message_hex,
                      const std::string_view signature_hex,
                      const std::string_view public_key_hex) {
  auto message = casper::schema::from_hex(message_hex);
  auto signature = casper::schema::from_hex(signature_hex);
  auto public_key = casper::schema::from_hex(public_key_hex);
  if (public_key.empty()) {
    spdlog::warn("rejecting empty public key");
    return false;
  }

  auto algorithm = public_key[0] == casper::schema::tag(
                                        casper::schema::key_algorithm::ed25519)
                       ? casper::schema::key_algorithm::ed25519
                       : casper::schema::key_algorithm::secp256k1;
  auto raw_key = casper::schema::make_bytes_view(public_key).subspan(1);
  return verify_raw(casper::schema::make_bytes_view(message), algorithm,
                    raw_key, casper::schema::make_bytes_view(signature));
}

}  // namespace casper::crypto
