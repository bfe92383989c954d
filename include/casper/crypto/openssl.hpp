#pragma once

#include <array>
#include <casper/schema/primitives.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

// Owning wrappers and key constructors shared by signing, verification and
// key derivation. Constructors return an empty pointer on failure.
namespace casper::crypto::openssl {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

evp_pkey_ptr make_ed25519_private_key(
    const casper::schema::bytes_view_t& private_key);
evp_pkey_ptr make_ed25519_public_key(
    const casper::schema::bytes_view_t& public_key);

// SEC1 encoded point, compressed or not.
evp_pkey_ptr make_secp256k1_public_key(
    const casper::schema::bytes_view_t& public_key);
evp_pkey_ptr make_secp256k1_private_key(
    const casper::schema::bytes_view_t& private_key,
    const casper::schema::bytes_view_t& public_key);

ec_group_ptr make_secp256k1_group();

// Compressed public point for a 32 byte big-endian scalar, or nullopt when
// the scalar is zero or not below the group order.
std::optional<std::array<uint8_t, 33>> derive_secp256k1_public_key(
    const casper::schema::bytes_view_t& private_key);

// Most recent error on this thread's OpenSSL error queue, cleared after.
std::string last_error();

}  // namespace casper::crypto::openssl
