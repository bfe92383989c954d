#include <casper/crypto/openssl.hpp>

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

namespace casper::crypto::openssl {

namespace {

using ossl_param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using ossl_param_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

constexpr auto kSecp256k1GroupName = "secp256k1";

evp_pkey_ptr make_secp256k1_key(const OSSL_PARAM* params, const int selection) {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw_pkey, selection,
                        const_cast<OSSL_PARAM*>(params)) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

}  // namespace

evp_pkey_ptr make_ed25519_private_key(
    const casper::schema::bytes_view_t& private_key) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   private_key.data(), private_key.size()),
      EVP_PKEY_free};
}

evp_pkey_ptr make_ed25519_public_key(
    const casper::schema::bytes_view_t& public_key) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                  public_key.size()),
      EVP_PKEY_free};
}

evp_pkey_ptr make_secp256k1_public_key(
    const casper::schema::bytes_view_t& public_key) {
  auto* group_name = const_cast<char*>(kSecp256k1GroupName);
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(public_key.data()),
                     public_key.size()),
                 OSSL_PARAM_construct_end()};
  return make_secp256k1_key(params.data(), EVP_PKEY_PUBLIC_KEY);
}

evp_pkey_ptr make_secp256k1_private_key(
    const casper::schema::bytes_view_t& private_key,
    const casper::schema::bytes_view_t& public_key) {
  auto empty = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto scalar = bignum_ptr{BN_bin2bn(private_key.data(),
                                     static_cast<int>(private_key.size()),
                                     nullptr),
                           BN_free};
  auto builder = ossl_param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!scalar || !builder) {
    return empty;
  }
  if (OSSL_PARAM_BLD_push_utf8_string(builder.get(),
                                      OSSL_PKEY_PARAM_GROUP_NAME,
                                      kSecp256k1GroupName, 0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             scalar.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_key.data(),
                                       public_key.size()) != 1) {
    return empty;
  }
  auto params = ossl_param_ptr{OSSL_PARAM_BLD_to_param(builder.get()),
                               OSSL_PARAM_free};
  if (!params) {
    return empty;
  }
  return make_secp256k1_key(params.get(), EVP_PKEY_KEYPAIR);
}

ec_group_ptr make_secp256k1_group() {
  return ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                      EC_GROUP_free};
}

std::optional<std::array<uint8_t, 33>> derive_secp256k1_public_key(
    const casper::schema::bytes_view_t& private_key) {
  if (private_key.size() != 32) {
    return std::nullopt;
  }
  auto group = make_secp256k1_group();
  auto bn_ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto scalar = bignum_ptr{BN_bin2bn(private_key.data(),
                                     static_cast<int>(private_key.size()),
                                     nullptr),
                           BN_free};
  if (!group || !bn_ctx || !scalar) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());
  if (BN_is_zero(scalar.get()) || BN_cmp(scalar.get(), order) >= 0) {
    return std::nullopt;
  }

  auto point = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point || EC_POINT_mul(group.get(), point.get(), scalar.get(), nullptr,
                             nullptr, bn_ctx.get()) != 1) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, 33>{};
  auto written = EC_POINT_point2oct(group.get(), point.get(),
                                    POINT_CONVERSION_COMPRESSED, out.data(),
                                    out.size(), bn_ctx.get());
  if (written != out.size()) {
    return std::nullopt;
  }
  return out;
}

std::string last_error() {
  auto code = ERR_get_error();
  ERR_clear_error();
  if (code == 0) {
    return "unknown OpenSSL error";
  }
  auto buffer = std::array<char, 256>{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return std::string{buffer.data()};
}

}  // namespace casper::crypto::openssl
