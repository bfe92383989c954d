#include <gtest/gtest.h>
#include <casper/common/error.hpp>
#include <casper/crypto/account_hash.hpp>
#include <casper/crypto/key_pair.hpp>
#include <casper/testing/common.hpp>

#include <string>

TEST(key_pair, imports_rfc8032_ed25519_secret) {
  auto key_pair = casper::testing::make_ed25519_key_pair();
  EXPECT_EQ(key_pair.algorithm, casper::schema::key_algorithm::ed25519);
  EXPECT_EQ(casper::schema::to_hex(key_pair.public_key),
            "01" + std::string{casper::testing::kEd25519Public});
}

TEST(key_pair, imports_secp256k1_scalar_one_as_generator) {
  auto key_pair = casper::testing::make_secp256k1_key_pair();
  EXPECT_EQ(key_pair.algorithm, casper::schema::key_algorithm::secp256k1);
  EXPECT_EQ(casper::schema::to_hex(key_pair.public_key),
            "02" + std::string{casper::testing::kSecp256k1Generator});
}

TEST(key_pair, rejects_invalid_private_keys) {
  EXPECT_THROW(casper::crypto::import_key_pair(
                   casper::schema::key_algorithm::ed25519, "abcd"),
               casper::common::signing_error);
  EXPECT_THROW(casper::crypto::import_key_pair(
                   casper::schema::key_algorithm::secp256k1,
                   std::string(64, '0')),
               casper::common::signing_error);
  // The group order itself is out of range.
  EXPECT_THROW(
      casper::crypto::import_key_pair(
          casper::schema::key_algorithm::secp256k1,
          "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"),
      casper::common::signing_error);
  EXPECT_THROW(casper::crypto::import_key_pair(
                   casper::schema::key_algorithm::ed25519, "not hex"),
               casper::common::signing_error);
}

TEST(key_pair, generates_distinct_keys) {
  for (auto algorithm : {casper::schema::key_algorithm::ed25519,
                         casper::schema::key_algorithm::secp256k1}) {
    auto first = casper::crypto::generate_key_pair(algorithm);
    auto second = casper::crypto::generate_key_pair(algorithm);
    EXPECT_EQ(casper::schema::algorithm_of(first.public_key), algorithm);
    EXPECT_NE(first.private_key, second.private_key);
    EXPECT_FALSE(first.public_key == second.public_key);
    auto reimported = casper::crypto::import_key_pair(
        algorithm, casper::schema::bytes_view_t{first.private_key});
    EXPECT_TRUE(reimported.public_key == first.public_key);
  }
}

TEST(account_hash, hashes_algorithm_name_separator_and_raw_key) {
  auto ed25519 = casper::testing::make_ed25519_key_pair();
  EXPECT_EQ(casper::crypto::to_account_hash_string(ed25519.public_key),
            "account-hash-"
            "b6c0e5c9ee25f43f57e577b5821688b9ac164eb7c4c08a24d43d1806ac721342");

  auto secp = casper::testing::make_secp256k1_key_pair();
  EXPECT_EQ(casper::schema::to_hex(casper::crypto::account_hash(secp.public_key)),
            "86937931937ee0281e50806b94f8d4993e8869b0689dfa0a21d2946ab677183c");
}

TEST(account_hash, validates_text_forms) {
  EXPECT_TRUE(casper::crypto::is_valid_account_hash(
      "account-hash-" + std::string(64, 'f')));
  EXPECT_FALSE(casper::crypto::is_valid_account_hash(std::string(64, 'f')));
  EXPECT_FALSE(casper::crypto::is_valid_account_hash(
      "account-hash-" + std::string(62, 'f')));

  EXPECT_TRUE(casper::crypto::is_valid_public_key(
      "01" + std::string{casper::testing::kEd25519Public}));
  EXPECT_TRUE(casper::crypto::is_valid_public_key(
      "02" + std::string{casper::testing::kSecp256k1Generator}));
  EXPECT_FALSE(casper::crypto::is_valid_public_key(
      "03" + std::string{casper::testing::kEd25519Public}));
}
