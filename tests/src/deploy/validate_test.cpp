#include <gtest/gtest.h>
#include <casper/deploy/items.hpp>
#include <casper/deploy/signer.hpp>
#include <casper/deploy/validate.hpp>
#include <casper/testing/common.hpp>

TEST(validate_deploy, accepts_built_and_signed_deploys) {
  auto deploy = casper::deploy::sign_deploy(
      casper::testing::make_transfer_deploy(),
      casper::testing::make_secp256k1_key_pair());
  auto result = casper::deploy::validate_deploy(deploy);
  EXPECT_TRUE(result.valid) << result.reason;
  EXPECT_TRUE(result.reason.empty());
}

TEST(validate_deploy, detects_tampered_session) {
  auto deploy = casper::testing::make_transfer_deploy();
  deploy.session = casper::deploy::make_transfer(casper::testing::kAllATarget,
                                                 "1");
  auto result = casper::deploy::validate_deploy(deploy);
  EXPECT_FALSE(result.valid);
  EXPECT_NE(result.reason.find("body hash"), std::string::npos);
}

TEST(validate_deploy, detects_tampered_header) {
  auto deploy = casper::testing::make_transfer_deploy();
  deploy.header.gas_price += 1;
  auto result = casper::deploy::validate_deploy(deploy);
  EXPECT_FALSE(result.valid);
  EXPECT_NE(result.reason.find("deploy hash"), std::string::npos);
}

TEST(validate_deploy, detects_forged_approval) {
  auto deploy = casper::deploy::sign_deploy(
      casper::testing::make_transfer_deploy(),
      casper::testing::make_ed25519_key_pair());
  deploy.approvals[0].signer =
      casper::testing::make_secp256k1_key_pair().public_key;
  auto result = casper::deploy::validate_deploy(deploy);
  EXPECT_FALSE(result.valid);
  EXPECT_NE(result.reason.find("approval 0"), std::string::npos);
}
