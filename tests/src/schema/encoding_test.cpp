#include <gtest/gtest.h>
#include <casper/common/error.hpp>
#include <casper/deploy/items.hpp>
#include <casper/schema/encoding/bytesrepr/encoder.hpp>
#include <casper/testing/common.hpp>

#include <string>

namespace {

using encoder_t = casper::schema::encoding::encoder<
    casper::schema::encoding::bytesrepr_encoder_tag>;
using casper::schema::bytes_t;

}  // namespace

TEST(bytesrepr, runtime_args_are_count_name_value_type) {
  auto args = casper::schema::runtime_args_t{
      {.name = "x", .value = casper::schema::make_cl_u8(5)}};
  auto encoded = encoder_t{}.encode(args);
  EXPECT_EQ(encoded, (bytes_t{1, 0, 0, 0,         // count
                              1, 0, 0, 0, 'x',    // name
                              1, 0, 0, 0, 5,      // value
                              3}));               // U8
}

TEST(bytesrepr, standard_payment_layout) {
  auto encoded =
      encoder_t{}.encode(casper::deploy::make_standard_payment("100000000"));
  EXPECT_EQ(casper::schema::to_hex(encoded),
            "00000000000100000006000000616d6f756e74050000000400e1f50508");
}

TEST(bytesrepr, transfer_session_layout) {
  auto encoded = encoder_t{}.encode(
      casper::deploy::make_transfer(casper::testing::kAllATarget, "2500000000"));
  EXPECT_EQ(casper::schema::to_hex(encoded),
            "050300000006000000616d6f756e74050000000400f902950806000000746172"
            "676574220000000" "2" + std::string(66, 'a') +
                "1602000000696401000000000d05");
}

TEST(bytesrepr, stored_items_lead_with_their_tag) {
  auto hash = casper::testing::make_hash(1);
  auto by_hash = encoder_t{}.encode(
      casper::deploy::make_contract_call_by_hash(hash, "mint"));
  ASSERT_EQ(by_hash.size(), 1u + 32u + 4u + 4u + 4u);
  EXPECT_EQ(by_hash[0], 1);
  EXPECT_EQ(by_hash[1], 1);
  EXPECT_EQ(by_hash[32], 32);

  auto by_name =
      encoder_t{}.encode(casper::deploy::make_contract_call_by_name("erc20", "mint"));
  EXPECT_EQ(by_name[0], 2);
  EXPECT_EQ(by_name.size(), 1u + 9u + 8u + 4u);

  auto module = encoder_t{}.encode(casper::deploy::make_module_bytes({0xAA}));
  EXPECT_EQ(module, (bytes_t{0, 1, 0, 0, 0, 0xAA, 0, 0, 0, 0}));
}

TEST(bytesrepr, versioned_items_encode_optional_version) {
  auto hash = casper::testing::make_hash(1);
  auto latest = encoder_t{}.encode(
      casper::deploy::make_versioned_contract_call_by_hash(hash, std::nullopt,
                                                           "go"));
  EXPECT_EQ(latest[0], 3);
  EXPECT_EQ(latest[33], 0);
  EXPECT_EQ(latest.size(), 1u + 32u + 1u + 6u + 4u);

  auto pinned = encoder_t{}.encode(
      casper::deploy::make_versioned_contract_call_by_name("pkg", 2u, "go"));
  EXPECT_EQ(pinned[0], 4);
  // tag, name, Some(2)
  EXPECT_EQ(pinned[8], 1);
  EXPECT_EQ(pinned[9], 2);
  EXPECT_EQ(pinned.size(), 1u + 7u + 5u + 6u + 4u);
}

TEST(bytesrepr, header_field_order) {
  auto deploy = casper::testing::make_transfer_deploy();
  auto encoded = encoder_t{}.encode(deploy.header);
  EXPECT_EQ(casper::schema::to_hex(encoded),
            "01d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f70751"
            "1a0068e5cf8b01000040771b000000000001000000000000008db58df96e0501"
            "1b2fa492e02d58a6c8445e068b26ca07c6795479b7228764cc000000000b0000"
            "006361737065722d74657374");
}

TEST(bytesrepr, header_lists_dependencies_after_count) {
  auto deploy = casper::testing::make_transfer_builder()
                    .dependency(casper::testing::make_hash(7))
                    .build();
  auto encoded = encoder_t{}.encode(deploy.header);
  auto without = encoder_t{}.encode(casper::testing::make_transfer_deploy().header);
  EXPECT_EQ(encoded.size(), without.size() + 32u);
}

TEST(bytesrepr, deploy_decodes_back_to_the_same_bytes) {
  auto deploy = casper::testing::make_transfer_deploy();
  auto encoded = encoder_t{}.encode(deploy);
  auto decoded = encoder_t{}.decode<casper::schema::deploy_t>(
      casper::schema::make_bytes_view(encoded));
  EXPECT_EQ(decoded.hash, deploy.hash);
  EXPECT_EQ(decoded.header.chain_name, "casper-test");
  EXPECT_EQ(encoder_t{}.encode(decoded), encoded);
}

TEST(bytesrepr, try_decode_rejects_trailing_and_truncated_bytes) {
  auto encoded = encoder_t{}.encode(std::string{"abc"});
  auto extended = encoded;
  extended.push_back(0);
  EXPECT_FALSE(encoder_t{}
                   .try_decode<std::string>(
                       casper::schema::make_bytes_view(extended))
                   .has_value());
  encoded.pop_back();
  EXPECT_FALSE(encoder_t{}
                   .try_decode<std::string>(
                       casper::schema::make_bytes_view(encoded))
                   .has_value());
  EXPECT_THROW(encoder_t{}.decode<std::string>(
                   casper::schema::make_bytes_view(extended)),
               casper::common::encoding_error);
}

TEST(bytesrepr, big_integer_decode_round_trips) {
  for (const auto* text : {"0", "1", "255", "256", "2500000000",
                           "115792089237316195423570985008687907853269984665640564039457584007913129639935"}) {
    auto value = casper::schema::u512_t{text};
    auto encoded = encoder_t{}.encode(value);
    EXPECT_EQ(encoder_t{}.decode<casper::schema::u512_t>(
                  casper::schema::make_bytes_view(encoded)),
              value)
        << text;
  }
  auto zero = encoder_t{}.encode(casper::schema::u512_t{0});
  EXPECT_EQ(zero, (bytes_t{1, 0}));
}

TEST(bytesrepr, unknown_executable_item_tag_is_rejected) {
  auto bytes = bytes_t{6, 0, 0, 0, 0};
  EXPECT_THROW(encoder_t{}.decode<casper::schema::executable_deploy_item_t>(
                   casper::schema::make_bytes_view(bytes)),
               casper::common::encoding_error);
}
