#include <gtest/gtest.h>
#include <casper/common/error.hpp>
#include <casper/schema/cl_type.hpp>
#include <casper/schema/encoding/bytesrepr/cl_type.hpp>

namespace {

namespace bytesrepr = casper::schema::encoding::bytesrepr;

casper::schema::bytes_t encode_type(const casper::schema::cl_type_t& type) {
  auto out = casper::schema::bytes_t{};
  bytesrepr::encode(type, out);
  return out;
}

casper::schema::cl_type_t decode_type(const casper::schema::bytes_t& bytes) {
  auto in = bytesrepr::decoder{casper::schema::make_bytes_view(bytes)};
  auto type = casper::schema::cl_type_t{};
  bytesrepr::decode(type, in);
  EXPECT_TRUE(in.empty());
  return type;
}

}  // namespace

TEST(cl_type, simple_types_encode_to_their_tag) {
  using casper::schema::cl_simple_type;
  EXPECT_EQ(encode_type(casper::schema::make_cl_type(cl_simple_type::boolean)),
            (casper::schema::bytes_t{0}));
  EXPECT_EQ(encode_type(casper::schema::make_cl_type(cl_simple_type::u512)),
            (casper::schema::bytes_t{8}));
  EXPECT_EQ(encode_type(casper::schema::make_cl_type(cl_simple_type::uref)),
            (casper::schema::bytes_t{12}));
  EXPECT_EQ(
      encode_type(casper::schema::make_cl_type(cl_simple_type::public_key)),
      (casper::schema::bytes_t{22}));
}

TEST(cl_type, option_u64_descriptor) {
  auto type = casper::schema::make_option_type(
      casper::schema::make_cl_type(casper::schema::cl_simple_type::u64));
  EXPECT_EQ(encode_type(type), (casper::schema::bytes_t{13, 5}));
  EXPECT_EQ(casper::schema::to_string(type), "Option(U64)");
}

TEST(cl_type, byte_array_carries_u32_length) {
  auto type = casper::schema::make_byte_array_type(32);
  EXPECT_EQ(encode_type(type), (casper::schema::bytes_t{15, 32, 0, 0, 0}));
  EXPECT_EQ(casper::schema::to_string(type), "ByteArray(32)");
}

TEST(cl_type, nested_composites_encode_recursively) {
  using casper::schema::cl_simple_type;
  auto type = casper::schema::make_map_type(
      casper::schema::make_cl_type(cl_simple_type::string),
      casper::schema::make_list_type(casper::schema::make_option_type(
          casper::schema::make_cl_type(cl_simple_type::u512))));
  EXPECT_EQ(encode_type(type), (casper::schema::bytes_t{17, 10, 14, 13, 8}));
  EXPECT_EQ(casper::schema::to_string(type), "Map(String, List(Option(U512)))");
  EXPECT_EQ(decode_type(encode_type(type)), type);
}

TEST(cl_type, equality_is_structural) {
  using casper::schema::cl_simple_type;
  auto lhs = casper::schema::make_list_type(
      casper::schema::make_cl_type(cl_simple_type::u8));
  auto rhs = casper::schema::make_list_type(
      casper::schema::make_cl_type(cl_simple_type::u8));
  auto other = casper::schema::make_list_type(
      casper::schema::make_cl_type(cl_simple_type::u32));
  EXPECT_EQ(lhs, rhs);
  EXPECT_FALSE(lhs == other);
  EXPECT_FALSE(casper::schema::make_byte_array_type(32) ==
               casper::schema::make_byte_array_type(33));
}

TEST(cl_type, decode_rejects_unknown_tag) {
  auto bytes = casper::schema::bytes_t{16};
  auto in = bytesrepr::decoder{casper::schema::make_bytes_view(bytes)};
  auto type = casper::schema::cl_type_t{};
  EXPECT_THROW(bytesrepr::decode(type, in), casper::common::encoding_error);
}

TEST(cl_type, decode_rejects_truncated_descriptor) {
  auto option_without_inner = casper::schema::bytes_t{13};
  auto in = bytesrepr::decoder{
      casper::schema::make_bytes_view(option_without_inner)};
  auto type = casper::schema::cl_type_t{};
  EXPECT_THROW(bytesrepr::decode(type, in), casper::common::encoding_error);

  auto short_byte_array = casper::schema::bytes_t{15, 32, 0};
  auto in_short = bytesrepr::decoder{
      casper::schema::make_bytes_view(short_byte_array)};
  EXPECT_THROW(bytesrepr::decode(type, in_short),
               casper::common::encoding_error);
}

TEST(cl_type, decode_rejects_unbounded_nesting) {
  auto bytes = casper::schema::bytes_t(1000, 13);
  bytes.push_back(5);
  auto in = bytesrepr::decoder{casper::schema::make_bytes_view(bytes)};
  auto type = casper::schema::cl_type_t{};
  EXPECT_THROW(bytesrepr::decode(type, in), casper::common::encoding_error);
}
