#include <gtest/gtest.h>
#include <casper/blake2b/hash.hpp>
#include <casper/common/error.hpp>

#include <string_view>

TEST(blake2b, library_is_available) {
  EXPECT_TRUE(casper::blake2b::available());
}

TEST(blake2b, hashes_known_vectors) {
  EXPECT_EQ(casper::schema::to_hex(casper::blake2b::hash(std::string_view{})),
            "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
  EXPECT_EQ(
      casper::schema::to_hex(casper::blake2b::hash(std::string_view{"abc"})),
      "bddd813c634239723171ef3fee98579b94964e3bb1cb3e427262c8c068d52319");
}

TEST(blake2b, incremental_matches_one_shot) {
  auto hasher = casper::blake2b::hasher{};
  hasher.update(casper::schema::make_bytes_view(std::string_view{"a"}))
      .update(casper::schema::make_bytes_view(std::string_view{"bc"}));
  EXPECT_EQ(hasher.finalize(), casper::blake2b::hash(std::string_view{"abc"}));
}

TEST(blake2b, hasher_cannot_be_reused_after_finalize) {
  auto hasher = casper::blake2b::hasher{};
  static_cast<void>(hasher.finalize());
  EXPECT_THROW(hasher.finalize(), casper::common::error);
  EXPECT_THROW(hasher.update(casper::schema::bytes_view_t{}),
               casper::common::error);
}
