#include <gtest/gtest.h>
#include <casper/common/error.hpp>
#include <casper/schema/motes.hpp>

TEST(motes, cspr_to_motes_is_exact) {
  EXPECT_EQ(casper::schema::cspr_to_motes("2.5"),
            casper::schema::u512_t{2'500'000'000u});
  EXPECT_EQ(casper::schema::cspr_to_motes("0.000000001"),
            casper::schema::u512_t{1});
  EXPECT_EQ(casper::schema::cspr_to_motes("100"),
            casper::schema::u512_t{100'000'000'000u});
  EXPECT_EQ(casper::schema::cspr_to_motes(".1"),
            casper::schema::u512_t{100'000'000u});
}

TEST(motes, cspr_to_motes_rejects_excess_precision_and_signs) {
  EXPECT_THROW(casper::schema::cspr_to_motes("0.0000000001"),
               casper::common::encoding_error);
  EXPECT_THROW(casper::schema::cspr_to_motes("-1"),
               casper::common::encoding_error);
  EXPECT_THROW(casper::schema::cspr_to_motes("."),
               casper::common::encoding_error);
  EXPECT_THROW(casper::schema::cspr_to_motes("1.2.3"),
               casper::common::encoding_error);
}

TEST(motes, motes_to_cspr_trims_trailing_zeros) {
  EXPECT_EQ(casper::schema::motes_to_cspr(casper::schema::u512_t{2'500'000'000u}),
            "2.5");
  EXPECT_EQ(casper::schema::motes_to_cspr(casper::schema::u512_t{3'000'000'000u}),
            "3");
  EXPECT_EQ(casper::schema::motes_to_cspr(casper::schema::u512_t{1}),
            "0.000000001");
  EXPECT_EQ(casper::schema::motes_to_cspr(casper::schema::u512_t{0}), "0");
}
