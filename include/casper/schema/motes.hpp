#pragma once
#include <casper/schema/primitives.hpp>
#include <string>
#include <string_view>

// One CSPR is 10^9 motes. Conversions are exact.
namespace casper::schema {

inline constexpr uint64_t kMotesPerCspr = 1'000'000'000;

// "2.5" -> 2500000000. More than nine fractional digits, signs, or a result
// above U512 throw common::encoding_error.
u512_t cspr_to_motes(std::string_view cspr);

// 2500000000 -> "2.5", trailing fractional zeros removed.
std::string motes_to_cspr(const u512_t& motes);

}  // namespace casper::schema
