#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace casper::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using u128_t = boost::multiprecision::uint128_t;
using u256_t = boost::multiprecision::uint256_t;
using u512_t = boost::multiprecision::uint512_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const hash32_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

// Hex helpers accept an optional 0x prefix and either case on input and
// always emit lowercase.
std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const bytes_t& bytes);
std::string to_hex(const hash32_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
// Throws common::encoding_error.
bytes_t from_hex(std::string_view hex);

hash32_t make_hash32(const bytes_view_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

}  // namespace casper::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
