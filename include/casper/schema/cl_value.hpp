#pragma once

#include <array>
#include <casper/schema/cl_type.hpp>
#include <casper/schema/enum_string.hpp>
#include <casper/schema/primitives.hpp>
#include <casper/schema/public_key.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Schema type: cl_value.
// A typed contract argument: the descriptor, the encoded payload, and a
// human readable rendering that never reaches the wire.
namespace casper::schema {

struct cl_value_t final {
  cl_type_t type;
  bytes_t bytes;
  std::string parsed;
};

enum class key_variant : uint8_t {
  account = 0,
  hash = 1,
  uref = 2,
};

inline constexpr auto kKeyVariantMappings = std::array{
    std::pair<std::string_view, key_variant>{"account", key_variant::account},
    std::pair<std::string_view, key_variant>{"hash", key_variant::hash},
    std::pair<std::string_view, key_variant>{"uref", key_variant::uref},
};

template <>
inline std::optional<key_variant> try_from_string<key_variant>(
    const std::string_view value) {
  return from_string_icase(value, kKeyVariantMappings);
}

inline constexpr std::string_view to_string(const key_variant value) {
  return to_string(value, kKeyVariantMappings).value_or("unknown");
}

inline constexpr uint8_t kAccessRightsReadAddWrite = 0x07;
inline constexpr std::string_view kAccountHashPrefix = "account-hash-";

// Parses a non-negative decimal literal that must fit in `bits` bits.
// Throws common::encoding_error.
u512_t parse_big_uint(std::string_view decimal, unsigned bits);

cl_value_t make_cl_bool(bool value);
cl_value_t make_cl_i32(int32_t value);
cl_value_t make_cl_i64(int64_t value);
cl_value_t make_cl_u8(uint8_t value);
cl_value_t make_cl_u32(uint32_t value);
cl_value_t make_cl_u64(uint64_t value);
cl_value_t make_cl_u128(std::string_view decimal);
cl_value_t make_cl_u256(std::string_view decimal);
cl_value_t make_cl_u512(std::string_view decimal);
cl_value_t make_cl_u512(const u512_t& value);
cl_value_t make_cl_string(std::string_view value);
cl_value_t make_cl_unit();

cl_value_t make_cl_public_key(const public_key_t& key);
// The prefixed key bytes are used as given.
cl_value_t make_cl_public_key(std::string_view prefixed_hex);

cl_value_t make_cl_key(key_variant variant, const bytes_view_t& key);
// Throws common::argument_error for an unknown variant name.
cl_value_t make_cl_key(std::string_view variant, std::string_view key_hex);
cl_value_t make_cl_uref(std::string_view uref_hex,
                        uint8_t access_rights = kAccessRightsReadAddWrite);
// Accepts "account-hash-<hex>" or bare hex of 32 bytes.
cl_value_t make_cl_account_hash(std::string_view account_hash);

cl_value_t make_cl_option(const cl_value_t& some);
cl_value_t make_cl_option_none(cl_type_t inner);
cl_value_t make_cl_option_u64(std::optional<uint64_t> value);

cl_value_t make_cl_byte_array(const bytes_view_t& bytes);

// Every item must carry `item_type`; throws common::encoding_error otherwise.
cl_value_t make_cl_list(cl_type_t item_type,
                        const std::vector<cl_value_t>& items);
cl_value_t make_cl_map(
    cl_type_t key_type,
    cl_type_t value_type,
    const std::vector<std::pair<cl_value_t, cl_value_t>>& entries);

}  // namespace casper::schema
