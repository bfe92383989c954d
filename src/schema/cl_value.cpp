#include <casper/common/error.hpp>
#include <casper/schema/cl_value.hpp>
#include <casper/schema/encoding/bytesrepr/primitives.hpp>

#include <algorithm>
#include <limits>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace casper::schema {

namespace bytesrepr = encoding::bytesrepr;

namespace {

template <typename T>
cl_value_t make_simple(const cl_simple_type type,
                       const T& value,
                       std::string parsed) {
  auto result = cl_value_t{.type = make_cl_type(type), .parsed = std::move(parsed)};
  bytesrepr::encode(value, result.bytes);
  return result;
}

hash32_t make_address(const std::string_view hex, const std::string_view what) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    throw common::encoding_error{
        fmt::format("{} must be 32 bytes of hex, got '{}'", what, hex)};
  }
  return make_hash32(make_bytes_view(*decoded));
}

cl_value_t make_big_uint(const cl_simple_type type,
                         const std::string_view decimal,
                         const unsigned bits) {
  auto value = parse_big_uint(decimal, bits);
  return make_simple(type, value, value.str());
}

}  // namespace

u512_t parse_big_uint(const std::string_view decimal, const unsigned bits) {
  if (decimal.empty() ||
      !std::all_of(decimal.begin(), decimal.end(),
                   [](const char c) { return c >= '0' && c <= '9'; })) {
    throw common::encoding_error{
        fmt::format("'{}' is not a non-negative decimal integer", decimal)};
  }
  auto value = boost::multiprecision::cpp_int{std::string{decimal}};
  auto max = (boost::multiprecision::cpp_int{1} << bits) - 1;
  if (value > max) {
    throw common::encoding_error{
        fmt::format("'{}' does not fit in {} bits", decimal, bits)};
  }
  return u512_t{value};
}

cl_value_t make_cl_bool(const bool value) {
  return make_simple(cl_simple_type::boolean, value, value ? "true" : "false");
}

cl_value_t make_cl_i32(const int32_t value) {
  return make_simple(cl_simple_type::i32, value, std::to_string(value));
}

cl_value_t make_cl_i64(const int64_t value) {
  return make_simple(cl_simple_type::i64, value, std::to_string(value));
}

cl_value_t make_cl_u8(const uint8_t value) {
  return make_simple(cl_simple_type::u8, value, std::to_string(value));
}

cl_value_t make_cl_u32(const uint32_t value) {
  return make_simple(cl_simple_type::u32, value, std::to_string(value));
}

cl_value_t make_cl_u64(const uint64_t value) {
  return make_simple(cl_simple_type::u64, value, std::to_string(value));
}

cl_value_t make_cl_u128(const std::string_view decimal) {
  return make_big_uint(cl_simple_type::u128, decimal, 128);
}

cl_value_t make_cl_u256(const std::string_view decimal) {
  return make_big_uint(cl_simple_type::u256, decimal, 256);
}

cl_value_t make_cl_u512(const std::string_view decimal) {
  return make_big_uint(cl_simple_type::u512, decimal, 512);
}

cl_value_t make_cl_u512(const u512_t& value) {
  return make_simple(cl_simple_type::u512, value, value.str());
}

cl_value_t make_cl_string(const std::string_view value) {
  auto result = cl_value_t{.type = make_cl_type(cl_simple_type::string),
                           .parsed = std::string{value}};
  bytesrepr::encode_string(value, result.bytes);
  return result;
}

cl_value_t make_cl_unit() {
  return cl_value_t{.type = make_cl_type(cl_simple_type::unit)};
}

cl_value_t make_cl_public_key(const public_key_t& key) {
  return make_simple(cl_simple_type::public_key, key, to_hex(key));
}

cl_value_t make_cl_public_key(const std::string_view prefixed_hex) {
  return make_cl_public_key(make_public_key(prefixed_hex));
}

cl_value_t make_cl_key(const key_variant variant, const bytes_view_t& key) {
  auto address = make_hash32(key);
  auto result = cl_value_t{
      .type = make_cl_type(cl_simple_type::key),
      .parsed = fmt::format("{}:{}", to_string(variant), to_hex(address))};
  bytesrepr::encode(static_cast<uint8_t>(variant), result.bytes);
  bytesrepr::encode(address, result.bytes);
  return result;
}

cl_value_t make_cl_key(const std::string_view variant,
                       const std::string_view key_hex) {
  auto parsed_variant = try_from_string<key_variant>(variant);
  if (!parsed_variant) {
    throw common::argument_error{
        fmt::format("unknown key variant '{}'", variant)};
  }
  auto address = make_address(key_hex, "key");
  return make_cl_key(*parsed_variant, make_bytes_view(address));
}

cl_value_t make_cl_uref(const std::string_view uref_hex,
                        const uint8_t access_rights) {
  auto address = make_address(uref_hex, "uref address");
  auto result = cl_value_t{
      .type = make_cl_type(cl_simple_type::uref),
      .parsed = fmt::format("uref-{}-{:03o}", to_hex(address), access_rights)};
  bytesrepr::encode(address, result.bytes);
  bytesrepr::encode(access_rights, result.bytes);
  return result;
}

cl_value_t make_cl_account_hash(std::string_view account_hash) {
  if (account_hash.starts_with(kAccountHashPrefix)) {
    account_hash.remove_prefix(kAccountHashPrefix.size());
  }
  auto address = make_address(account_hash, "account hash");
  auto result = cl_value_t{
      .type = make_byte_array_type(32),
      .parsed = fmt::format("{}{}", kAccountHashPrefix, to_hex(address))};
  bytesrepr::encode(address, result.bytes);
  return result;
}

cl_value_t make_cl_option(const cl_value_t& some) {
  auto result = cl_value_t{.type = make_option_type(some.type),
                           .parsed = some.parsed};
  bytesrepr::encode(uint8_t{1}, result.bytes);
  bytesrepr::encode_raw(make_bytes_view(some.bytes), result.bytes);
  return result;
}

cl_value_t make_cl_option_none(cl_type_t inner) {
  auto result = cl_value_t{.type = make_option_type(std::move(inner)),
                           .parsed = "None"};
  bytesrepr::encode(uint8_t{0}, result.bytes);
  return result;
}

cl_value_t make_cl_option_u64(const std::optional<uint64_t> value) {
  if (!value) {
    return make_cl_option_none(make_cl_type(cl_simple_type::u64));
  }
  return make_cl_option(make_cl_u64(*value));
}

cl_value_t make_cl_byte_array(const bytes_view_t& bytes) {
  if (bytes.size() > std::numeric_limits<uint32_t>::max()) {
    throw common::encoding_error{"byte array longer than u32::MAX"};
  }
  auto result = cl_value_t{
      .type = make_byte_array_type(static_cast<uint32_t>(bytes.size())),
      .bytes = make_bytes(bytes),
      .parsed = to_hex(bytes)};
  return result;
}

cl_value_t make_cl_list(cl_type_t item_type,
                        const std::vector<cl_value_t>& items) {
  auto result = cl_value_t{.type = make_list_type(item_type)};
  bytesrepr::encode_length(items.size(), result.bytes);
  auto parsed = std::vector<std::string>{};
  parsed.reserve(items.size());
  for (const auto& item : items) {
    if (!(item.type == item_type)) {
      throw common::encoding_error{
          fmt::format("list item of type {} in {}", to_string(item.type),
                      to_string(result.type))};
    }
    bytesrepr::encode_raw(make_bytes_view(item.bytes), result.bytes);
    parsed.push_back(item.parsed);
  }
  result.parsed = fmt::format("[{}]", fmt::join(parsed, ", "));
  return result;
}

cl_value_t make_cl_map(
    cl_type_t key_type,
    cl_type_t value_type,
    const std::vector<std::pair<cl_value_t, cl_value_t>>& entries) {
  auto result = cl_value_t{.type = make_map_type(key_type, value_type)};
  bytesrepr::encode_length(entries.size(), result.bytes);
  auto parsed = std::vector<std::string>{};
  parsed.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    if (!(key.type == key_type) || !(value.type == value_type)) {
      throw common::encoding_error{
          fmt::format("map entry ({}, {}) in {}", to_string(key.type),
                      to_string(value.type), to_string(result.type))};
    }
    bytesrepr::encode_raw(make_bytes_view(key.bytes), result.bytes);
    bytesrepr::encode_raw(make_bytes_view(value.bytes), result.bytes);
    parsed.push_back(fmt::format("{}: {}", key.parsed, value.parsed));
  }
  result.parsed = fmt::format("{{{}}}", fmt::join(parsed, ", "));
  return result;
}

}  // namespace casper::schema
