#pragma once

#include <array>
#include <casper/schema/enum_string.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// Schema type: cl_type.
// Runtime type descriptor carried next to every contract argument. Simple
// types are a single tag, composite types nest further descriptors.
namespace casper::schema {

enum class cl_simple_type : uint8_t {
  boolean = 0,
  i32 = 1,
  i64 = 2,
  u8 = 3,
  u32 = 4,
  u64 = 5,
  u128 = 6,
  u256 = 7,
  u512 = 8,
  unit = 9,
  string = 10,
  key = 11,
  uref = 12,
  public_key = 22,
};

inline constexpr uint8_t kClOptionTag = 13;
inline constexpr uint8_t kClListTag = 14;
inline constexpr uint8_t kClByteArrayTag = 15;
inline constexpr uint8_t kClMapTag = 17;

inline constexpr auto kClSimpleTypeMappings = std::array{
    std::pair<std::string_view, cl_simple_type>{"Bool",
                                                cl_simple_type::boolean},
    std::pair<std::string_view, cl_simple_type>{"I32", cl_simple_type::i32},
    std::pair<std::string_view, cl_simple_type>{"I64", cl_simple_type::i64},
    std::pair<std::string_view, cl_simple_type>{"U8", cl_simple_type::u8},
    std::pair<std::string_view, cl_simple_type>{"U32", cl_simple_type::u32},
    std::pair<std::string_view, cl_simple_type>{"U64", cl_simple_type::u64},
    std::pair<std::string_view, cl_simple_type>{"U128", cl_simple_type::u128},
    std::pair<std::string_view, cl_simple_type>{"U256", cl_simple_type::u256},
    std::pair<std::string_view, cl_simple_type>{"U512", cl_simple_type::u512},
    std::pair<std::string_view, cl_simple_type>{"Unit", cl_simple_type::unit},
    std::pair<std::string_view, cl_simple_type>{"String",
                                                cl_simple_type::string},
    std::pair<std::string_view, cl_simple_type>{"Key", cl_simple_type::key},
    std::pair<std::string_view, cl_simple_type>{"URef", cl_simple_type::uref},
    std::pair<std::string_view, cl_simple_type>{"PublicKey",
                                                cl_simple_type::public_key},
};

template <>
inline std::optional<cl_simple_type> try_from_string<cl_simple_type>(
    const std::string_view value) {
  return from_string(value, kClSimpleTypeMappings);
}

inline constexpr std::string_view to_string(const cl_simple_type value) {
  return to_string(value, kClSimpleTypeMappings).value_or("unknown");
}

struct cl_type_t;
using cl_type_ptr = std::shared_ptr<const cl_type_t>;

struct cl_option_type final {
  cl_type_ptr inner;
};

struct cl_list_type final {
  cl_type_ptr inner;
};

// The length lives in the descriptor, so ByteArray values carry no prefix.
struct cl_byte_array_type final {
  uint32_t length{};
};

struct cl_map_type final {
  cl_type_ptr key;
  cl_type_ptr value;
};

struct cl_type_t final {
  std::variant<cl_simple_type,
               cl_option_type,
               cl_list_type,
               cl_byte_array_type,
               cl_map_type>
      value{cl_simple_type::unit};
};

cl_type_t make_cl_type(cl_simple_type type);
cl_type_t make_option_type(cl_type_t inner);
cl_type_t make_list_type(cl_type_t inner);
cl_type_t make_byte_array_type(uint32_t length);
cl_type_t make_map_type(cl_type_t key, cl_type_t value);

// Leading descriptor byte.
uint8_t tag(const cl_type_t& type);

bool operator==(const cl_type_t& lhs, const cl_type_t& rhs);

// Display form, e.g. "Option(U64)", "ByteArray(32)", "Map(String, U512)".
std::string to_string(const cl_type_t& type);

}  // namespace casper::schema
