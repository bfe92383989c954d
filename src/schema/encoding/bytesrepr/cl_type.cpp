#include <casper/common/error.hpp>
#include <casper/schema/encoding/bytesrepr/cl_type.hpp>

#include <string>
#include <utility>

namespace casper::schema::encoding::bytesrepr {

namespace {

// Deepest descriptor nesting accepted by decode.
constexpr auto kMaxDepth = 50;

bool is_simple_tag(const uint8_t value) {
  return value <= static_cast<uint8_t>(cl_simple_type::uref) ||
         value == static_cast<uint8_t>(cl_simple_type::public_key);
}

cl_type_t decode_at_depth(decoder& in, const int depth) {
  if (depth > kMaxDepth) {
    throw common::encoding_error{"CLType descriptor nested too deeply"};
  }
  auto value = in.read_u8();
  if (is_simple_tag(value)) {
    return make_cl_type(static_cast<cl_simple_type>(value));
  }
  switch (value) {
    case kClOptionTag:
      return make_option_type(decode_at_depth(in, depth + 1));
    case kClListTag:
      return make_list_type(decode_at_depth(in, depth + 1));
    case kClByteArrayTag: {
      auto length = uint32_t{};
      decode(length, in);
      return make_byte_array_type(length);
    }
    case kClMapTag: {
      auto key = decode_at_depth(in, depth + 1);
      auto mapped = decode_at_depth(in, depth + 1);
      return make_map_type(std::move(key), std::move(mapped));
    }
    default:
      break;
  }
  throw common::encoding_error{"unknown CLType tag " + std::to_string(value)};
}

}  // namespace

void encode(const cl_type_t& o, bytes_t& out) {
  out.push_back(tag(o));
  std::visit(overloaded{[](const cl_simple_type) {},
                        [&](const cl_option_type& value) {
                          encode(*value.inner, out);
                        },
                        [&](const cl_list_type& value) {
                          encode(*value.inner, out);
                        },
                        [&](const cl_byte_array_type& value) {
                          encode(value.length, out);
                        },
                        [&](const cl_map_type& value) {
                          encode(*value.key, out);
                          encode(*value.value, out);
                        }},
             o.value);
}

void decode(cl_type_t& o, decoder& in) {
  o = decode_at_depth(in, 0);
}

}  // namespace casper::schema::encoding::bytesrepr
