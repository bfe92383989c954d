#include <casper/schema/encoding/bytesrepr/cl_value.hpp>
#include <casper/schema/encoding/bytesrepr/runtime_arg.hpp>

namespace casper::schema::encoding::bytesrepr {

void encode(const runtime_args_t& o, bytes_t& out) {
  encode_length(o.size(), out);
  for (const auto& arg : o) {
    encode(arg.name, out);
    encode(arg.value, out);
  }
}

void decode(runtime_args_t& o, decoder& in) {
  auto count = uint32_t{};
  decode(count, in);
  o.clear();
  for (uint32_t i = 0; i < count; ++i) {
    auto arg = runtime_arg_t{};
    decode(arg.name, in);
    decode(arg.value, in);
    o.push_back(std::move(arg));
  }
}

}  // namespace casper::schema::encoding::bytesrepr
