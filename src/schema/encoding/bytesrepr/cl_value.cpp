#include <casper/schema/encoding/bytesrepr/cl_type.hpp>
#include <casper/schema/encoding/bytesrepr/cl_value.hpp>

namespace casper::schema::encoding::bytesrepr {

void encode(const cl_value_t& o, bytes_t& out) {
  encode_bytes(make_bytes_view(o.bytes), out);
  encode(o.type, out);
}

void decode(cl_value_t& o, decoder& in) {
  auto size = uint32_t{};
  decode(size, in);
  o.bytes = make_bytes(in.read_raw(size));
  decode(o.type, in);
  o.parsed.clear();
}

}  // namespace casper::schema::encoding::bytesrepr
