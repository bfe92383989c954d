#include <casper/common/error.hpp>
#include <casper/schema/encoding/bytesrepr/primitives.hpp>

#include <boost/endian/buffers.hpp>

#include <algorithm>
#include <iterator>
#include <limits>

namespace casper::schema::encoding::bytesrepr {

namespace {

template <typename Buffer, typename T>
void encode_fixed(const T value, bytes_t& out) {
  auto buffer = Buffer{value};
  const auto* data = reinterpret_cast<const uint8_t*>(buffer.data());
  out.insert(std::end(out), data, data + sizeof(Buffer));
}

template <typename Buffer, typename T>
void decode_fixed(T& value, decoder& in) {
  auto buffer = Buffer{};
  auto raw = in.read_raw(sizeof(Buffer));
  std::copy(std::begin(raw), std::end(raw),
            reinterpret_cast<uint8_t*>(buffer.data()));
  value = buffer.value();
}

template <typename Number>
void encode_big_uint(Number value, bytes_t& out) {
  auto magnitude = bytes_t{};
  while (value != 0) {
    magnitude.push_back(static_cast<uint8_t>(value & 0xFF));
    value >>= 8;
  }
  if (magnitude.empty()) {
    magnitude.push_back(0);
  }
  out.push_back(static_cast<uint8_t>(magnitude.size()));
  out.insert(std::end(out), std::begin(magnitude), std::end(magnitude));
}

template <typename Number>
void decode_big_uint(Number& value, decoder& in, const std::size_t max_bytes) {
  auto size = in.read_u8();
  if (size > max_bytes) {
    throw common::encoding_error{"big integer length " + std::to_string(size) +
                                 " exceeds " + std::to_string(max_bytes) +
                                 " bytes"};
  }
  auto raw = in.read_raw(size);
  value = 0;
  for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
    value <<= 8;
    value |= *it;
  }
}

}  // namespace

decoder::decoder(bytes_view_t bytes) : bytes_(bytes) {}

uint8_t decoder::read_u8() {
  return read_raw(1)[0];
}

bytes_view_t decoder::read_raw(const std::size_t size) {
  if (remaining() < size) {
    throw common::encoding_error{"unexpected end of input: needed " +
                                 std::to_string(size) + " byte(s), have " +
                                 std::to_string(remaining())};
  }
  auto out = bytes_.subspan(offset_, size);
  offset_ += size;
  return out;
}

std::size_t decoder::remaining() const {
  return bytes_.size() - offset_;
}

bool decoder::empty() const {
  return remaining() == 0;
}

void encode(const bool o, bytes_t& out) {
  out.push_back(o ? 1 : 0);
}

void encode(const uint8_t o, bytes_t& out) {
  out.push_back(o);
}

void encode(const int32_t o, bytes_t& out) {
  encode_fixed<boost::endian::little_int32_buf_t>(o, out);
}

void encode(const int64_t o, bytes_t& out) {
  encode_fixed<boost::endian::little_int64_buf_t>(o, out);
}

void encode(const uint32_t o, bytes_t& out) {
  encode_fixed<boost::endian::little_uint32_buf_t>(o, out);
}

void encode(const uint64_t o, bytes_t& out) {
  encode_fixed<boost::endian::little_uint64_buf_t>(o, out);
}

void encode(const u128_t& o, bytes_t& out) {
  encode_big_uint(o, out);
}

void encode(const u256_t& o, bytes_t& out) {
  encode_big_uint(o, out);
}

void encode(const u512_t& o, bytes_t& out) {
  encode_big_uint(o, out);
}

void encode(const std::string& o, bytes_t& out) {
  encode_string(o, out);
}

void encode(const hash32_t& o, bytes_t& out) {
  out.insert(std::end(out), std::begin(o), std::end(o));
}

void encode(const public_key_t& o, bytes_t& out) {
  auto bytes = to_bytes(o);
  out.insert(std::end(out), std::begin(bytes), std::end(bytes));
}

void encode_string(const std::string_view o, bytes_t& out) {
  encode_length(o.size(), out);
  out.insert(std::end(out), std::begin(o), std::end(o));
}

void encode_bytes(const bytes_view_t& o, bytes_t& out) {
  encode_length(o.size(), out);
  encode_raw(o, out);
}

void encode_raw(const bytes_view_t& o, bytes_t& out) {
  out.insert(std::end(out), std::begin(o), std::end(o));
}

void encode_length(const std::size_t size, bytes_t& out) {
  if (size > std::numeric_limits<uint32_t>::max()) {
    throw common::encoding_error{"length " + std::to_string(size) +
                                 " does not fit a u32 prefix"};
  }
  encode(static_cast<uint32_t>(size), out);
}

void decode(bool& o, decoder& in) {
  auto value = in.read_u8();
  if (value > 1) {
    throw common::encoding_error{"invalid bool byte " + std::to_string(value)};
  }
  o = value == 1;
}

void decode(uint8_t& o, decoder& in) {
  o = in.read_u8();
}

void decode(int32_t& o, decoder& in) {
  decode_fixed<boost::endian::little_int32_buf_t>(o, in);
}

void decode(int64_t& o, decoder& in) {
  decode_fixed<boost::endian::little_int64_buf_t>(o, in);
}

void decode(uint32_t& o, decoder& in) {
  decode_fixed<boost::endian::little_uint32_buf_t>(o, in);
}

void decode(uint64_t& o, decoder& in) {
  decode_fixed<boost::endian::little_uint64_buf_t>(o, in);
}

void decode(u128_t& o, decoder& in) {
  decode_big_uint(o, in, 16);
}

void decode(u256_t& o, decoder& in) {
  decode_big_uint(o, in, 32);
}

void decode(u512_t& o, decoder& in) {
  decode_big_uint(o, in, 64);
}

void decode(std::string& o, decoder& in) {
  auto size = uint32_t{};
  decode(size, in);
  o = make_string(in.read_raw(size));
}

void decode(hash32_t& o, decoder& in) {
  auto raw = in.read_raw(o.size());
  std::copy(std::begin(raw), std::end(raw), std::begin(o));
}

void decode(public_key_t& o, decoder& in) {
  auto algorithm = in.read_u8();
  auto size = algorithm == tag(key_algorithm::ed25519)     ? std::size_t{32}
              : algorithm == tag(key_algorithm::secp256k1) ? std::size_t{33}
                                                           : std::size_t{0};
  if (size == 0) {
    throw common::encoding_error{"unknown public key tag " +
                                 std::to_string(algorithm)};
  }
  o = make_public_key(static_cast<key_algorithm>(algorithm), in.read_raw(size));
}

}  // namespace casper::schema::encoding::bytesrepr
