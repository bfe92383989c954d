#pragma once
#include <casper/schema/primitives.hpp>
#include <casper/schema/public_key.hpp>
#include <cstdint>
#include <string>
#include <string_view>

// Little-endian, u32-length-prefixed serialization used for hashing.
namespace casper::schema::encoding::bytesrepr {

class decoder final {
 public:
  explicit decoder(bytes_view_t bytes);

  uint8_t read_u8();
  // Throws common::encoding_error when fewer than `size` bytes remain.
  bytes_view_t read_raw(std::size_t size);

  std::size_t remaining() const;
  bool empty() const;

 private:
  bytes_view_t bytes_;
  std::size_t offset_{};
};

void encode(bool o, bytes_t& out);
void encode(uint8_t o, bytes_t& out);
void encode(int32_t o, bytes_t& out);
void encode(int64_t o, bytes_t& out);
void encode(uint32_t o, bytes_t& out);
void encode(uint64_t o, bytes_t& out);
// Variable width: [length byte][little-endian magnitude, trailing zero bytes
// trimmed to at least one byte].
void encode(const u128_t& o, bytes_t& out);
void encode(const u256_t& o, bytes_t& out);
void encode(const u512_t& o, bytes_t& out);
void encode(const std::string& o, bytes_t& out);
// Raw 32 bytes, no length prefix.
void encode(const hash32_t& o, bytes_t& out);
// Tag-prefixed key bytes, no length prefix.
void encode(const public_key_t& o, bytes_t& out);

void encode_string(std::string_view o, bytes_t& out);
// [u32 length][bytes]
void encode_bytes(const bytes_view_t& o, bytes_t& out);
void encode_raw(const bytes_view_t& o, bytes_t& out);
void encode_length(std::size_t size, bytes_t& out);

void decode(bool& o, decoder& in);
void decode(uint8_t& o, decoder& in);
void decode(int32_t& o, decoder& in);
void decode(int64_t& o, decoder& in);
void decode(uint32_t& o, decoder& in);
void decode(uint64_t& o, decoder& in);
void decode(u128_t& o, decoder& in);
void decode(u256_t& o, decoder& in);
void decode(u512_t& o, decoder& in);
void decode(std::string& o, decoder& in);
void decode(hash32_t& o, decoder& in);
void decode(public_key_t& o, decoder& in);

}  // namespace casper::schema::encoding::bytesrepr
