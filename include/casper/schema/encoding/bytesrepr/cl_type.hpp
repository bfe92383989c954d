#pragma once
#include <casper/schema/cl_type.hpp>
#include <casper/schema/encoding/bytesrepr/primitives.hpp>

namespace casper::schema::encoding::bytesrepr {

// Self-delimiting: one tag byte, followed by nested descriptors for Option,
// List and Map, or a u32 length for ByteArray.
void encode(const cl_type_t& o, bytes_t& out);

// Throws common::encoding_error on an unknown tag or truncated input.
void decode(cl_type_t& o, decoder& in);

}  // namespace casper::schema::encoding::bytesrepr
