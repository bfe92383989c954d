#pragma once
#include <casper/schema/cl_value.hpp>
#include <casper/schema/encoding/bytesrepr/primitives.hpp>

namespace casper::schema::encoding::bytesrepr {

// [u32 length][payload][type descriptor]. Decoded values have an empty
// parsed field.
void encode(const cl_value_t& o, bytes_t& out);
void decode(cl_value_t& o, decoder& in);

}  // namespace casper::schema::encoding::bytesrepr
