#pragma once
#include <casper/schema/runtime_arg.hpp>
#include <casper/schema/encoding/bytesrepr/primitives.hpp>

namespace casper::schema::encoding::bytesrepr {

// [u32 count], then each argument as name string followed by its value.
void encode(const runtime_args_t& o, bytes_t& out);
void decode(runtime_args_t& o, decoder& in);

}  // namespace casper::schema::encoding::bytesrepr
