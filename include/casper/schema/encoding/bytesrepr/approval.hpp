#pragma once
#include <casper/schema/approval.hpp>
#include <casper/schema/encoding/bytesrepr/primitives.hpp>

namespace casper::schema::encoding::bytesrepr {

void encode(const approval<1>& o, bytes_t& out);
void decode(approval<1>& o, decoder& in);

}  // namespace casper::schema::encoding::bytesrepr
