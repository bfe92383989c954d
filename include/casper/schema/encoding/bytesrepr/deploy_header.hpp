#pragma once
#include <casper/schema/deploy_header.hpp>
#include <casper/schema/encoding/bytesrepr/primitives.hpp>

namespace casper::schema::encoding::bytesrepr {

void encode(const deploy_header<1>& o, bytes_t& out);
void decode(deploy_header<1>& o, decoder& in);

}  // namespace casper::schema::encoding::bytesrepr
