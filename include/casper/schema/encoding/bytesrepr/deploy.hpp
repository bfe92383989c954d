#pragma once
#include <casper/schema/deploy.hpp>
#include <casper/schema/encoding/bytesrepr/primitives.hpp>

namespace casper::schema::encoding::bytesrepr {

// Full deploy: hash, header, payment, session, approvals.
void encode(const deploy<1>& o, bytes_t& out);
void decode(deploy<1>& o, decoder& in);

}  // namespace casper::schema::encoding::bytesrepr
