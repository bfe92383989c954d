#pragma once
#include <casper/schema/executable_deploy_item.hpp>
#include <casper/schema/encoding/bytesrepr/primitives.hpp>

namespace casper::schema::encoding::bytesrepr {

void encode(const executable_deploy_item_t& o, bytes_t& out);
void decode(executable_deploy_item_t& o, decoder& in);

}  // namespace casper::schema::encoding::bytesrepr
