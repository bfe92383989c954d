#include <casper/schema/encoding/bytesrepr/deploy_header.hpp>

namespace casper::schema::encoding::bytesrepr {

void encode(const deploy_header<1>& o, bytes_t& out) {
  encode(o.account, out);
  encode(o.timestamp, out);
  encode(o.ttl, out);
  encode(o.gas_price, out);
  encode(o.body_hash, out);
  encode_length(o.dependencies.size(), out);
  for (const auto& dependency : o.dependencies) {
    encode(dependency, out);
  }
  encode(o.chain_name, out);
}

void decode(deploy_header<1>& o, decoder& in) {
  decode(o.account, in);
  decode(o.timestamp, in);
  decode(o.ttl, in);
  decode(o.gas_price, in);
  decode(o.body_hash, in);
  auto count = uint32_t{};
  decode(count, in);
  o.dependencies.clear();
  for (uint32_t i = 0; i < count; ++i) {
    auto dependency = hash32_t{};
    decode(dependency, in);
    o.dependencies.push_back(dependency);
  }
  decode(o.chain_name, in);
}

}  // namespace casper::schema::encoding::bytesrepr
