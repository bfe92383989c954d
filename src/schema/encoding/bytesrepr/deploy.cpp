#include <casper/schema/encoding/bytesrepr/approval.hpp>
#include <casper/schema/encoding/bytesrepr/deploy.hpp>
#include <casper/schema/encoding/bytesrepr/deploy_header.hpp>
#include <casper/schema/encoding/bytesrepr/executable_deploy_item.hpp>

namespace casper::schema::encoding::bytesrepr {

void encode(const deploy<1>& o, bytes_t& out) {
  encode(o.header, out);
  encode(o.hash, out);
  encode(o.payment, out);
  encode(o.session, out);
  encode_length(o.approvals.size(), out);
  for (const auto& approval : o.approvals) {
    encode(approval, out);
  }
}

void decode(deploy<1>& o, decoder& in) {
  decode(o.header, in);
  decode(o.hash, in);
  decode(o.payment, in);
  decode(o.session, in);
  auto count = uint32_t{};
  decode(count, in);
  o.approvals.clear();
  for (uint32_t i = 0; i < count; ++i) {
    auto approval = approval_t{};
    decode(approval, in);
    o.approvals.push_back(std::move(approval));
  }
}

}  // namespace casper::schema::encoding::bytesrepr
