#include <casper/common/error.hpp>
#include <casper/schema/encoding/bytesrepr/approval.hpp>

#include <spdlog/fmt/fmt.h>

namespace casper::schema::encoding::bytesrepr {

namespace {

constexpr std::size_t kSignatureSize = 64;

}  // namespace

void encode(const approval<1>& o, bytes_t& out) {
  encode(o.signer, out);
  encode_raw(make_bytes_view(o.signature), out);
}

void decode(approval<1>& o, decoder& in) {
  decode(o.signer, in);
  auto tag = in.read_u8();
  if (!try_from_tag(tag)) {
    throw common::encoding_error{
        fmt::format("unknown signature algorithm tag {}", tag)};
  }
  o.signature.clear();
  o.signature.push_back(tag);
  auto raw = in.read_raw(kSignatureSize);
  o.signature.insert(std::end(o.signature), std::begin(raw), std::end(raw));
}

}  // namespace casper::schema::encoding::bytesrepr
