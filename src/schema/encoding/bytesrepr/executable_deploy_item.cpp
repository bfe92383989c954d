#include <casper/common/error.hpp>
#include <casper/schema/encoding/bytesrepr/executable_deploy_item.hpp>
#include <casper/schema/encoding/bytesrepr/runtime_arg.hpp>

#include <spdlog/fmt/fmt.h>

namespace casper::schema::encoding::bytesrepr {

namespace {

void encode_version(const std::optional<uint32_t>& version, bytes_t& out) {
  if (!version) {
    encode(uint8_t{0}, out);
    return;
  }
  encode(uint8_t{1}, out);
  encode(*version, out);
}

void decode_version(std::optional<uint32_t>& version, decoder& in) {
  auto present = uint8_t{};
  decode(present, in);
  if (present == 0) {
    version.reset();
    return;
  }
  if (present != 1) {
    throw common::encoding_error{
        fmt::format("invalid option tag {}", present)};
  }
  auto value = uint32_t{};
  decode(value, in);
  version = value;
}

void encode_item(const module_bytes_t& o, bytes_t& out) {
  encode_bytes(make_bytes_view(o.module_bytes), out);
  encode(o.args, out);
}

void encode_item(const stored_contract_by_hash_t& o, bytes_t& out) {
  encode(o.hash, out);
  encode(o.entry_point, out);
  encode(o.args, out);
}

void encode_item(const stored_contract_by_name_t& o, bytes_t& out) {
  encode(o.name, out);
  encode(o.entry_point, out);
  encode(o.args, out);
}

void encode_item(const stored_versioned_contract_by_hash_t& o, bytes_t& out) {
  encode(o.hash, out);
  encode_version(o.version, out);
  encode(o.entry_point, out);
  encode(o.args, out);
}

void encode_item(const stored_versioned_contract_by_name_t& o, bytes_t& out) {
  encode(o.name, out);
  encode_version(o.version, out);
  encode(o.entry_point, out);
  encode(o.args, out);
}

void encode_item(const transfer_t& o, bytes_t& out) {
  encode(o.args, out);
}

void decode_item(module_bytes_t& o, decoder& in) {
  auto size = uint32_t{};
  decode(size, in);
  o.module_bytes = make_bytes(in.read_raw(size));
  decode(o.args, in);
}

void decode_item(stored_contract_by_hash_t& o, decoder& in) {
  decode(o.hash, in);
  decode(o.entry_point, in);
  decode(o.args, in);
}

void decode_item(stored_contract_by_name_t& o, decoder& in) {
  decode(o.name, in);
  decode(o.entry_point, in);
  decode(o.args, in);
}

void decode_item(stored_versioned_contract_by_hash_t& o, decoder& in) {
  decode(o.hash, in);
  decode_version(o.version, in);
  decode(o.entry_point, in);
  decode(o.args, in);
}

void decode_item(stored_versioned_contract_by_name_t& o, decoder& in) {
  decode(o.name, in);
  decode_version(o.version, in);
  decode(o.entry_point, in);
  decode(o.args, in);
}

void decode_item(transfer_t& o, decoder& in) {
  decode(o.args, in);
}

}  // namespace

void encode(const executable_deploy_item_t& o, bytes_t& out) {
  encode(static_cast<uint8_t>(kind_of(o)), out);
  std::visit([&](const auto& item) { encode_item(item, out); }, o);
}

void decode(executable_deploy_item_t& o, decoder& in) {
  auto tag = uint8_t{};
  decode(tag, in);
  switch (static_cast<executable_deploy_item_kind>(tag)) {
    case executable_deploy_item_kind::module_bytes:
      o = module_bytes_t{};
      break;
    case executable_deploy_item_kind::stored_contract_by_hash:
      o = stored_contract_by_hash_t{};
      break;
    case executable_deploy_item_kind::stored_contract_by_name:
      o = stored_contract_by_name_t{};
      break;
    case executable_deploy_item_kind::stored_versioned_contract_by_hash:
      o = stored_versioned_contract_by_hash_t{};
      break;
    case executable_deploy_item_kind::stored_versioned_contract_by_name:
      o = stored_versioned_contract_by_name_t{};
      break;
    case executable_deploy_item_kind::transfer:
      o = transfer_t{};
      break;
    default:
      throw common::encoding_error{
          fmt::format("unknown executable deploy item tag {}", tag)};
  }
  std::visit([&](auto& item) { decode_item(item, in); }, o);
}

}  // namespace casper::schema::encoding::bytesrepr
