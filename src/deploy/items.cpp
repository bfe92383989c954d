#include <casper/deploy/items.hpp>

namespace casper::deploy {

casper::schema::executable_deploy_item_t make_standard_payment(
    const std::string_view amount_motes) {
  return casper::schema::module_bytes_t{
      .args = {{.name = "amount",
                .value = casper::schema::make_cl_u512(amount_motes)}}};
}

casper::schema::executable_deploy_item_t make_transfer(
    const casper::schema::cl_value_t& target,
    const std::string_view amount_motes,
    const std::optional<uint64_t> id) {
  return casper::schema::transfer_t{
      .args = {
          {.name = "amount",
           .value = casper::schema::make_cl_u512(amount_motes)},
          {.name = "target", .value = target},
          {.name = "id", .value = casper::schema::make_cl_option_u64(id)},
      }};
}

casper::schema::executable_deploy_item_t make_transfer(
    const casper::schema::public_key_t& target,
    const std::string_view amount_motes,
    const std::optional<uint64_t> id) {
  return make_transfer(casper::schema::make_cl_public_key(target),
                       amount_motes, id);
}

casper::schema::executable_deploy_item_t make_transfer(
    const std::string_view target,
    const std::string_view amount_motes,
    const std::optional<uint64_t> id) {
  if (target.starts_with(casper::schema::kAccountHashPrefix)) {
    return make_transfer(casper::schema::make_cl_account_hash(target),
                         amount_motes, id);
  }
  return make_transfer(casper::schema::make_cl_public_key(target),
                       amount_motes, id);
}

casper::schema::executable_deploy_item_t make_contract_call_by_hash(
    const casper::schema::hash32_t& contract_hash,
    std::string entry_point,
    casper::schema::runtime_args_t args) {
  return casper::schema::stored_contract_by_hash_t{
      .hash = contract_hash,
      .entry_point = std::move(entry_point),
      .args = std::move(args)};
}

casper::schema::executable_deploy_item_t make_contract_call_by_name(
    std::string contract_name,
    std::string entry_point,
    casper::schema::runtime_args_t args) {
  return casper::schema::stored_contract_by_name_t{
      .name = std::move(contract_name),
      .entry_point = std::move(entry_point),
      .args = std::move(args)};
}

casper::schema::executable_deploy_item_t make_versioned_contract_call_by_hash(
    const casper::schema::hash32_t& package_hash,
    const std::optional<uint32_t> version,
    std::string entry_point,
    casper::schema::runtime_args_t args) {
  return casper::schema::stored_versioned_contract_by_hash_t{
      .hash = package_hash,
      .version = version,
      .entry_point = std::move(entry_point),
      .args = std::move(args)};
}

casper::schema::executable_deploy_item_t make_versioned_contract_call_by_name(
    std::string package_name,
    const std::optional<uint32_t> version,
    std::string entry_point,
    casper::schema::runtime_args_t args) {
  return casper::schema::stored_versioned_contract_by_name_t{
      .name = std::move(package_name),
      .version = version,
      .entry_point = std::move(entry_point),
      .args = std::move(args)};
}

casper::schema::executable_deploy_item_t make_module_bytes(
    casper::schema::bytes_t wasm,
    casper::schema::runtime_args_t args) {
  return casper::schema::module_bytes_t{.module_bytes = std::move(wasm),
                                        .args = std::move(args)};
}

}  // namespace casper::deploy
