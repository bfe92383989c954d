#pragma once
#include <casper/schema/cl_value.hpp>
#include <casper/schema/executable_deploy_item.hpp>
#include <casper/schema/primitives.hpp>
#include <casper/schema/public_key.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Constructors for the payment and session items a deploy usually carries.
namespace casper::deploy {

// Empty module bytes with a single `amount: U512` argument, which the node
// executes as the standard payment contract.
casper::schema::executable_deploy_item_t make_standard_payment(
    std::string_view amount_motes);

// Native transfer with `amount: U512`, `target` and `id: Option<U64>`, in
// that order.
casper::schema::executable_deploy_item_t make_transfer(
    const casper::schema::cl_value_t& target,
    std::string_view amount_motes,
    std::optional<uint64_t> id = std::nullopt);
casper::schema::executable_deploy_item_t make_transfer(
    const casper::schema::public_key_t& target,
    std::string_view amount_motes,
    std::optional<uint64_t> id = std::nullopt);
// `target` is "account-hash-<hex>" or a tag-prefixed public key in hex.
casper::schema::executable_deploy_item_t make_transfer(
    std::string_view target,
    std::string_view amount_motes,
    std::optional<uint64_t> id = std::nullopt);

casper::schema::executable_deploy_item_t make_contract_call_by_hash(
    const casper::schema::hash32_t& contract_hash,
    std::string entry_point,
    casper::schema::runtime_args_t args = {});
casper::schema::executable_deploy_item_t make_contract_call_by_name(
    std::string contract_name,
    std::string entry_point,
    casper::schema::runtime_args_t args = {});
casper::schema::executable_deploy_item_t make_versioned_contract_call_by_hash(
    const casper::schema::hash32_t& package_hash,
    std::optional<uint32_t> version,
    std::string entry_point,
    casper::schema::runtime_args_t args = {});
casper::schema::executable_deploy_item_t make_versioned_contract_call_by_name(
    std::string package_name,
    std::optional<uint32_t> version,
    std::string entry_point,
    casper::schema::runtime_args_t args = {});

casper::schema::executable_deploy_item_t make_module_bytes(
    casper::schema::bytes_t wasm,
    casper::schema::runtime_args_t args = {});

}  // namespace casper::deploy
