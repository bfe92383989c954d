#pragma once
#include <array>
#include <casper/schema/enum_string.hpp>
#include <casper/schema/primitives.hpp>
#include <casper/schema/runtime_arg.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// Schema type: executable deploy item.
// Payment or session code of a deploy. Alternatives are declared in wire tag
// order.
namespace casper::schema {

enum class executable_deploy_item_kind : uint8_t {
  module_bytes = 0,
  stored_contract_by_hash = 1,
  stored_contract_by_name = 2,
  stored_versioned_contract_by_hash = 3,
  stored_versioned_contract_by_name = 4,
  transfer = 5,
};

inline constexpr auto kExecutableDeployItemKindMappings = std::array{
    std::pair<std::string_view, executable_deploy_item_kind>{
        "ModuleBytes", executable_deploy_item_kind::module_bytes},
    std::pair<std::string_view, executable_deploy_item_kind>{
        "StoredContractByHash",
        executable_deploy_item_kind::stored_contract_by_hash},
    std::pair<std::string_view, executable_deploy_item_kind>{
        "StoredContractByName",
        executable_deploy_item_kind::stored_contract_by_name},
    std::pair<std::string_view, executable_deploy_item_kind>{
        "StoredVersionedContractByHash",
        executable_deploy_item_kind::stored_versioned_contract_by_hash},
    std::pair<std::string_view, executable_deploy_item_kind>{
        "StoredVersionedContractByName",
        executable_deploy_item_kind::stored_versioned_contract_by_name},
    std::pair<std::string_view, executable_deploy_item_kind>{
        "Transfer", executable_deploy_item_kind::transfer},
};

template <>
inline std::optional<executable_deploy_item_kind>
try_from_string<executable_deploy_item_kind>(const std::string_view value) {
  return from_string(value, kExecutableDeployItemKindMappings);
}

inline constexpr std::string_view to_string(
    const executable_deploy_item_kind value) {
  return to_string(value, kExecutableDeployItemKindMappings)
      .value_or("unknown");
}

struct module_bytes_t final {
  bytes_t module_bytes;
  runtime_args_t args;
};

struct stored_contract_by_hash_t final {
  hash32_t hash{};
  std::string entry_point;
  runtime_args_t args;
};

struct stored_contract_by_name_t final {
  std::string name;
  std::string entry_point;
  runtime_args_t args;
};

// An absent version selects the latest enabled contract version.
struct stored_versioned_contract_by_hash_t final {
  hash32_t hash{};
  std::optional<uint32_t> version;
  std::string entry_point;
  runtime_args_t args;
};

struct stored_versioned_contract_by_name_t final {
  std::string name;
  std::optional<uint32_t> version;
  std::string entry_point;
  runtime_args_t args;
};

struct transfer_t final {
  runtime_args_t args;
};

using executable_deploy_item_t =
    std::variant<module_bytes_t,
                 stored_contract_by_hash_t,
                 stored_contract_by_name_t,
                 stored_versioned_contract_by_hash_t,
                 stored_versioned_contract_by_name_t,
                 transfer_t>;

executable_deploy_item_kind kind_of(const executable_deploy_item_t& item);
const runtime_args_t& args_of(const executable_deploy_item_t& item);

}  // namespace casper::schema
