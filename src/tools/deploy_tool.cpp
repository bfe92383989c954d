#include <boost/program_options.hpp>
#include <casper/common/critical.hpp>
#include <casper/common/error.hpp>
#include <casper/crypto/account_hash.hpp>
#include <casper/crypto/key_pair.hpp>
#include <casper/deploy/builder.hpp>
#include <casper/deploy/items.hpp>
#include <casper/deploy/signer.hpp>
#include <casper/schema/cl_value.hpp>
#include <casper/schema/encoding/bytesrepr/encoder.hpp>
#include <casper/schema/timestamp.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = casper::schema::encoding::encoder<
    casper::schema::encoding::bytesrepr_encoder_tag>;
namespace po = boost::program_options;

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    casper::common::critical("missing required option --" + name);
  }
  return vm[name].as<std::string>();
}

casper::schema::key_algorithm parse_algorithm(const std::string_view name) {
  auto algorithm =
      casper::schema::try_from_string<casper::schema::key_algorithm>(name);
  if (!algorithm) {
    casper::common::critical("key algorithm must be ed25519|secp256k1");
  }
  return *algorithm;
}

// "<algorithm>:<private key hex>"
casper::crypto::key_pair_t parse_secret_key(const std::string_view value) {
  auto separator = value.find(':');
  if (separator == std::string_view::npos) {
    casper::common::critical("--secret-key must look like algorithm:hex");
  }
  return casper::crypto::import_key_pair(
      parse_algorithm(value.substr(0, separator)),
      value.substr(separator + 1));
}

uint64_t parse_u64(const std::string_view text) {
  auto value = uint64_t{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    throw casper::common::encoding_error{"'" + std::string{text} +
                                         "' is not an unsigned integer"};
  }
  return value;
}

int64_t parse_i64(const std::string_view text) {
  auto value = int64_t{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    throw casper::common::encoding_error{"'" + std::string{text} +
                                         "' is not an integer"};
  }
  return value;
}

template <typename T>
T narrow(const int64_t value, const std::string_view text) {
  if (value < std::numeric_limits<T>::min() ||
      value > std::numeric_limits<T>::max()) {
    throw casper::common::encoding_error{"'" + std::string{text} +
                                         "' is out of range"};
  }
  return static_cast<T>(value);
}

// "<name>:<type>=<value>", e.g. "amount:U512=1000" or "owner:Key=account:<hex>".
casper::schema::runtime_arg_t parse_arg(const std::string_view arg_text) {
  auto colon = arg_text.find(':');
  auto equals = arg_text.find('=', colon == std::string_view::npos ? 0 : colon);
  if (colon == std::string_view::npos || equals == std::string_view::npos) {
    casper::common::critical("--arg must look like name:Type=value");
  }
  auto name = std::string{arg_text.substr(0, colon)};
  auto type = arg_text.substr(colon + 1, equals - colon - 1);
  auto text = arg_text.substr(equals + 1);

  auto value = casper::schema::cl_value_t{};
  if (type == "Bool") {
    if (text != "true" && text != "false") {
      casper::common::critical("Bool arguments take true|false");
    }
    value = casper::schema::make_cl_bool(text == "true");
  } else if (type == "I32") {
    value = casper::schema::make_cl_i32(narrow<int32_t>(parse_i64(text), text));
  } else if (type == "I64") {
    value = casper::schema::make_cl_i64(parse_i64(text));
  } else if (type == "U8") {
    value = casper::schema::make_cl_u8(
        static_cast<uint8_t>(casper::schema::parse_big_uint(text, 8)));
  } else if (type == "U32") {
    value = casper::schema::make_cl_u32(
        static_cast<uint32_t>(casper::schema::parse_big_uint(text, 32)));
  } else if (type == "U64") {
    value = casper::schema::make_cl_u64(parse_u64(text));
  } else if (type == "U128") {
    value = casper::schema::make_cl_u128(text);
  } else if (type == "U256") {
    value = casper::schema::make_cl_u256(text);
  } else if (type == "U512") {
    value = casper::schema::make_cl_u512(text);
  } else if (type == "String") {
    value = casper::schema::make_cl_string(text);
  } else if (type == "Unit") {
    value = casper::schema::make_cl_unit();
  } else if (type == "PublicKey") {
    value = casper::schema::make_cl_public_key(text);
  } else if (type == "AccountHash") {
    value = casper::schema::make_cl_account_hash(text);
  } else if (type == "URef") {
    value = casper::schema::make_cl_uref(text);
  } else if (type == "Key") {
    auto separator = text.find(':');
    if (separator == std::string_view::npos) {
      casper::common::critical("Key arguments take variant:hex");
    }
    value = casper::schema::make_cl_key(text.substr(0, separator),
                                        text.substr(separator + 1));
  } else if (type == "ByteArray") {
    value = casper::schema::make_cl_byte_array(
        casper::schema::make_bytes_view(casper::schema::from_hex(text)));
  } else {
    casper::common::critical("unsupported argument type '" + std::string{type} +
                             "'");
  }
  return casper::schema::runtime_arg_t{.name = std::move(name),
                                       .value = std::move(value)};
}

casper::schema::runtime_args_t parse_args(const po::variables_map& vm) {
  auto args = casper::schema::runtime_args_t{};
  if (vm.contains("arg")) {
    for (const auto& arg_text : vm["arg"].as<std::vector<std::string>>()) {
      args.push_back(parse_arg(arg_text));
    }
  }
  return args;
}

std::optional<uint32_t> get_version(const po::variables_map& vm) {
  if (!vm.contains("version")) {
    return std::nullopt;
  }
  return vm["version"].as<uint32_t>();
}

casper::schema::bytes_t read_file(const std::string& path) {
  auto file = std::ifstream{path, std::ios::binary};
  if (!file) {
    casper::common::critical("cannot open wasm file '" + path + "'");
  }
  return casper::schema::bytes_t{std::istreambuf_iterator<char>{file},
                                 std::istreambuf_iterator<char>{}};
}

casper::schema::executable_deploy_item_t build_session(
    const std::string& command,
    const po::variables_map& vm) {
  if (command == "transfer") {
    auto id = std::optional<uint64_t>{};
    if (vm.contains("id")) {
      id = vm["id"].as<uint64_t>();
    }
    return casper::deploy::make_transfer(get_string(vm, "target"),
                                         get_string(vm, "amount"), id);
  }
  if (command == "contract") {
    auto entry_point = get_string(vm, "entry-point");
    auto versioned = vm.contains("version") || vm.contains("versioned");
    if (vm.contains("contract-hash")) {
      auto hash = casper::schema::make_hash32(
          std::string_view{get_string(vm, "contract-hash")});
      if (versioned) {
        return casper::deploy::make_versioned_contract_call_by_hash(
            hash, get_version(vm), entry_point, parse_args(vm));
      }
      return casper::deploy::make_contract_call_by_hash(hash, entry_point,
                                                        parse_args(vm));
    }
    if (vm.contains("contract-name")) {
      auto name = get_string(vm, "contract-name");
      if (versioned) {
        return casper::deploy::make_versioned_contract_call_by_name(
            name, get_version(vm), entry_point, parse_args(vm));
      }
      return casper::deploy::make_contract_call_by_name(name, entry_point,
                                                        parse_args(vm));
    }
    casper::common::critical(
        "contract mode requires --contract-hash or --contract-name");
  }
  if (command == "module") {
    return casper::deploy::make_module_bytes(read_file(get_string(vm, "wasm")),
                                             parse_args(vm));
  }
  casper::common::critical("unsupported session command '" + command + "'");
}

int build_deploy(const std::string& command, const po::variables_map& vm) {
  auto keys = std::vector<casper::crypto::key_pair_t>{};
  if (vm.contains("secret-key")) {
    for (const auto& value : vm["secret-key"].as<std::vector<std::string>>()) {
      keys.push_back(parse_secret_key(value));
    }
  }

  auto builder = casper::deploy::deploy_builder{};
  if (vm.contains("account")) {
    builder.account(get_string(vm, "account"));
  } else if (!keys.empty()) {
    builder.account(keys.front().public_key);
  } else {
    casper::common::critical("--account or --secret-key is required");
  }

  builder.chain_name(get_string(vm, "chain-name"))
      .gas_price(vm["gas-price"].as<uint64_t>())
      .ttl(vm["ttl"].as<uint64_t>())
      .standard_payment(get_string(vm, "payment"))
      .session(build_session(command, vm));

  if (vm.contains("timestamp")) {
    auto text = get_string(vm, "timestamp");
    auto timestamp = casper::schema::try_from_iso8601(text);
    builder.timestamp(timestamp ? *timestamp : parse_u64(text));
  }
  if (vm.contains("dependency")) {
    for (const auto& value : vm["dependency"].as<std::vector<std::string>>()) {
      builder.dependency(casper::schema::make_hash32(std::string_view{value}));
    }
  }

  auto deploy = builder.build();
  for (const auto& key : keys) {
    deploy = casper::deploy::sign_deploy(std::move(deploy), key);
  }

  std::cout << "deploy_hash: " << casper::schema::to_hex(deploy.hash) << '\n'
            << "body_hash: " << casper::schema::to_hex(deploy.header.body_hash)
            << '\n'
            << "timestamp: "
            << casper::schema::to_iso8601(deploy.header.timestamp) << '\n';
  for (const auto& approval : deploy.approvals) {
    std::cout << "approval: " << casper::schema::to_hex(approval.signer) << ' '
              << casper::schema::to_hex(approval.signature) << '\n';
  }
  if (vm.contains("bytes")) {
    std::cout << "bytes: " << casper::schema::to_hex(encoder_t{}.encode(deploy))
              << '\n';
  }
  return 0;
}

int keygen(const po::variables_map& vm) {
  auto key_pair = casper::crypto::generate_key_pair(
      parse_algorithm(get_string(vm, "key-algorithm")));
  std::cout << "algorithm: " << casper::schema::to_string(key_pair.algorithm)
            << '\n'
            << "private_key: " << casper::schema::to_hex(key_pair.private_key)
            << '\n'
            << "public_key: " << casper::schema::to_hex(key_pair.public_key)
            << '\n'
            << "account_hash: "
            << casper::crypto::to_account_hash_string(key_pair.public_key)
            << '\n';
  return 0;
}

int account_hash(const po::variables_map& vm) {
  auto key = casper::schema::make_public_key(
      std::string_view{get_string(vm, "public-key")});
  std::cout << casper::crypto::to_account_hash_string(key) << '\n';
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  deploy_tool transfer [options]\n"
            << "  deploy_tool contract [options]\n"
            << "  deploy_tool module [options]\n"
            << "  deploy_tool keygen [--key-algorithm ed25519|secp256k1]\n"
            << "  deploy_tool account-hash --public-key <hex>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("deploy_tool", console_sink);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::warn);

  auto command = std::string{};
  auto options = po::options_description{"deploy_tool options"};
  options.add_options()("help,h", "show help")("verbose,v",
                                               "log at debug level")(
      "command", po::value<std::string>(&command),
      "transfer|contract|module|keygen|account-hash")(
      "account", po::value<std::string>(),
      "sender public key hex, defaults to the first --secret-key")(
      "secret-key", po::value<std::vector<std::string>>()->multitoken(),
      "algorithm:private key hex, one approval each")(
      "chain-name",
      po::value<std::string>()->default_value(
          std::string{casper::deploy::kDefaultChainName}),
      "network chain name")(
      "gas-price",
      po::value<uint64_t>()->default_value(casper::deploy::kDefaultGasPrice),
      "gas price")(
      "ttl", po::value<uint64_t>()->default_value(casper::deploy::kDefaultTtl),
      "time to live in ms")(
      "timestamp", po::value<std::string>(),
      "reference time, ISO-8601 or ms since epoch")(
      "dependency", po::value<std::vector<std::string>>()->multitoken(),
      "deploy hash hex this deploy depends on")(
      "payment", po::value<std::string>(), "standard payment amount in motes")(
      "target", po::value<std::string>(),
      "transfer target public key hex or account-hash-<hex>")(
      "amount", po::value<std::string>(), "transfer amount in motes")(
      "id", po::value<uint64_t>(), "transfer id")(
      "contract-hash", po::value<std::string>(), "contract hash hex")(
      "contract-name", po::value<std::string>(), "named key of the contract")(
      "versioned", "call through the contract package")(
      "version", po::value<uint32_t>(), "contract package version")(
      "entry-point", po::value<std::string>(), "contract entry point")(
      "wasm", po::value<std::string>(), "path to session wasm")(
      "arg", po::value<std::vector<std::string>>()->multitoken(),
      "runtime argument name:Type=value")(
      "bytes", "also print the serialized deploy")(
      "key-algorithm", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("public-key", po::value<std::string>(),
                           "tag-prefixed public key hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    casper::common::critical(e.what());
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  try {
    if (command == "transfer" || command == "contract" || command == "module") {
      return build_deploy(command, vm);
    }
    if (command == "keygen") {
      return keygen(vm);
    }
    if (command == "account-hash") {
      return account_hash(vm);
    }
  } catch (const casper::common::error& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  casper::common::critical(
      "command must be transfer|contract|module|keygen|account-hash");
}
