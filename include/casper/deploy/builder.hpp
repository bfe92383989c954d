#pragma once
#include <casper/schema/deploy.hpp>
#include <casper/schema/executable_deploy_item.hpp>
#include <casper/schema/primitives.hpp>
#include <casper/schema/public_key.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace casper::deploy {

inline constexpr std::string_view kDefaultChainName = "casper-test";
inline constexpr uint64_t kDefaultGasPrice = 1;
inline constexpr casper::schema::duration_milliseconds_t kDefaultTtl =
    30 * 60 * 1000;
// Subtracted from the reference time to absorb node clock drift.
inline constexpr casper::schema::duration_milliseconds_t kTimestampMargin =
    30 * 1000;

// Setters throw common::validation_error (or common::encoding_error for
// malformed text) immediately. build() checks that account, payment and
// session are present before hashing anything.
class deploy_builder final {
 public:
  deploy_builder& account(const casper::schema::public_key_t& key);
  deploy_builder& account(std::string_view prefixed_hex);
  deploy_builder& chain_name(std::string name);
  deploy_builder& gas_price(uint64_t price);
  deploy_builder& ttl(casper::schema::duration_milliseconds_t ttl);
  // Reference instant; the margin is still applied. Defaults to now.
  deploy_builder& timestamp(casper::schema::timestamp_milliseconds_t timestamp);
  deploy_builder& dependency(const casper::schema::hash32_t& deploy_hash);
  deploy_builder& dependencies(std::vector<casper::schema::hash32_t> hashes);

  deploy_builder& payment(casper::schema::executable_deploy_item_t item);
  deploy_builder& standard_payment(std::string_view amount_motes);
  deploy_builder& session(casper::schema::executable_deploy_item_t item);
  deploy_builder& transfer(std::string_view target,
                           std::string_view amount_motes,
                           std::optional<uint64_t> id = std::nullopt);

  casper::schema::deploy_t build() const;

 private:
  std::optional<casper::schema::public_key_t> account_;
  std::string chain_name_{kDefaultChainName};
  uint64_t gas_price_{kDefaultGasPrice};
  casper::schema::duration_milliseconds_t ttl_{kDefaultTtl};
  std::optional<casper::schema::timestamp_milliseconds_t> timestamp_;
  std::vector<casper::schema::hash32_t> dependencies_;
  std::optional<casper::schema::executable_deploy_item_t> payment_;
  std::optional<casper::schema::executable_deploy_item_t> session_;
};

}  // namespace casper::deploy
