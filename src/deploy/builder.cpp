#include <casper/common/error.hpp>
#include <casper/deploy/builder.hpp>
#include <casper/deploy/hash.hpp>
#include <casper/deploy/items.hpp>
#include <casper/schema/timestamp.hpp>

#include <spdlog/spdlog.h>

namespace casper::deploy {

deploy_builder& deploy_builder::account(
    const casper::schema::public_key_t& key) {
  account_ = key;
  return *this;
}

deploy_builder& deploy_builder::account(const std::string_view prefixed_hex) {
  if (prefixed_hex.empty()) {
    throw common::validation_error{"account public key is empty"};
  }
  account_ = casper::schema::make_public_key(prefixed_hex);
  return *this;
}

deploy_builder& deploy_builder::chain_name(std::string name) {
  if (name.empty()) {
    throw common::validation_error{"chain name is empty"};
  }
  chain_name_ = std::move(name);
  return *this;
}

deploy_builder& deploy_builder::gas_price(const uint64_t price) {
  if (price == 0) {
    throw common::validation_error{"gas price must be positive"};
  }
  gas_price_ = price;
  return *this;
}

deploy_builder& deploy_builder::ttl(
    const casper::schema::duration_milliseconds_t ttl) {
  if (ttl == 0) {
    throw common::validation_error{"ttl must be positive"};
  }
  ttl_ = ttl;
  return *this;
}

deploy_builder& deploy_builder::timestamp(
    const casper::schema::timestamp_milliseconds_t timestamp) {
  timestamp_ = timestamp;
  return *this;
}

deploy_builder& deploy_builder::dependency(
    const casper::schema::hash32_t& deploy_hash) {
  dependencies_.push_back(deploy_hash);
  return *this;
}

deploy_builder& deploy_builder::dependencies(
    std::vector<casper::schema::hash32_t> hashes) {
  dependencies_ = std::move(hashes);
  return *this;
}

deploy_builder& deploy_builder::payment(
    casper::schema::executable_deploy_item_t item) {
  payment_ = std::move(item);
  return *this;
}

deploy_builder& deploy_builder::standard_payment(
    const std::string_view amount_motes) {
  if (amount_motes.empty()) {
    throw common::validation_error{"payment amount is empty"};
  }
  return payment(make_standard_payment(amount_motes));
}

deploy_builder& deploy_builder::session(
    casper::schema::executable_deploy_item_t item) {
  session_ = std::move(item);
  return *this;
}

deploy_builder& deploy_builder::transfer(const std::string_view target,
                                         const std::string_view amount_motes,
                                         const std::optional<uint64_t> id) {
  if (target.empty()) {
    throw common::validation_error{"transfer target is empty"};
  }
  if (amount_motes.empty()) {
    throw common::validation_error{"transfer amount is empty"};
  }
  return session(make_transfer(target, amount_motes, id));
}

casper::schema::deploy_t deploy_builder::build() const {
  if (!account_) {
    throw common::validation_error{"account public key is required"};
  }
  if (!payment_) {
    throw common::validation_error{"payment is required"};
  }
  if (!session_) {
    throw common::validation_error{"session is required"};
  }

  auto reference = timestamp_.value_or(casper::schema::now_milliseconds());
  if (reference < kTimestampMargin) {
    throw common::validation_error{
        "timestamp is earlier than the clock drift margin"};
  }

  auto deploy = casper::schema::deploy_t{
      .header = casper::schema::deploy_header_t{
          .account = *account_,
          .timestamp = reference - kTimestampMargin,
          .ttl = ttl_,
          .gas_price = gas_price_,
          .body_hash = compute_body_hash(*payment_, *session_),
          .dependencies = dependencies_,
          .chain_name = chain_name_},
      .payment = *payment_,
      .session = *session_};
  deploy.hash = compute_deploy_hash(deploy.header);

  spdlog::debug("built deploy {} at {} on {}",
                casper::schema::to_hex(deploy.hash),
                casper::schema::to_iso8601(deploy.header.timestamp),
                deploy.header.chain_name);
  return deploy;
}

}  // namespace casper::deploy
