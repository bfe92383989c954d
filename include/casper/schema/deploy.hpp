#pragma once
#include <casper/schema/approval.hpp>
#include <casper/schema/deploy_header.hpp>
#include <casper/schema/executable_deploy_item.hpp>
#include <casper/schema/primitives.hpp>
#include <vector>

// Schema type: deploy.
// Produced by deploy::deploy_builder, which derives hash and
// header.body_hash. Only the approvals change after that, and only by
// appending.
namespace casper::schema {

template <uint16_t Version>
struct deploy;

template <>
struct deploy<1> final {
  hash32_t hash{};
  deploy_header_t header;
  executable_deploy_item_t payment;
  executable_deploy_item_t session;
  std::vector<approval_t> approvals;
};

using deploy_t = deploy<1>;

}  // namespace casper::schema
