#pragma once
#include <casper/schema/deploy_header.hpp>
#include <casper/schema/executable_deploy_item.hpp>
#include <casper/schema/primitives.hpp>

namespace casper::deploy {

// blake2b(bytesrepr(payment) || bytesrepr(session))
casper::schema::hash32_t compute_body_hash(
    const casper::schema::executable_deploy_item_t& payment,
    const casper::schema::executable_deploy_item_t& session);

// blake2b(bytesrepr(header))
casper::schema::hash32_t compute_deploy_hash(
    const casper::schema::deploy_header_t& header);

}  // namespace casper::deploy
