#pragma once
#include <casper/crypto/key_pair.hpp>
#include <casper/schema/approval.hpp>
#include <casper/schema/deploy.hpp>

namespace casper::deploy {

// Signs deploy.hash and returns a copy with the approval appended. Existing
// approvals are kept in order; signing twice with one key adds two entries.
// Throws common::signing_error.
casper::schema::deploy_t sign_deploy(casper::schema::deploy_t deploy,
                                     const casper::crypto::key_pair_t& key_pair);

casper::schema::deploy_t with_approval(casper::schema::deploy_t deploy,
                                       casper::schema::approval_t approval);

}  // namespace casper::deploy
