#include <casper/crypto/verify.hpp>
#include <casper/deploy/hash.hpp>
#include <casper/deploy/validate.hpp>

#include <spdlog/fmt/fmt.h>

namespace casper::deploy {

namespace {

validation_result_t failure(std::string reason) {
  return validation_result_t{.valid = false, .reason = std::move(reason)};
}

}  // namespace

validation_result_t validate_deploy(const casper::schema::deploy_t& deploy) {
  if (deploy.header.chain_name.empty()) {
    return failure("chain name is empty");
  }
  if (compute_body_hash(deploy.payment, deploy.session) !=
      deploy.header.body_hash) {
    return failure("body hash does not match payment and session");
  }
  if (compute_deploy_hash(deploy.header) != deploy.hash) {
    return failure("deploy hash does not match header");
  }
  for (std::size_t i = 0; i < deploy.approvals.size(); ++i) {
    const auto& approval = deploy.approvals[i];
    if (!casper::crypto::verify_signature(
            casper::schema::make_bytes_view(deploy.hash), approval.signer,
            casper::schema::make_bytes_view(approval.signature))) {
      return failure(fmt::format("approval {} from {} has an invalid signature",
                                 i, casper::schema::to_hex(approval.signer)));
    }
  }
  return validation_result_t{};
}

}  // namespace casper::deploy
