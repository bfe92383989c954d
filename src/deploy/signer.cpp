#include <casper/crypto/sign.hpp>
#include <casper/deploy/signer.hpp>

#include <spdlog/spdlog.h>

namespace casper::deploy {

casper::schema::deploy_t sign_deploy(
    casper::schema::deploy_t deploy,
    const casper::crypto::key_pair_t& key_pair) {
  auto signature = casper::crypto::sign(
      casper::schema::make_bytes_view(deploy.hash), key_pair);
  return with_approval(
      std::move(deploy),
      casper::schema::approval_t{.signer = key_pair.public_key,
                                 .signature = std::move(signature)});
}

casper::schema::deploy_t with_approval(casper::schema::deploy_t deploy,
                                       casper::schema::approval_t approval) {
  spdlog::debug("appending approval from {} to deploy {}",
                casper::schema::to_hex(approval.signer),
                casper::schema::to_hex(deploy.hash));
  deploy.approvals.push_back(std::move(approval));
  return deploy;
}

}  // namespace casper::deploy
