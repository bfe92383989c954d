#pragma once
#include <casper/schema/deploy.hpp>
#include <string>

namespace casper::deploy {

struct validation_result_t final {
  bool valid{true};
  // First failure found, empty when valid.
  std::string reason;
};

// Recomputes the body hash and the deploy hash, then checks every approval
// against the deploy hash.
validation_result_t validate_deploy(const casper::schema::deploy_t& deploy);

}  // namespace casper::deploy
