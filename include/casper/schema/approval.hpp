#pragma once
#include <casper/schema/primitives.hpp>
#include <casper/schema/public_key.hpp>

// Schema type: approval.
// One signer's signature over a deploy hash.
namespace casper::schema {

template <uint16_t Version>
struct approval;

template <>
struct approval<1> final {
  public_key_t signer;
  // Algorithm tag followed by the 64 signature bytes.
  bytes_t signature;
};

using approval_t = approval<1>;

}  // namespace casper::schema
