#pragma once

#include <stdexcept>
#include <string>

// Errors raised by the deploy core. All of them are terminal for the current
// build or sign call and are never retried.
namespace casper::common {

class error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A required field is missing or malformed before any hashing happens.
class validation_error final : public error {
 public:
  using error::error;
};

// A value cannot be represented in its declared type (bad hex, a negative or
// oversized number, truncated bytes, an unknown descriptor tag).
class encoding_error final : public error {
 public:
  using error::error;
};

// An enumerated name (for instance a key variant) is not recognized.
class argument_error final : public error {
 public:
  using error::error;
};

// Key material is malformed or the algorithm is unsupported.
class signing_error final : public error {
 public:
  using error::error;
};

}  // namespace casper::common
