#pragma once
#include <casper/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <sodium.h>

// BLAKE2b with a 32 byte digest and no key.
namespace casper::blake2b {

// False when the underlying library failed to initialize.
bool available();

casper::schema::hash32_t hash(const std::string_view& str);
casper::schema::hash32_t hash(const casper::schema::bytes_view_t& bytes);

// Incremental form, for hashing a concatenation without building it.
class hasher final {
 public:
  hasher();

  hasher& update(const casper::schema::bytes_view_t& bytes);
  casper::schema::hash32_t finalize();

 private:
  crypto_generichash_state state_{};
  bool finalized_{false};
};

}  // namespace casper::blake2b
