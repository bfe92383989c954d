#include <casper/blake2b/hash.hpp>
#include <casper/common/error.hpp>

namespace casper::blake2b {

namespace {

bool initialize() {
  static const auto initialized = sodium_init() >= 0;
  return initialized;
}

void require_library() {
  if (!initialize()) {
    throw common::error{"libsodium failed to initialize"};
  }
}

}  // namespace

bool available() {
  return initialize();
}

casper::schema::hash32_t hash(const std::string_view& str) {
  return hash(casper::schema::make_bytes_view(str));
}

casper::schema::hash32_t hash(const casper::schema::bytes_view_t& bytes) {
  require_library();
  auto output = casper::schema::hash32_t{};
  if (crypto_generichash(output.data(), output.size(), bytes.data(),
                         bytes.size(), nullptr, 0) != 0) {
    throw common::error{"blake2b hash failed"};
  }
  return output;
}

hasher::hasher() {
  require_library();
  if (crypto_generichash_init(&state_, nullptr, 0,
                              casper::schema::hash32_t{}.size()) != 0) {
    throw common::error{"blake2b hasher init failed"};
  }
}

hasher& hasher::update(const casper::schema::bytes_view_t& bytes) {
  if (finalized_) {
    throw common::error{"blake2b hasher updated after finalize"};
  }
  if (crypto_generichash_update(&state_, bytes.data(), bytes.size()) != 0) {
    throw common::error{"blake2b hasher update failed"};
  }
  return *this;
}

casper::schema::hash32_t hasher::finalize() {
  if (finalized_) {
    throw common::error{"blake2b hasher finalized twice"};
  }
  finalized_ = true;
  auto output = casper::schema::hash32_t{};
  if (crypto_generichash_final(&state_, output.data(), output.size()) != 0) {
    throw common::error{"blake2b hasher finalize failed"};
  }
  return output;
}

}  // namespace casper::blake2b
