#include <turnstile/ledger/id_source.hpp>

#include <random>

namespace turnstile::ledger {

id_source::id_source() {
  auto device = std::random_device{};
  for (auto& byte : nonce_) {
    byte = static_cast<uint8_t>(device() & 0xFF);
  }
}

}  // namespace turnstile::ledger
