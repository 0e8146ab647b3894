#include "nr/crypto/hmac_sha256.h"

#include "nr/crypto/provider.h"

using namespace nr::crypto;

std::array<uint8_t, HMAC_SHA256::TAG_SIZE>
HMAC_SHA256::Compute(std::span<const uint8_t> key, std::span<const uint8_t> msg) {
  auto provider = GetCryptoProviderShared();
  return provider->HMACSHA256(key, msg);
}

std::array<uint8_t, HMAC_SHA256::TAG_SIZE>
HMAC_SHA256::Compute(std::span<const uint8_t> key, std::string_view msg) {
  return Compute(key, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(msg.data()),
                                               msg.size()));
}
