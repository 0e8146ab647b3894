#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>

namespace nr::crypto {

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) = 0;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;

  virtual void RandomBytes(std::span<uint8_t> out) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) override;

  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;

  void RandomBytes(std::span<uint8_t> out) override;
};

// The process-wide provider. The first call runs the HMAC and SHA-256
// known-answer tests and throws nr::Error{Crypto} if either fails.
std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void EnsureCryptoProviderInitialized(); // TSK072_CryptoProvider_Init_and_KAT runtime initialization hook

}  // namespace nr::crypto
