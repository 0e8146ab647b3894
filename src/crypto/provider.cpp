#include "nr/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <array>
#include <iostream> // TSK023_Production_Crypto_Provider_Complete_Integration runtime logging
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "nr/crypto/ct.h" // TSK102_Timing_Side_Channels constant-time comparisons
#include "nr/error.h"

namespace nr::crypto {

namespace {

void ThrowCryptoError(const std::string& message, int code = 0);

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

struct RuntimeState { // TSK072_CryptoProvider_Init_and_KAT cache runtime metadata
  std::once_flag once;
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{}; // TSK072_CryptoProvider_Init_and_KAT global runtime guard
  return state;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

void ThrowCryptoError(const std::string& message, int code) {
  throw nr::Error(nr::ErrorDomain::Crypto, code, message);
}

std::span<const uint8_t> AsBytes(std::string_view text) {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

void RunKnownAnswerTests() { // TSK072_CryptoProvider_Init_and_KAT HMAC/SHA self-test
  // RFC 4231 test case 2.
  static constexpr std::array<uint8_t, 32> kExpectedHmac{
      0x5b, 0xdc, 0xc1, 0x46, 0xbf, 0x60, 0x75, 0x4e, 0x6a, 0x04, 0x24, 0x26, 0x08, 0x95, 0x75, 0xc7,
      0x5a, 0x00, 0x3f, 0x08, 0x9d, 0x27, 0x39, 0x83, 0x9d, 0xec, 0x58, 0xb9, 0x64, 0xec, 0x38, 0x43};
  // FIPS 180-2 "abc".
  static constexpr std::array<uint8_t, 32> kExpectedSha{
      0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
      0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};

  OpenSSLCryptoProvider provider;
  const auto mac = provider.HMACSHA256(AsBytes("Jefe"), AsBytes("what do ya want for nothing?"));
  if (!ct::CompareEqual(mac, kExpectedHmac)) {
    ThrowCryptoError("HMAC-SHA256 KAT mismatch");
  }
  const auto digest = provider.SHA256(AsBytes("abc"));
  if (!ct::CompareEqual(digest, kExpectedSha)) {
    ThrowCryptoError("SHA-256 KAT mismatch");
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
    RunKnownAnswerTests();
    state.kat_passed = true;
    std::clog << "[crypto] HMAC-SHA256 known-answer test passed" << std::endl; // TSK072_CryptoProvider_Init_and_KAT KAT logging
  });
}

}  // namespace

void EnsureCryptoProviderInitialized() { // TSK072_CryptoProvider_Init_and_KAT public runtime entry point
  EnsureCryptoRuntimeConfigured();
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::HMACSHA256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  // HMAC() treats a null key pointer as an error even for zero length.
  static const uint8_t kEmpty = 0;
  const uint8_t* key_ptr = key.empty() ? &kEmpty : key.data();
  const uint8_t* msg_ptr = message.empty() ? &kEmpty : message.data();
  if (HMAC(EVP_sha256(), key_ptr, static_cast<int>(key.size()), msg_ptr,
           message.size(), out.data(), &len) == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("HMAC(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected HMAC-SHA256 length", static_cast<int>(len));
  }
  return out;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(
    std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length", static_cast<int>(len));
  }
  return out;
}

void OpenSSLCryptoProvider::RandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("RAND_bytes"));
  }
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured(); // TSK023_Production_Crypto_Provider_Complete_Integration configure runtime once
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

}  // namespace nr::crypto
