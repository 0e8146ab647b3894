#include "nr/crypto/sha256.h"

#include "nr/crypto/provider.h"

namespace nr::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA256(data);
}

std::array<uint8_t, 32> SHA256_Hash(std::string_view data) {
  return SHA256_Hash(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()),
                                              data.size()));
}

std::string SHA256_Hex(std::string_view data) {
  static constexpr char kHex[] = "0123456789abcdef";
  const auto digest = SHA256_Hash(data);
  std::string out;
  out.reserve(digest.size() * 2);
  for (uint8_t b : digest) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

}  // namespace nr::crypto
