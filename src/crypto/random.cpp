#include "nr/crypto/random.h"

#include <cerrno>
#include <fstream>
#include <vector>

#if defined(__linux__)
#include <sys/random.h>
#endif

#include "nr/crypto/provider.h"
#include "nr/error.h"
#include "nr/security/zeroizer.h"

namespace {

void ReadFromUrandom(std::span<uint8_t> out) { // TSK134_Insufficient_Entropy_for_Keys POSIX fallback
  std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
  if (!urandom) {
    throw nr::Error(nr::ErrorDomain::Crypto, errno, "Failed to open /dev/urandom");
  }
  urandom.read(reinterpret_cast<char*>(out.data()),
               static_cast<std::streamsize>(out.size()));
  if (urandom.gcount() != static_cast<std::streamsize>(out.size())) {
    throw nr::Error(nr::ErrorDomain::Crypto, errno,
                    "Failed to read sufficient entropy from /dev/urandom");
  }
}

void XorInto(std::span<uint8_t> dest, std::span<const uint8_t> src) {
  for (size_t i = 0; i < dest.size() && i < src.size(); ++i) {
    dest[i] ^= src[i];
  }
}

}  // namespace

namespace nr::crypto {

void SystemRandomBytes(std::span<uint8_t> out) { // TSK106_Cryptographic_Implementation_Weaknesses
  if (out.empty()) {
    return;
  }
#if defined(__linux__)
  size_t offset = 0;
  while (offset < out.size()) {
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, 0);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == ENOSYS) {
        break; // fall back to /dev/urandom below
      }
      throw Error(ErrorDomain::Crypto, errno, "getrandom failed");
    }
    offset += static_cast<size_t>(result);
  }
  if (offset < out.size()) {
    ReadFromUrandom(out.subspan(offset));
  }
#else
  ReadFromUrandom(out);
#endif
  // Mix in the provider's DRBG so a broken kernel source alone is not enough.
  std::vector<uint8_t> extra(out.size());
  nr::security::Zeroizer::ScopeWiper<uint8_t> wipe_extra(extra.data(), extra.size());
  GetCryptoProvider().RandomBytes(extra);
  XorInto(out, extra);
}

std::string RandomHex(size_t bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::vector<uint8_t> raw(bytes);
  SystemRandomBytes(raw);
  std::string out;
  out.reserve(bytes * 2);
  for (uint8_t b : raw) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

}  // namespace nr::crypto
