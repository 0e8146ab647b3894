#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace nr::crypto {

void SystemRandomBytes(std::span<uint8_t> out); // TSK106_Cryptographic_Implementation_Weaknesses

// Lowercase hex of `bytes` fresh random bytes.
std::string RandomHex(size_t bytes);

}  // namespace nr::crypto
