#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace nr::crypto {
std::array<uint8_t,32> SHA256_Hash(std::span<const uint8_t> data);
std::array<uint8_t,32> SHA256_Hash(std::string_view data);
// Lowercase hex digest, used for log fields that must not carry the value.
std::string SHA256_Hex(std::string_view data);
} // namespace nr::crypto
