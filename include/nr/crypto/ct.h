#pragma once
#include <array>
#include <atomic>
#include <cstdint>

namespace nr::crypto::ct {

template <size_t N>
inline bool CompareEqual(const std::array<uint8_t, N>& a,
                         const std::array<uint8_t, N>& b) noexcept {
  volatile uint8_t diff = 0;
  for (size_t i = 0; i < N; ++i)
    diff |= (a[i] ^ b[i]);
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return diff == 0;
}

} // namespace nr::crypto::ct
