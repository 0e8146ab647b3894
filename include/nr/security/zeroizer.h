#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace nr::security {

// Wipes key material and secrets before their storage is released. // TSK006
class Zeroizer {
public:
  static void Wipe(std::span<uint8_t> data) noexcept;

  // Passwords and signing secrets arrive as std::string from config and the
  // wire; the buffer is wiped in place and the string left empty.
  static void WipeString(std::string& value) noexcept;

  template <typename T>
  static void WipeVector(std::vector<T>& vec) noexcept {
    Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(vec.data()), vec.size() * sizeof(T)));
  }

  template <typename T>
  class ScopeWiper {
  public:
    ScopeWiper(T* ptr, std::size_t count) noexcept : span_(ptr, count) {}
    ScopeWiper(const ScopeWiper&) = delete;
    ScopeWiper& operator=(const ScopeWiper&) = delete;

    ~ScopeWiper() noexcept {
      Zeroizer::Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(span_.data()), span_.size_bytes()));
    }

  private:
    std::span<T> span_;
  };
};

} // namespace nr::security
