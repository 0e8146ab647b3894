#include "nr/security/zeroizer.h"

#include <string.h> // explicit_bzero

namespace nr::security {

  void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
    // explicit_bzero is not elided by dead-store elimination. // TSK006
    ::explicit_bzero(data.data(), data.size());
  }

  void Zeroizer::WipeString(std::string& value) noexcept {
    if (value.empty()) {
      return;
    }
    ::explicit_bzero(value.data(), value.size());
    value.clear();
  }

} // namespace nr::security
