#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace nr::security {

inline constexpr std::string_view kRedactionMarker{"***REDACTED***"};

struct SanitizedChunk {
  std::string text;
  size_t redacted_count{0};
};

// Replaces credential values in `key=value` / `key: value` shapes with the
// redaction marker. Pure and idempotent. // TSK404_Output_Redaction
SanitizedChunk Sanitize(std::string_view chunk);

// Line-buffered wrapper for process output. Complete lines are sanitized as
// they arrive; a trailing partial line is carried until it ends, flushed, or
// outgrows the carry bound, in which case only the part that cannot hold a
// pending key or value is emitted.
class StreamingSanitizer {
public:
  static constexpr size_t kDefaultMaxCarry = 4 * 1024;

  explicit StreamingSanitizer(size_t max_carry = kDefaultMaxCarry);

  SanitizedChunk Feed(std::string_view chunk);
  SanitizedChunk Flush();

  size_t carry_size() const noexcept { return carry_.size(); }

private:
  // Drops the continuation of a value whose prefix was already replaced by
  // the marker during a forced split. Returns bytes of `chunk` consumed.
  size_t ConsumeSuppressed(std::string_view chunk, std::string& out);
  // Appends scanner output, skipping the replayed key text still owed.
  void Emit(SanitizedChunk& into, std::string_view text, size_t redacted);

  std::string carry_;
  size_t max_carry_;
  // Leading carry bytes re-fed so a key cut off before its value still
  // binds; already emitted once.
  size_t replayed_{0};
  bool suppressing_{false};
  char suppress_quote_{'\0'};
};

} // namespace nr::security
