#include "nr/security/output_sanitizer.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace nr::security {
namespace {

enum class KeyKind { kPlain, kAuthorization, kBearer };

struct KeySpec {
  std::string_view name;
  KeyKind kind;
};

// Longest first; no key is a prefix of another.
constexpr std::array<KeySpec, 9> kKeys{{
    {"authorization", KeyKind::kAuthorization},
    {"password", KeyKind::kPlain},
    {"api_key", KeyKind::kPlain},
    {"api-key", KeyKind::kPlain},
    {"passwd", KeyKind::kPlain},
    {"secret", KeyKind::kPlain},
    {"bearer", KeyKind::kBearer},
    {"token", KeyKind::kPlain},
    {"pwd", KeyKind::kPlain},
}};

constexpr std::array<std::string_view, 5> kAuthSchemes{"bearer", "basic", "digest", "token",
                                                       "negotiate"};

char Lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
bool IsBlank(char c) { return c == ' ' || c == '\t'; }
bool IsLineEnd(char c) { return c == '\n' || c == '\r'; }
bool IsValueEnd(char c) { return IsBlank(c) || IsLineEnd(c); }
bool IsQuote(char c) { return c == '"' || c == '\''; }

size_t MatchPrefix(std::string_view text, std::string_view word) {
  const size_t n = std::min(text.size(), word.size());
  size_t i = 0;
  while (i < n && Lower(text[i]) == word[i]) {
    ++i;
  }
  return i;
}

size_t WordEnd(std::string_view text, size_t from) {
  while (from < text.size() && !IsValueEnd(text[from])) {
    ++from;
  }
  return from;
}

bool IsAuthScheme(std::string_view word) {
  return std::any_of(kAuthSchemes.begin(), kAuthSchemes.end(), [word](std::string_view scheme) {
    return word.size() == scheme.size() && MatchPrefix(word, scheme) == scheme.size();
  });
}

enum class Found { kNoMatch, kMatch, kIncomplete };

// Positions are absolute offsets into the scanned text.
struct Match {
  size_t value_begin{0};
  size_t value_end{0};
  size_t resume{0};
  char quote{'\0'};
  bool value_started{false}; // incomplete results only
};

// With final == false, running out of text before a value is known to have
// ended yields kIncomplete so the caller can wait for more input.
Found TryKey(std::string_view text, size_t pos, const KeySpec& key, bool final, Match& m) {
  const size_t n = text.size();
  size_t j = pos + key.name.size();
  bool closed_quote = false;
  if (j < n && IsQuote(text[j])) {
    ++j;
    closed_quote = true;
  }
  const size_t blanks_from = j;
  while (j < n && IsBlank(text[j])) {
    ++j;
  }
  const bool had_blank = j > blanks_from;
  if (j == n) {
    return final ? Found::kNoMatch : Found::kIncomplete;
  }
  if (text[j] == '=' || text[j] == ':') {
    ++j;
    while (j < n && IsBlank(text[j])) {
      ++j;
    }
  } else if (!(key.kind == KeyKind::kBearer && had_blank && !closed_quote)) {
    return Found::kNoMatch;
  }
  if (j == n) {
    return final ? Found::kNoMatch : Found::kIncomplete;
  }
  if (IsLineEnd(text[j])) {
    return Found::kNoMatch;
  }

  if (IsQuote(text[j])) {
    m.quote = text[j];
    m.value_begin = j + 1;
    size_t k = m.value_begin;
    while (k < n && text[k] != m.quote && !IsLineEnd(text[k])) {
      ++k;
    }
    if (k == n) {
      if (!final) {
        m.value_started = true;
        return Found::kIncomplete;
      }
      m.value_end = n;
      m.resume = n;
    } else {
      m.value_end = k;
      m.resume = text[k] == m.quote ? k + 1 : k;
    }
    return Found::kMatch;
  }

  m.quote = '\0';
  m.value_begin = j;
  size_t end = WordEnd(text, j);
  if (end == n && !final) {
    m.value_started = true;
    return Found::kIncomplete;
  }
  if (key.kind == KeyKind::kAuthorization && IsAuthScheme(text.substr(j, end - j))) {
    size_t credential = end;
    while (credential < n && IsBlank(text[credential])) {
      ++credential;
    }
    if (credential == n && !final) {
      m.value_started = true;
      return Found::kIncomplete;
    }
    if (credential < n && !IsLineEnd(text[credential])) {
      const size_t credential_end = WordEnd(text, credential);
      if (credential_end == n && !final) {
        m.value_started = true;
        return Found::kIncomplete;
      }
      end = credential_end;
    }
  }
  m.value_end = end;
  m.resume = end;
  return Found::kMatch;
}

Found TryAt(std::string_view text, size_t pos, bool final, Match& m) {
  bool incomplete = false;
  const std::string_view rest = text.substr(pos);
  for (const auto& key : kKeys) {
    const size_t matched = MatchPrefix(rest, key.name);
    if (matched < key.name.size()) {
      if (!final && matched == rest.size()) {
        incomplete = true;
      }
      continue;
    }
    Match candidate;
    const Found found = TryKey(text, pos, key, final, candidate);
    if (found == Found::kMatch) {
      m = candidate;
      return Found::kMatch;
    }
    if (found == Found::kIncomplete) {
      m = candidate;
      incomplete = true;
    }
  }
  return incomplete ? Found::kIncomplete : Found::kNoMatch;
}

struct ScanResult {
  std::string out;
  size_t redacted{0};
  size_t stop{0};          // first byte not consumed
  bool pending{false};     // a key starts at `stop` and is still open
  Match pending_match;
  size_t split_pos{0};     // just past the last literal blank before `stop`
  size_t split_out{0};
  size_t split_redacted{0};
};

ScanResult Scan(std::string_view text, bool final) {
  ScanResult r;
  r.out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    Match m;
    const Found found = TryAt(text, i, final, m);
    if (found == Found::kIncomplete) {
      r.pending = true;
      r.pending_match = m;
      r.stop = i;
      return r;
    }
    if (found == Found::kMatch) {
      const std::string_view value = text.substr(m.value_begin, m.value_end - m.value_begin);
      r.out.append(text.substr(i, m.value_begin - i));
      if (value.empty() || value == kRedactionMarker) {
        r.out.append(value);
      } else {
        r.out.append(kRedactionMarker);
        ++r.redacted;
      }
      r.out.append(text.substr(m.value_end, m.resume - m.value_end));
      i = m.resume;
      continue;
    }
    r.out.push_back(text[i]);
    if (IsBlank(text[i])) {
      r.split_pos = i + 1;
      r.split_out = r.out.size();
      r.split_redacted = r.redacted;
    }
    ++i;
  }
  r.stop = text.size();
  return r;
}

void Append(SanitizedChunk& into, std::string_view text, size_t redacted) {
  into.text.append(text);
  into.redacted_count += redacted;
}

} // namespace

SanitizedChunk Sanitize(std::string_view chunk) {
  auto scan = Scan(chunk, true);
  return SanitizedChunk{std::move(scan.out), scan.redacted};
}

StreamingSanitizer::StreamingSanitizer(size_t max_carry) : max_carry_(max_carry == 0 ? 1 : max_carry) {}

size_t StreamingSanitizer::ConsumeSuppressed(std::string_view chunk, std::string& out) {
  size_t k = 0;
  while (k < chunk.size()) {
    const char c = chunk[k];
    if (IsLineEnd(c)) {
      suppressing_ = false;
      return k;
    }
    if (suppress_quote_ == '\0') {
      if (IsBlank(c)) {
        suppressing_ = false;
        return k;
      }
    } else if (c == suppress_quote_) {
      out.push_back(c);
      suppressing_ = false;
      return k + 1;
    }
    ++k;
  }
  return k;
}

void StreamingSanitizer::Emit(SanitizedChunk& into, std::string_view text, size_t redacted) {
  const size_t skip = std::min(replayed_, text.size());
  replayed_ -= skip;
  Append(into, text.substr(skip), redacted);
}

SanitizedChunk StreamingSanitizer::Feed(std::string_view chunk) {
  SanitizedChunk result;
  if (suppressing_) {
    chunk.remove_prefix(ConsumeSuppressed(chunk, result.text));
  }
  carry_.append(chunk.data(), chunk.size());

  const size_t last_eol = carry_.find_last_of("\r\n");
  if (last_eol != std::string::npos) {
    auto lines = Scan(std::string_view(carry_).substr(0, last_eol + 1), true);
    Emit(result, lines.out, lines.redacted);
    carry_.erase(0, last_eol + 1);
  }

  while (carry_.size() > max_carry_) {
    auto partial = Scan(carry_, false);
    if (partial.split_pos > 0) {
      Emit(result, std::string_view(partial.out).substr(0, partial.split_out), partial.split_redacted);
      carry_.erase(0, partial.split_pos);
      continue;
    }
    if (partial.stop > 0) {
      Emit(result, partial.out, partial.redacted);
      carry_.erase(0, partial.stop);
      continue;
    }
    // An open key sits at the start of an oversized carry.
    if (partial.pending && partial.pending_match.value_started) {
      const auto& m = partial.pending_match;
      Emit(result, std::string_view(carry_).substr(0, m.value_begin), 0);
      result.text.append(kRedactionMarker);
      ++result.redacted_count;
      suppressing_ = true;
      suppress_quote_ = m.quote;
      carry_.clear();
      continue;
    }
    if (partial.pending) {
      // Key without its value yet: emit the padding, then keep the key with
      // each blank run folded to one space so the value that follows is
      // still matched against it.
      Emit(result, carry_, 0);
      std::string key;
      for (const char c : carry_) {
        if (!IsBlank(c) || key.empty() || !IsBlank(key.back())) {
          key.push_back(IsBlank(c) ? ' ' : c);
        }
      }
      carry_ = std::move(key);
      replayed_ = carry_.size();
      break;
    }
    auto forced = Scan(carry_, true);
    Emit(result, forced.out, forced.redacted);
    carry_.clear();
  }
  return result;
}

SanitizedChunk StreamingSanitizer::Flush() {
  auto scan = Scan(carry_, true);
  SanitizedChunk result;
  Emit(result, scan.out, scan.redacted);
  carry_.clear();
  replayed_ = 0;
  suppressing_ = false;
  return result;
}

} // namespace nr::security
