#include "nr/exec/shell_words.h"

#include "nr/error.h"
#include "nr/errors.h"

namespace nr::exec {

namespace {

bool IsSeparator(char c) { return c == ' ' || c == '\t'; }

[[noreturn]] void ThrowMalformed() {
  throw ValidationError(ValidationFailure::kMalformedCommand,
                        std::string(errors::msg::kMalformedCommand));
}

}  // namespace

std::vector<std::string> SplitShellWords(std::string_view text) {
  std::vector<std::string> words;
  std::string current;
  bool in_word = false;
  size_t i = 0;
  const size_t n = text.size();

  auto finish_word = [&]() {
    if (in_word) {
      words.push_back(std::move(current));
      current.clear();
      in_word = false;
    }
  };

  while (i < n) {
    const char c = text[i];
    if (IsSeparator(c)) {
      finish_word();
      ++i;
      continue;
    }
    in_word = true;
    if (c == '\'') {
      const size_t close = text.find('\'', i + 1);
      if (close == std::string_view::npos) {
        ThrowMalformed();
      }
      current.append(text.substr(i + 1, close - i - 1));
      i = close + 1;
      continue;
    }
    if (c == '"') {
      ++i;
      bool closed = false;
      while (i < n) {
        const char d = text[i];
        if (d == '"') {
          closed = true;
          ++i;
          break;
        }
        if (d == '\\' && i + 1 < n) {
          const char next = text[i + 1];
          if (next == '"' || next == '\\' || next == '$' || next == '`') {
            current.push_back(next);
            i += 2;
            continue;
          }
        }
        current.push_back(d);
        ++i;
      }
      if (!closed) {
        ThrowMalformed();
      }
      continue;
    }
    if (c == '\\') {
      if (i + 1 >= n) {
        ThrowMalformed();
      }
      current.push_back(text[i + 1]);
      i += 2;
      continue;
    }
    current.push_back(c);
    ++i;
  }
  finish_word();
  return words;
}

}  // namespace nr::exec
