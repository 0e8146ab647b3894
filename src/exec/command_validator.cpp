#include "nr/exec/command_validator.h"

#include <unistd.h>

#include <system_error>

#include "nr/error.h"
#include "nr/errors.h"
#include "nr/exec/shell_words.h"

namespace nr::exec {

namespace {

[[noreturn]] void Reject(ValidationFailure reason, std::string_view message) {
  throw ValidationError(reason, std::string(message));
}

bool IsComponentSeparator(char c) { return c == '/' || c == '\\' || c == '='; }

// Lexical containment after both sides are canonical.
bool IsWithin(const std::filesystem::path& candidate, const std::filesystem::path& root) {
  auto root_it = root.begin();
  auto cand_it = candidate.begin();
  for (; root_it != root.end(); ++root_it, ++cand_it) {
    if (root_it->empty()) {
      continue; // trailing separator
    }
    if (cand_it == candidate.end() || *cand_it != *root_it) {
      return false;
    }
  }
  return true;
}

}  // namespace

bool ContainsShellMetacharacter(std::string_view argument) noexcept {
  for (char c : argument) {
    switch (c) {
    case ';':
    case '&':
    case '|':
    case '$':
    case '(':
    case ')':
    case '`':
    case '<':
    case '>':
    case '\n':
    case '\r':
    case '\0':
      return true;
    default:
      break;
    }
  }
  return false;
}

bool ContainsTraversal(std::string_view argument) noexcept {
  size_t start = 0;
  for (size_t i = 0; i <= argument.size(); ++i) {
    if (i < argument.size() && !IsComponentSeparator(argument[i])) {
      continue;
    }
    const std::string_view component = argument.substr(start, i - start);
    if (component == "..") {
      return true;
    }
    // A home-directory reference at the start of the argument or of an
    // option value (--out=~/x).
    if (!component.empty() && component.front() == '~' &&
        (start == 0 || argument[start - 1] == '=')) {
      return true;
    }
    start = i + 1;
  }
  return false;
}

CommandValidator::CommandValidator(Allowlist allowlist, ValidatorLimits limits)
    : allowlist_(std::move(allowlist)), limits_(std::move(limits)) {
  for (const auto& root : limits_.working_directory_roots) {
    std::error_code ec;
    auto canonical = std::filesystem::canonical(root, ec);
    if (ec) {
      throw Error(ErrorDomain::Config, errors::config::kInvalidValue, "Working directory root is not accessible",
                  ec.value());
    }
    canonical_roots_.push_back(std::move(canonical));
  }
}

ExecutablePlan CommandValidator::Validate(const CommandRequest& request) const {
  std::vector<std::string> tokens;
  if (request.argv) {
    tokens = *request.argv;
  } else if (request.raw_text) {
    tokens = SplitShellWords(*request.raw_text);
  }
  if (tokens.empty() || tokens.front().empty()) {
    Reject(ValidationFailure::kEmptyCommand, errors::msg::kEmptyCommand);
  }

  // The program check precedes every argument check so a disallowed program
  // is reported as such whatever its arguments look like.
  const AllowlistEntry* entry = allowlist_.Resolve(tokens.front());
  if (entry == nullptr) {
    Reject(ValidationFailure::kDisallowedProgram, errors::msg::kProgramNotAllowed);
  }

  std::vector<std::string> args(std::make_move_iterator(tokens.begin() + 1),
                                std::make_move_iterator(tokens.end()));
  if (args.size() > limits_.max_arguments) {
    Reject(ValidationFailure::kTooManyArguments, errors::msg::kTooManyArguments);
  }
  for (const auto& arg : args) {
    if (arg.size() > limits_.max_argument_length) {
      Reject(ValidationFailure::kArgumentTooLong, errors::msg::kArgumentTooLong);
    }
  }
  for (const auto& arg : args) {
    if (ContainsShellMetacharacter(arg)) {
      Reject(ValidationFailure::kMetacharacterDetected, errors::msg::kMetacharacterDetected);
    }
  }
  for (const auto& arg : args) {
    if (ContainsTraversal(arg)) {
      Reject(ValidationFailure::kTraversalDetected, errors::msg::kTraversalDetected);
    }
  }

  auto cwd = ResolveWorkingDirectory(request.working_directory);
  return ExecutablePlan(entry->id, entry->executable, std::move(args), std::move(cwd));
}

std::optional<std::filesystem::path> CommandValidator::ResolveWorkingDirectory(
    const std::optional<std::string>& requested) const {
  if (!requested) {
    if (!canonical_roots_.empty()) {
      return canonical_roots_.front();
    }
    return std::nullopt;
  }
  const std::string& raw = *requested;
  if (raw.empty() || raw.size() > limits_.max_argument_length || ContainsShellMetacharacter(raw)) {
    Reject(ValidationFailure::kWorkingDirectoryInvalid, errors::msg::kWorkingDirectoryInvalid);
  }
  for (const auto& part : std::filesystem::path(raw)) {
    if (part == "..") {
      Reject(ValidationFailure::kWorkingDirectoryInvalid, errors::msg::kWorkingDirectoryInvalid);
    }
  }
  if (raw.front() == '~') {
    Reject(ValidationFailure::kWorkingDirectoryInvalid, errors::msg::kWorkingDirectoryInvalid);
  }

  std::error_code ec;
  auto canonical = std::filesystem::canonical(raw, ec);
  if (ec || !std::filesystem::is_directory(canonical, ec) || ec) {
    Reject(ValidationFailure::kWorkingDirectoryInvalid, errors::msg::kWorkingDirectoryInvalid);
  }
  if (::access(canonical.c_str(), R_OK | X_OK) != 0) {
    Reject(ValidationFailure::kWorkingDirectoryInvalid, errors::msg::kWorkingDirectoryInvalid);
  }
  if (!canonical_roots_.empty()) {
    bool contained = false;
    for (const auto& root : canonical_roots_) {
      if (IsWithin(canonical, root)) {
        contained = true;
        break;
      }
    }
    if (!contained) {
      Reject(ValidationFailure::kWorkingDirectoryInvalid, errors::msg::kWorkingDirectoryInvalid);
    }
  }
  return canonical;
}

}  // namespace nr::exec
