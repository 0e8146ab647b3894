#pragma once
// TSK402_Command_Validation deny-by-default command admission

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "nr/exec/allowlist.h"

namespace nr::exec {

struct CommandRequest {
  // Exactly one of raw_text / argv is expected. argv wins when both are set.
  std::optional<std::string> raw_text;
  std::optional<std::vector<std::string>> argv;
  std::optional<std::string> working_directory;
  std::chrono::system_clock::time_point requested_at{std::chrono::system_clock::now()};
};

class CommandValidator;

// The only thing the supervisor will run. Instances come out of
// CommandValidator::Validate and cannot be edited afterwards.
class ExecutablePlan {
 public:
  const std::string& program() const noexcept { return program_; }
  const std::string& executable() const noexcept { return executable_; }
  const std::vector<std::string>& argv() const noexcept { return argv_; }
  const std::optional<std::filesystem::path>& working_directory() const noexcept {
    return working_directory_;
  }

 private:
  friend class CommandValidator;
  ExecutablePlan(std::string program, std::string executable, std::vector<std::string> argv,
                 std::optional<std::filesystem::path> working_directory)
      : program_(std::move(program)),
        executable_(std::move(executable)),
        argv_(std::move(argv)),
        working_directory_(std::move(working_directory)) {}

  std::string program_;
  std::string executable_;
  std::vector<std::string> argv_;
  std::optional<std::filesystem::path> working_directory_;
};

struct ValidatorLimits {
  size_t max_arguments{64};
  size_t max_argument_length{4096};
  // When non-empty, requested working directories must canonicalize under one
  // of these and a request without one runs in the first root.
  std::vector<std::filesystem::path> working_directory_roots;
};

class CommandValidator {
 public:
  CommandValidator(Allowlist allowlist, ValidatorLimits limits);

  // Throws ValidationError. Checks run in a fixed order: tokenize, program,
  // count/length, metacharacters, traversal, working directory.
  ExecutablePlan Validate(const CommandRequest& request) const;

  const Allowlist& allowlist() const noexcept { return allowlist_; }
  const ValidatorLimits& limits() const noexcept { return limits_; }

 private:
  std::optional<std::filesystem::path> ResolveWorkingDirectory(
      const std::optional<std::string>& requested) const;

  Allowlist allowlist_;
  ValidatorLimits limits_;
  std::vector<std::filesystem::path> canonical_roots_;
};

// Exposed for tests and for callers that pre-screen single values.
bool ContainsShellMetacharacter(std::string_view argument) noexcept;
bool ContainsTraversal(std::string_view argument) noexcept;

}  // namespace nr::exec
