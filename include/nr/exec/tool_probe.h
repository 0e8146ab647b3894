#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nr/exec/allowlist.h"

namespace nr::exec {

struct ToolStatus {
  std::string id;
  std::optional<std::filesystem::path> resolved; // empty when not found
  bool available() const noexcept { return resolved.has_value(); }
};

// Resolves `executable` the way execvp would: as given when it contains a
// slash, otherwise against each directory of `search_path`.
std::optional<std::filesystem::path> ResolveExecutable(std::string_view executable,
                                                       std::string_view search_path);

// Probes every allowlist entry and publishes tool_available / tool_missing
// events. Missing tools stay allowlisted.
std::vector<ToolStatus> ProbeTools(const Allowlist& allowlist, std::string_view search_path);

}  // namespace nr::exec
