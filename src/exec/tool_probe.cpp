#include "nr/exec/tool_probe.h"

#include <unistd.h>

#include <system_error>

#include "nr/orchestrator/event_bus.h"

namespace nr::exec {

namespace {

bool IsExecutableFile(const std::filesystem::path& candidate) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(candidate, ec) || ec) {
    return false;
  }
  return ::access(candidate.c_str(), X_OK) == 0;
}

}  // namespace

std::optional<std::filesystem::path> ResolveExecutable(std::string_view executable,
                                                       std::string_view search_path) {
  if (executable.empty()) {
    return std::nullopt;
  }
  if (executable.find('/') != std::string_view::npos) {
    std::filesystem::path direct{std::string(executable)};
    if (IsExecutableFile(direct)) {
      return direct;
    }
    return std::nullopt;
  }
  size_t start = 0;
  while (start <= search_path.size()) {
    size_t end = search_path.find(':', start);
    if (end == std::string_view::npos) {
      end = search_path.size();
    }
    std::string_view dir = search_path.substr(start, end - start);
    // An empty PATH element means the current directory to execvp; the
    // gateway never resolves tools relative to its own working directory.
    if (!dir.empty()) {
      auto candidate = std::filesystem::path(std::string(dir)) / std::string(executable);
      if (IsExecutableFile(candidate)) {
        return candidate;
      }
    }
    start = end + 1;
  }
  return std::nullopt;
}

std::vector<ToolStatus> ProbeTools(const Allowlist& allowlist, std::string_view search_path) {
  std::vector<ToolStatus> statuses;
  statuses.reserve(allowlist.entries().size());
  size_t available = 0;
  for (const auto& entry : allowlist.entries()) {
    ToolStatus status;
    status.id = entry.id;
    status.resolved = ResolveExecutable(entry.executable, search_path);

    orchestrator::Event event;
    event.category = orchestrator::EventCategory::kDiagnostics;
    event.severity = status.available() ? orchestrator::EventSeverity::kDebug
                                        : orchestrator::EventSeverity::kInfo;
    event.event_id = status.available() ? "tool_available" : "tool_missing";
    event.fields.emplace_back("tool", entry.id);
    orchestrator::EventBus::Instance().Publish(event);

    if (status.available()) {
      ++available;
    }
    statuses.push_back(std::move(status));
  }

  orchestrator::Event summary;
  summary.category = orchestrator::EventCategory::kLifecycle;
  summary.severity = orchestrator::EventSeverity::kInfo;
  summary.event_id = "tool_probe_complete";
  summary.fields.emplace_back("available", std::to_string(available), orchestrator::FieldPrivacy::kPublic, true);
  summary.fields.emplace_back("allowlisted", std::to_string(statuses.size()),
                              orchestrator::FieldPrivacy::kPublic, true);
  orchestrator::EventBus::Instance().Publish(summary);
  return statuses;
}

}  // namespace nr::exec
