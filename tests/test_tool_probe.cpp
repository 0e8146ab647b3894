#include "nr/exec/allowlist.h"
#include "nr/exec/tool_probe.h"
#include "nr/orchestrator/event_bus.h"

#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main() {
  using nr::exec::Allowlist;
  using nr::exec::AllowlistEntry;
  using nr::exec::ProbeTools;
  using nr::exec::ResolveExecutable;

  std::vector<std::string> events;
  auto& bus = nr::orchestrator::EventBus::Instance();
  bus.ClearSubscribers();
  bus.Subscribe([&events](const nr::orchestrator::Event& event) { events.push_back(event.event_id); });

  const auto dir = fs::temp_directory_path() / ("nrgate_probe_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir / "bin");
  fs::create_directories(dir / "other");
  {
    std::ofstream(dir / "bin" / "fakescan") << "#!/bin/sh\n";
    std::ofstream(dir / "other" / "notexec") << "data\n";
  }
  fs::permissions(dir / "bin" / "fakescan", fs::perms::owner_all);
  fs::permissions(dir / "other" / "notexec", fs::perms::owner_read | fs::perms::owner_write);

  const std::string search = (dir / "other").string() + "::" + (dir / "bin").string();
  assert(ResolveExecutable("fakescan", search) == dir / "bin" / "fakescan");
  assert(!ResolveExecutable("notexec", search));
  assert(!ResolveExecutable("missing", search));
  assert(!ResolveExecutable("", search));
  assert(ResolveExecutable((dir / "bin" / "fakescan").string(), "") == dir / "bin" / "fakescan");
  assert(!ResolveExecutable((dir / "bin").string(), search)); // directories are not tools

  Allowlist allowlist(std::vector<AllowlistEntry>{
      AllowlistEntry{"fakescan", "", {}},
      AllowlistEntry{"absent", "", {}},
  });
  const auto statuses = ProbeTools(allowlist, search);
  assert(statuses.size() == 2);
  assert(statuses[0].id == "fakescan" && statuses[0].available());
  assert(statuses[1].id == "absent" && !statuses[1].available());
  assert((events == std::vector<std::string>{"tool_available", "tool_missing", "tool_probe_complete"}));

  fs::remove_all(dir);
  std::cout << "tool probe ok\n";
  return 0;
}
