#include "nr/error.h"
#include "nr/exec/allowlist.h"
#include "nr/exec/command_validator.h"
#include "nr/exec/process_supervisor.h" // TSK403_Process_Supervision
#include "nr/orchestrator/event_bus.h"

#include <signal.h>
#include <stdlib.h>
#include <unistd.h>

#include <cassert>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

using namespace std::chrono_literals;
using nr::exec::Allowlist;
using nr::exec::AllowlistEntry;
using nr::exec::CommandRequest;
using nr::exec::CommandValidator;
using nr::exec::ExitEvent;
using nr::exec::JobObserver;
using nr::exec::JobState;
using nr::exec::OutputEvent;
using nr::exec::OutputStream;
using nr::exec::ProcessSupervisor;
using nr::exec::StartOptions;
using nr::exec::SupervisorOptions;
using nr::exec::ValidatorLimits;

class ScriptDir {
public:
  ScriptDir() {
    path_ = fs::temp_directory_path() / ("nrgate_supervisor_" + std::to_string(::getpid()));
    fs::remove_all(path_);
    fs::create_directories(path_);
    path_ = fs::canonical(path_);
  }
  ~ScriptDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  std::string Write(const std::string& name, const std::string& body) {
    const auto file = path_ / name;
    {
      std::ofstream out(file);
      out << "#!/bin/sh\n" << body;
    }
    fs::permissions(file, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    return file.string();
  }

  const fs::path& path() const noexcept { return path_; }

private:
  fs::path path_;
};

// Collects observer callbacks from the monitor thread.
struct Recorder {
  std::mutex mutex;
  std::condition_variable cv;
  std::string stdout_text;
  std::string stderr_text;
  size_t redacted{0};
  std::vector<ExitEvent> exits;
  bool output_after_exit{false};

  JobObserver Observer() {
    JobObserver observer;
    observer.on_output = [this](const OutputEvent& event) {
      std::lock_guard<std::mutex> guard(mutex);
      if (!exits.empty()) {
        output_after_exit = true;
      }
      (event.stream == OutputStream::kStdout ? stdout_text : stderr_text) += event.chunk.text;
      redacted += event.chunk.redacted_count;
    };
    observer.on_exit = [this](const ExitEvent& event) {
      std::lock_guard<std::mutex> guard(mutex);
      exits.push_back(event);
      cv.notify_all();
    };
    return observer;
  }

  ExitEvent WaitExit(std::chrono::milliseconds limit = 10s) {
    std::unique_lock<std::mutex> lock(mutex);
    const bool done = cv.wait_for(lock, limit, [this]() { return !exits.empty(); });
    assert(done);
    return exits.front();
  }
};

struct Fixture {
  ScriptDir dir;
  std::unique_ptr<CommandValidator> validator;

  Fixture() {
    std::vector<AllowlistEntry> entries;
    entries.push_back({"talk", dir.Write("talk.sh",
                                         "echo \"login password=hunter2 ok\"\n"
                                         "echo to-stderr >&2\n"
                                         "exit 3\n"),
                       {}});
    entries.push_back({"sleeper", dir.Write("sleeper.sh", "sleep 30\n"), {}});
    entries.push_back({"stubborn", dir.Write("stubborn.sh", "trap '' TERM\nsleep 30\n"), {}});
    entries.push_back({"spawner", dir.Write("spawner.sh", "sleep 30 &\necho started\nexit 0\n"), {}});
    entries.push_back({"showenv", dir.Write("showenv.sh", "env\n"), {}});
    entries.push_back({"where", dir.Write("where.sh", "pwd\n"), {}});
    entries.push_back({"args", dir.Write("args.sh", "for a in \"$@\"; do echo \"[$a]\"; done\n"), {}});
    entries.push_back({"missing", "/nonexistent/nrgate-missing-tool", {}});
    validator = std::make_unique<CommandValidator>(Allowlist(std::move(entries)), ValidatorLimits{});
  }

  nr::exec::ExecutablePlan Plan(std::vector<std::string> argv) const {
    CommandRequest request;
    request.argv = std::move(argv);
    return validator->Validate(request);
  }
};

void TestOutputIsSanitizedAndOrdered(Fixture& fx) {
  ProcessSupervisor supervisor;
  Recorder recorder;
  const auto id = supervisor.Start(fx.Plan({"talk"}), recorder.Observer(), StartOptions{0ms, "session-a"});
  assert(id.rfind("job-", 0) == 0);

  const auto result = recorder.WaitExit();
  assert(result.job_id == id);
  assert(result.state == JobState::kCompleted);
  assert(result.exit_code == 3);
  assert(!result.signal.has_value());
  assert(result.reason == "exited");

  std::lock_guard<std::mutex> guard(recorder.mutex);
  assert(recorder.stdout_text == "login password=***REDACTED*** ok\n");
  assert(recorder.stderr_text == "to-stderr\n");
  assert(recorder.redacted == 1);
  assert(!recorder.output_after_exit);

  auto record = supervisor.Snapshot(id);
  assert(record.has_value());
  assert(record->owner == "session-a");
  assert(record->program == "talk");
  assert(record->output_tail.find("hunter2") == std::string::npos);
  assert(record->finished_at.has_value());
}

void TestArgumentsPassVerbatim(Fixture& fx) {
  ProcessSupervisor supervisor;
  Recorder recorder;
  supervisor.Start(fx.Plan({"args", "a b", "*", "'q'"}), recorder.Observer());
  recorder.WaitExit();
  std::lock_guard<std::mutex> guard(recorder.mutex);
  assert(recorder.stdout_text == "[a b]\n[*]\n['q']\n");
}

SupervisorOptions QuickGrace() {
  SupervisorOptions options;
  options.cancel_grace = 300ms;
  return options;
}

void TestCancelTwice(Fixture& fx) {
  ProcessSupervisor supervisor(QuickGrace());
  Recorder recorder;
  const auto id = supervisor.Start(fx.Plan({"sleeper"}), recorder.Observer());
  supervisor.Cancel(id);
  supervisor.Cancel(id); // no-op while cancelling
  const auto result = recorder.WaitExit();
  assert(result.state == JobState::kFailed);
  assert(result.reason == "cancelled");
  assert(result.signal == SIGTERM);
  supervisor.Cancel(id); // no-op once finished

  bool threw = false;
  try {
    supervisor.Cancel("job-unknown");
  } catch (const nr::ExecutionError& err) {
    threw = err.reason == nr::ExecutionFailure::kNotFound;
  }
  assert(threw);
}

void TestCancelEscalatesToKill(Fixture& fx) {
  SupervisorOptions options;
  options.cancel_grace = 200ms;
  ProcessSupervisor supervisor(options);
  Recorder recorder;
  const auto id = supervisor.Start(fx.Plan({"stubborn"}), recorder.Observer());
  std::this_thread::sleep_for(300ms); // let the trap install
  supervisor.Cancel(id);
  const auto result = recorder.WaitExit();
  assert(result.reason == "cancelled");
  assert(result.signal == SIGKILL);
}

void TestTimeout(Fixture& fx) {
  ProcessSupervisor supervisor(QuickGrace());
  Recorder recorder;
  const auto started = std::chrono::steady_clock::now();
  const auto id = supervisor.Start(fx.Plan({"sleeper"}), recorder.Observer(), StartOptions{200ms, {}});
  const auto result = recorder.WaitExit();
  assert(result.job_id == id);
  assert(result.state == JobState::kFailed);
  assert(result.reason == "timed_out");
  assert(std::chrono::steady_clock::now() - started < 10s);
}

void TestLeftoverGroupMembersAreKilled(Fixture& fx) {
  SupervisorOptions options;
  options.cancel_grace = 300ms;
  ProcessSupervisor supervisor(options);
  Recorder recorder;
  const auto started = std::chrono::steady_clock::now();
  supervisor.Start(fx.Plan({"spawner"}), recorder.Observer());
  const auto result = recorder.WaitExit();
  // The background sleep held the pipes; only a group signal ends it early.
  assert(std::chrono::steady_clock::now() - started < 10s);
  assert(result.exit_code == 0);
  std::lock_guard<std::mutex> guard(recorder.mutex);
  assert(recorder.stdout_text == "started\n");
}

void TestSpawnFailure(Fixture& fx) {
  ProcessSupervisor supervisor;
  Recorder recorder;
  bool threw = false;
  try {
    supervisor.Start(fx.Plan({"missing"}), recorder.Observer());
  } catch (const nr::ExecutionError& err) {
    threw = err.reason == nr::ExecutionFailure::kSpawnFailed;
    assert(err.native_code == ENOENT);
  }
  assert(threw);
  assert(supervisor.active_jobs() == 0);
  // The slot was returned.
  supervisor.Start(fx.Plan({"talk"}), recorder.Observer());
  recorder.WaitExit();
}

void TestConcurrencyLimit(Fixture& fx) {
  SupervisorOptions options = QuickGrace();
  options.max_concurrent_jobs = 1;
  ProcessSupervisor supervisor(options);
  Recorder first;
  const auto id = supervisor.Start(fx.Plan({"sleeper"}), first.Observer());
  assert(supervisor.active_jobs() == 1);

  Recorder second;
  bool threw = false;
  try {
    supervisor.Start(fx.Plan({"talk"}), second.Observer());
  } catch (const nr::ExecutionError& err) {
    threw = err.reason == nr::ExecutionFailure::kConcurrencyLimit;
    assert(err.retryability == nr::Retryability::kRetryable);
  }
  assert(threw);

  supervisor.Cancel(id);
  first.WaitExit();
  assert(supervisor.WaitIdle(5s));
  supervisor.Start(fx.Plan({"talk"}), second.Observer());
  second.WaitExit();
}

void TestGatewaySecretsAreNotInherited(Fixture& fx) {
  ::setenv("NETREAPER_SECRET", "do-not-leak-this-value", 1);
  ProcessSupervisor supervisor;
  Recorder recorder;
  supervisor.Start(fx.Plan({"showenv"}), recorder.Observer());
  recorder.WaitExit();
  ::unsetenv("NETREAPER_SECRET");
  std::lock_guard<std::mutex> guard(recorder.mutex);
  assert(recorder.stdout_text.find("do-not-leak-this-value") == std::string::npos);
  assert(recorder.stdout_text.find("NETREAPER_") == std::string::npos);
}

void TestWorkingDirectory(Fixture& fx) {
  ValidatorLimits limits;
  limits.working_directory_roots = {fx.dir.path()};
  CommandValidator rooted(fx.validator->allowlist(), limits);
  CommandRequest request;
  request.argv = std::vector<std::string>{"where"};

  ProcessSupervisor supervisor;
  Recorder recorder;
  supervisor.Start(rooted.Validate(request), recorder.Observer());
  recorder.WaitExit();
  std::lock_guard<std::mutex> guard(recorder.mutex);
  assert(recorder.stdout_text == fx.dir.path().string() + "\n");
}

void TestAwaitAndList(Fixture& fx) {
  ProcessSupervisor supervisor(QuickGrace());
  const auto a = supervisor.Start(fx.Plan({"talk"}), JobObserver{});
  const auto b = supervisor.Start(fx.Plan({"sleeper"}), JobObserver{});

  auto done = supervisor.Await(a, 10s);
  assert(done.state == JobState::kCompleted);
  auto pending = supervisor.Await(b, 50ms);
  assert(pending.state == JobState::kRunning);

  const auto records = supervisor.List();
  assert(records.size() == 2);
  assert(records.front().id == a);

  supervisor.CancelAll();
  auto cancelled = supervisor.Await(b, 10s);
  assert(cancelled.reason == "cancelled");
  assert(supervisor.active_jobs() == 0);
}

void TestCancelAfterHistoryEviction(Fixture& fx) {
  SupervisorOptions options = QuickGrace();
  options.history_limit = 2;
  ProcessSupervisor supervisor(options);
  std::vector<nr::exec::JobId> ids;
  for (int i = 0; i < 3; ++i) {
    ids.push_back(supervisor.Start(fx.Plan({"talk"}), JobObserver{}));
    assert(nr::exec::IsTerminal(supervisor.Await(ids.back(), 10s).state));
  }
  assert(!supervisor.Snapshot(ids.front()));
  assert(supervisor.List().size() == 2);
  supervisor.Cancel(ids.front()); // finished long ago, still a no-op

  bool threw = false;
  try {
    supervisor.Cancel("job-0000000000000000");
  } catch (const nr::ExecutionError& err) {
    threw = err.reason == nr::ExecutionFailure::kNotFound;
  }
  assert(threw);
}

// Shutdown relies on WaitIdle giving up while a monitor is stuck.
void TestWaitIdleIsBoundedWhileObserverBlocks(Fixture& fx) {
  ProcessSupervisor supervisor(QuickGrace());
  std::mutex mutex;
  std::condition_variable cv;
  bool entered = false;
  bool release = false;
  JobObserver observer;
  observer.on_exit = [&](const ExitEvent&) {
    std::unique_lock<std::mutex> lock(mutex);
    entered = true;
    cv.notify_all();
    cv.wait(lock, [&]() { return release; });
  };
  supervisor.Start(fx.Plan({"sleeper"}), observer);
  supervisor.CancelAll();
  {
    std::unique_lock<std::mutex> lock(mutex);
    const bool stuck = cv.wait_for(lock, 10s, [&]() { return entered; });
    assert(stuck);
  }

  const auto begin = std::chrono::steady_clock::now();
  assert(!supervisor.WaitIdle(200ms));
  assert(std::chrono::steady_clock::now() - begin < 5s);

  {
    std::lock_guard<std::mutex> guard(mutex);
    release = true;
  }
  cv.notify_all();
  assert(supervisor.WaitIdle(10s));
}

}  // namespace

int main() {
  ::signal(SIGPIPE, SIG_IGN);
  nr::orchestrator::EventBus::Instance().ClearSubscribers();
  Fixture fx;
  TestOutputIsSanitizedAndOrdered(fx);
  TestArgumentsPassVerbatim(fx);
  TestCancelTwice(fx);
  TestCancelEscalatesToKill(fx);
  TestTimeout(fx);
  TestLeftoverGroupMembersAreKilled(fx);
  TestSpawnFailure(fx);
  TestConcurrencyLimit(fx);
  TestGatewaySecretsAreNotInherited(fx);
  TestWorkingDirectory(fx);
  TestAwaitAndList(fx);
  TestCancelAfterHistoryEviction(fx);
  TestWaitIdleIsBoundedWhileObserverBlocks(fx);
  std::cout << "process supervisor ok\n";
  return 0;
}
