#pragma once
// TSK403_Process_Supervision process-group lifecycle for validated plans

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "nr/exec/command_validator.h"
#include "nr/security/output_sanitizer.h"

namespace nr::exec {

using JobId = std::string;

enum class JobState : std::uint8_t { kRunning, kCancelling, kCompleted, kFailed };

enum class OutputStream : std::uint8_t { kStdout, kStderr };

std::string_view JobStateName(JobState state) noexcept;
std::string_view OutputStreamName(OutputStream stream) noexcept;
inline bool IsTerminal(JobState state) noexcept {
  return state == JobState::kCompleted || state == JobState::kFailed;
}

struct OutputEvent {
  JobId job_id;
  OutputStream stream{OutputStream::kStdout};
  security::SanitizedChunk chunk;
};

struct ExitEvent {
  JobId job_id;
  JobState state{JobState::kFailed};
  std::optional<int> exit_code;
  std::optional<int> signal;
  std::string reason; // exited, signaled, cancelled, timed_out
};

// Delivered from the job's monitor thread. Output for one stream arrives in
// order; on_exit is the last call made for a job.
struct JobObserver {
  std::function<void(const OutputEvent&)> on_output;
  std::function<void(const ExitEvent&)> on_exit;
};

struct StartOptions {
  std::chrono::milliseconds timeout{0}; // zero disables the wall-clock limit
  std::string owner;                    // opaque tag, reported back in JobRecord
};

struct SupervisorOptions {
  size_t max_concurrent_jobs{8};
  std::chrono::milliseconds cancel_grace{3000};
  size_t history_limit{128};
  size_t evicted_id_limit{4096}; // ids of jobs dropped from history that Cancel still accepts
  size_t output_tail_bytes{16 * 1024};
  size_t max_carry{security::StreamingSanitizer::kDefaultMaxCarry};
  std::chrono::milliseconds poll_interval{50};
};

// Immutable view of a job handed to callers.
struct JobRecord {
  JobId id;
  std::string program;
  size_t argument_count{0};
  pid_t process_group{0};
  std::string owner;
  std::chrono::system_clock::time_point started_at{};
  std::optional<std::chrono::system_clock::time_point> finished_at;
  JobState state{JobState::kRunning};
  std::optional<int> exit_code;
  std::optional<int> signal;
  std::string reason;
  std::string output_tail; // sanitized
  size_t redacted_count{0};
};

class ProcessSupervisor {
 public:
  explicit ProcessSupervisor(SupervisorOptions options = {});
  ~ProcessSupervisor();

  ProcessSupervisor(const ProcessSupervisor&) = delete;
  ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

  // Throws ExecutionError{kSpawnFailed, kConcurrencyLimit}.
  JobId Start(const ExecutablePlan& plan, JobObserver observer, StartOptions options = {});

  // SIGTERM to the job's group now, SIGKILL after the grace period. A no-op
  // for jobs already cancelling or finished, including finished jobs evicted
  // from history. Throws ExecutionError{kNotFound} for ids never issued here.
  void Cancel(const JobId& id);

  // Blocks until the job is terminal or `timeout` passes and returns the
  // latest snapshot either way. Throws ExecutionError{kNotFound}.
  JobRecord Await(const JobId& id, std::chrono::milliseconds timeout);

  std::optional<JobRecord> Snapshot(const JobId& id) const;
  std::vector<JobRecord> List() const;

  void CancelAll();
  // True once no monitor thread is left, so observers will not be called
  // again. The destructor waits for the same condition without a limit.
  bool WaitIdle(std::chrono::milliseconds timeout);
  size_t active_jobs() const;

 private:
  struct Job;

  void Monitor(std::shared_ptr<Job> job);
  void SignalGroupLocked(Job& job, int signo);
  void FinishJob(const std::shared_ptr<Job>& job, int wait_status);
  void AppendTail(Job& job, const security::SanitizedChunk& chunk);
  JobRecord SnapshotLocked(const Job& job) const;

  SupervisorOptions options_;
  std::counting_semaphore<> slots_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<JobId, std::shared_ptr<Job>> jobs_;
  std::deque<JobId> finished_order_;
  std::deque<JobId> evicted_order_;
  std::unordered_set<JobId> evicted_;
  size_t live_monitors_{0};
  bool shutting_down_{false};
};

}  // namespace nr::exec
