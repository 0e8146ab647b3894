#include "nr/exec/process_supervisor.h"
// TSK403_Process_Supervision fork/exec without a shell, one process group per job

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>
#include <system_error>
#include <thread>
#include <utility>

#include "nr/crypto/random.h"
#include "nr/error.h"
#include "nr/errors.h"
#include "nr/orchestrator/event_bus.h"

extern char** environ;

namespace nr::exec {

namespace {

using orchestrator::Event;
using orchestrator::EventBus;
using orchestrator::EventCategory;
using orchestrator::EventSeverity;
using orchestrator::FieldPrivacy;

constexpr std::string_view kSecretEnvPrefix{"NETREAPER_"};
constexpr size_t kReadChunkBytes = 8192;

class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
      reset(std::exchange(other.fd_, -1));
    }
    return *this;
  }

  int get() const noexcept { return fd_; }
  bool valid() const noexcept { return fd_ >= 0; }
  void reset(int fd = -1) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

 private:
  int fd_{-1};
};

struct Pipe {
  UniqueFd read;
  UniqueFd write;
};

[[noreturn]] void ThrowSpawnFailed(int err) {
  throw ExecutionError(ExecutionFailure::kSpawnFailed, std::string(errors::msg::kSpawnFailed), err);
}

Pipe MakePipe() {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    ThrowSpawnFailed(errno);
  }
  return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

void SetNonBlocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
    ThrowSpawnFailed(errno);
  }
}

// Only async-signal-safe calls from here until exec.
[[noreturn]] void ReportChildFailure(int status_fd, int err) noexcept {
  ssize_t ignored = ::write(status_fd, &err, sizeof(err));
  (void)ignored;
  ::_exit(127);
}

std::string ArgvDigest(const ExecutablePlan& plan) {
  std::string joined = plan.program();
  for (const auto& arg : plan.argv()) {
    joined.push_back('\0');
    joined.append(arg);
  }
  return crypto::SHA256_Hex(joined);
}

// Releases a concurrency slot unless the job takes ownership of it.
class SlotGuard {
 public:
  explicit SlotGuard(std::counting_semaphore<>& slots) : slots_(slots) {}
  ~SlotGuard() {
    if (!committed_) {
      slots_.release();
    }
  }
  void Commit() noexcept { committed_ = true; }

 private:
  std::counting_semaphore<>& slots_;
  bool committed_{false};
};

template <typename Fn, typename Arg>
void DeliverSafely(const Fn& fn, const Arg& arg, std::string_view job_id) {
  if (!fn) {
    return;
  }
  try {
    fn(arg);
  } catch (const std::exception& ex) {
    Event event;
    event.category = EventCategory::kDiagnostics;
    event.severity = EventSeverity::kError;
    event.event_id = "job_observer_failed";
    event.message = "Job observer threw";
    event.fields.emplace_back("job_id", std::string(job_id));
    event.fields.emplace_back("what", ex.what(), FieldPrivacy::kHash);
    EventBus::Instance().Publish(event);
  }
}

}  // namespace

std::string_view JobStateName(JobState state) noexcept {
  switch (state) {
  case JobState::kRunning:
    return "running";
  case JobState::kCancelling:
    return "cancelling";
  case JobState::kCompleted:
    return "completed";
  case JobState::kFailed:
    return "failed";
  }
  return "failed";
}

std::string_view OutputStreamName(OutputStream stream) noexcept {
  return stream == OutputStream::kStdout ? "stdout" : "stderr";
}

struct ProcessSupervisor::Job {
  JobId id;
  std::string program;
  size_t argument_count{0};
  pid_t pid{0};
  std::string owner;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::steady_clock::time_point started_steady{};
  std::chrono::milliseconds timeout{0};
  JobObserver observer;
  UniqueFd stdout_fd;
  UniqueFd stderr_fd;

  // Guarded by ProcessSupervisor::mutex_.
  JobState state{JobState::kRunning};
  bool cancel_requested{false};
  bool timed_out{false};
  bool leader_reaped{false};
  bool status_lost{false};
  bool group_gone{false};
  bool kill_sent{false};
  std::optional<std::chrono::steady_clock::time_point> term_sent_at;
  std::optional<int> exit_code;
  std::optional<int> signal;
  std::string reason;
  std::optional<std::chrono::system_clock::time_point> finished_at;
  std::string output_tail;
  size_t redacted_count{0};
};

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options)
    : options_(std::move(options)),
      slots_(static_cast<std::ptrdiff_t>(std::max<size_t>(options_.max_concurrent_jobs, 1))) {}

ProcessSupervisor::~ProcessSupervisor() {
  CancelAll();
  std::unique_lock<std::mutex> lock(mutex_);
  shutting_down_ = true;
  cv_.wait(lock, [this]() { return live_monitors_ == 0; });
}

bool ProcessSupervisor::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return live_monitors_ == 0; });
}

JobId ProcessSupervisor::Start(const ExecutablePlan& plan, JobObserver observer, StartOptions options) {
  if (!slots_.try_acquire()) {
    throw ExecutionError(ExecutionFailure::kConcurrencyLimit,
                         std::string(errors::msg::kConcurrencyLimit));
  }
  SlotGuard slot(slots_);

  // Everything the child needs is built before fork.
  std::vector<char*> argv;
  argv.reserve(plan.argv().size() + 2);
  argv.push_back(const_cast<char*>(plan.executable().c_str()));
  for (const auto& arg : plan.argv()) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  std::vector<char*> envp;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    if (std::string_view(*entry).starts_with(kSecretEnvPrefix)) {
      continue;
    }
    envp.push_back(*entry);
  }
  envp.push_back(nullptr);

  std::string cwd;
  if (plan.working_directory()) {
    cwd = plan.working_directory()->string();
  }

  const JobId id = "job-" + crypto::RandomHex(8);
  auto job = std::make_shared<Job>();

  Pipe out = MakePipe();
  Pipe err = MakePipe();
  Pipe status = MakePipe();
  SetNonBlocking(out.read.get());
  SetNonBlocking(err.read.get());

  const pid_t pid = ::fork();
  if (pid < 0) {
    ThrowSpawnFailed(errno);
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    sigset_t empty;
    ::sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
    ::signal(SIGPIPE, SIG_DFL);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull < 0) {
      ReportChildFailure(status.write.get(), errno);
    }
    if (::dup2(devnull, STDIN_FILENO) < 0 || ::dup2(out.write.get(), STDOUT_FILENO) < 0 ||
        ::dup2(err.write.get(), STDERR_FILENO) < 0) {
      ReportChildFailure(status.write.get(), errno);
    }
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      ReportChildFailure(status.write.get(), errno);
    }
    environ = envp.data();
    ::execvp(argv[0], argv.data());
    ReportChildFailure(status.write.get(), errno);
  }

  // Both sides set the group so no signal can race ahead of it. EACCES here
  // means the child already exec'd with the group in place.
  ::setpgid(pid, pid);
  out.write.reset();
  err.write.reset();
  status.write.reset();

  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(status.read.get(), &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  if (got != 0) {
    int wait_status = 0;
    while (::waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {
    }
    ThrowSpawnFailed(got > 0 ? child_errno : errno);
  }

  job->id = id;
  job->program = plan.program();
  job->argument_count = plan.argv().size();
  job->pid = pid;
  job->owner = std::move(options.owner);
  job->started_at = std::chrono::system_clock::now();
  job->started_steady = std::chrono::steady_clock::now();
  job->timeout = options.timeout;
  job->observer = std::move(observer);
  job->stdout_fd = std::move(out.read);
  job->stderr_fd = std::move(err.read);

  {
    std::lock_guard<std::mutex> guard(mutex_);
    jobs_.emplace(job->id, job);
    ++live_monitors_;
  }
  try {
    std::thread([this, job]() { Monitor(job); }).detach();
  } catch (const std::system_error& ex) {
    std::lock_guard<std::mutex> guard(mutex_);
    ::killpg(pid, SIGKILL);
    int wait_status = 0;
    while (::waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {
    }
    jobs_.erase(job->id);
    --live_monitors_;
    ThrowSpawnFailed(ex.code().value());
  }
  slot.Commit();

  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "job_started";
  event.message = "Job started";
  event.fields.emplace_back("job_id", job->id);
  event.fields.emplace_back("program", plan.program());
  event.fields.emplace_back("argc", std::to_string(plan.argv().size()), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("argv_digest", ArgvDigest(plan));
  event.fields.emplace_back("pgid", std::to_string(pid), FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(event);
  return job->id;
}

void ProcessSupervisor::SignalGroupLocked(Job& job, int signo) {
  if (job.group_gone) {
    return;
  }
  if (::killpg(job.pid, signo) != 0 && errno == ESRCH) {
    job.group_gone = true;
    return;
  }
  if (signo == SIGTERM && !job.term_sent_at) {
    job.term_sent_at = std::chrono::steady_clock::now();
  }
  if (signo == SIGKILL) {
    job.kill_sent = true;
  }
}

void ProcessSupervisor::Cancel(const JobId& id) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    if (evicted_.count(id) != 0) {
      return; // finished before its record aged out
    }
    throw ExecutionError(ExecutionFailure::kNotFound, std::string(errors::msg::kJobNotFound));
  }
  Job& job = *it->second;
  if (job.state != JobState::kRunning) {
    return;
  }
  job.state = JobState::kCancelling;
  job.cancel_requested = true;
  SignalGroupLocked(job, SIGTERM);
}

void ProcessSupervisor::CancelAll() {
  std::lock_guard<std::mutex> guard(mutex_);
  for (auto& [id, job] : jobs_) {
    if (job->state != JobState::kRunning) {
      continue;
    }
    job->state = JobState::kCancelling;
    job->cancel_requested = true;
    SignalGroupLocked(*job, SIGTERM);
  }
}

void ProcessSupervisor::AppendTail(Job& job, const security::SanitizedChunk& chunk) {
  job.redacted_count += chunk.redacted_count;
  job.output_tail.append(chunk.text);
  if (job.output_tail.size() > options_.output_tail_bytes) {
    job.output_tail.erase(0, job.output_tail.size() - options_.output_tail_bytes);
  }
}

void ProcessSupervisor::Monitor(std::shared_ptr<Job> job) {
  std::array<security::StreamingSanitizer, 2> sanitizers{
      security::StreamingSanitizer(options_.max_carry), security::StreamingSanitizer(options_.max_carry)};
  std::array<UniqueFd, 2> fds{std::move(job->stdout_fd), std::move(job->stderr_fd)};
  constexpr std::array<OutputStream, 2> kStreams{OutputStream::kStdout, OutputStream::kStderr};
  std::array<char, kReadChunkBytes> buffer{};
  int wait_status = 0;
  std::optional<std::chrono::steady_clock::time_point> drain_deadline;

  auto emit = [&](size_t index, security::SanitizedChunk chunk) {
    if (chunk.text.empty()) {
      return;
    }
    {
      std::lock_guard<std::mutex> guard(mutex_);
      AppendTail(*job, chunk);
    }
    DeliverSafely(job->observer.on_output, OutputEvent{job->id, kStreams[index], std::move(chunk)}, job->id);
  };
  auto close_stream = [&](size_t index) {
    emit(index, sanitizers[index].Flush());
    fds[index].reset();
  };

  while (true) {
    std::array<pollfd, 2> pfds{};
    std::array<size_t, 2> owner{};
    nfds_t count = 0;
    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].valid()) {
        pfds[count].fd = fds[i].get();
        pfds[count].events = POLLIN;
        owner[count] = i;
        ++count;
      }
    }
    const int wait_ms = static_cast<int>(options_.poll_interval.count());
    if (count > 0) {
      const int rc = ::poll(pfds.data(), count, wait_ms);
      if (rc < 0 && errno != EINTR) {
        for (size_t i = 0; i < fds.size(); ++i) {
          if (fds[i].valid()) {
            close_stream(i);
          }
        }
      }
      for (nfds_t p = 0; rc > 0 && p < count; ++p) {
        if ((pfds[p].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) == 0) {
          continue;
        }
        const size_t index = owner[p];
        const ssize_t n = ::read(fds[index].get(), buffer.data(), buffer.size());
        if (n > 0) {
          emit(index, sanitizers[index].Feed(std::string_view(buffer.data(), static_cast<size_t>(n))));
        } else if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
          close_stream(index);
        }
      }
    } else {
      std::this_thread::sleep_for(options_.poll_interval);
    }

    bool done = false;
    {
      std::lock_guard<std::mutex> guard(mutex_);
      const auto now = std::chrono::steady_clock::now();
      if (!job->leader_reaped) {
        int status = 0;
        const pid_t reaped = ::waitpid(job->pid, &status, WNOHANG);
        if (reaped == job->pid) {
          job->leader_reaped = true;
          wait_status = status;
        } else if (reaped < 0 && errno == ECHILD) {
          job->leader_reaped = true;
          job->status_lost = true;
        }
      }
      if (!job->leader_reaped && job->timeout.count() > 0 && !job->timed_out &&
          !job->cancel_requested && now - job->started_steady >= job->timeout) {
        job->timed_out = true;
        job->state = JobState::kCancelling;
        SignalGroupLocked(*job, SIGTERM);
      }
      if (!job->group_gone && ::killpg(job->pid, 0) != 0 && errno == ESRCH) {
        job->group_gone = true;
      }
      if (job->leader_reaped && !job->group_gone && !job->term_sent_at) {
        // Leader exited with descendants still in its group.
        SignalGroupLocked(*job, SIGTERM);
      }
      if (job->term_sent_at && !job->kill_sent && !job->group_gone &&
          now - *job->term_sent_at >= options_.cancel_grace) {
        SignalGroupLocked(*job, SIGKILL);
      }
      const bool streams_open = fds[0].valid() || fds[1].valid();
      if (job->leader_reaped && !job->group_gone && job->kill_sent && !streams_open &&
          now - *job->term_sent_at >= 2 * options_.cancel_grace) {
        // Killed orphans that nobody reaps still answer killpg(0).
        done = true;
      } else if (job->leader_reaped && job->group_gone) {
        if (!streams_open) {
          done = true;
        } else if (!drain_deadline) {
          // A process that left the group may still hold the pipes.
          drain_deadline = now + options_.cancel_grace;
        } else if (now >= *drain_deadline) {
          done = true;
        }
      }
    }
    if (done) {
      break;
    }
  }
  for (size_t i = 0; i < fds.size(); ++i) {
    if (fds[i].valid()) {
      close_stream(i);
    }
  }
  FinishJob(job, wait_status);
}

void ProcessSupervisor::FinishJob(const std::shared_ptr<Job>& job, int wait_status) {
  ExitEvent exit_event;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!job->status_lost) {
      if (WIFEXITED(wait_status)) {
        job->exit_code = WEXITSTATUS(wait_status);
      } else if (WIFSIGNALED(wait_status)) {
        job->signal = WTERMSIG(wait_status);
      }
    }
    if (job->timed_out) {
      job->state = JobState::kFailed;
      job->reason = "timed_out";
    } else if (job->cancel_requested) {
      job->state = JobState::kFailed;
      job->reason = "cancelled";
    } else if (job->exit_code) {
      job->state = JobState::kCompleted;
      job->reason = "exited";
    } else {
      job->state = JobState::kFailed;
      job->reason = "signaled";
    }
    job->finished_at = std::chrono::system_clock::now();
    finished_order_.push_back(job->id);
    while (finished_order_.size() > options_.history_limit) {
      jobs_.erase(finished_order_.front());
      evicted_.insert(finished_order_.front());
      evicted_order_.push_back(std::move(finished_order_.front()));
      finished_order_.pop_front();
    }
    while (evicted_order_.size() > options_.evicted_id_limit) {
      evicted_.erase(evicted_order_.front());
      evicted_order_.pop_front();
    }
    exit_event.job_id = job->id;
    exit_event.state = job->state;
    exit_event.exit_code = job->exit_code;
    exit_event.signal = job->signal;
    exit_event.reason = job->reason;
  }
  slots_.release();
  cv_.notify_all();

  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = exit_event.state == JobState::kCompleted ? EventSeverity::kInfo : EventSeverity::kWarning;
  event.event_id = "job_finished";
  event.message = "Job finished";
  event.fields.emplace_back("job_id", exit_event.job_id);
  event.fields.emplace_back("state", std::string(JobStateName(exit_event.state)));
  event.fields.emplace_back("reason", exit_event.reason);
  if (exit_event.exit_code) {
    event.fields.emplace_back("exit_code", std::to_string(*exit_event.exit_code), FieldPrivacy::kPublic, true);
  }
  if (exit_event.signal) {
    event.fields.emplace_back("signal", std::to_string(*exit_event.signal), FieldPrivacy::kPublic, true);
  }
  EventBus::Instance().Publish(event);

  DeliverSafely(job->observer.on_exit, exit_event, job->id);
  std::lock_guard<std::mutex> guard(mutex_);
  --live_monitors_;
  // Notified under the lock: the destructor may run as soon as it is released.
  cv_.notify_all();
}

JobRecord ProcessSupervisor::SnapshotLocked(const Job& job) const {
  JobRecord record;
  record.id = job.id;
  record.program = job.program;
  record.argument_count = job.argument_count;
  record.process_group = job.pid;
  record.owner = job.owner;
  record.started_at = job.started_at;
  record.finished_at = job.finished_at;
  record.state = job.state;
  record.exit_code = job.exit_code;
  record.signal = job.signal;
  record.reason = job.reason;
  record.output_tail = job.output_tail;
  record.redacted_count = job.redacted_count;
  return record;
}

JobRecord ProcessSupervisor::Await(const JobId& id, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    throw ExecutionError(ExecutionFailure::kNotFound, std::string(errors::msg::kJobNotFound));
  }
  std::shared_ptr<Job> job = it->second;
  cv_.wait_for(lock, timeout, [&job]() { return IsTerminal(job->state); });
  return SnapshotLocked(*job);
}

std::optional<JobRecord> ProcessSupervisor::Snapshot(const JobId& id) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return SnapshotLocked(*it->second);
}

std::vector<JobRecord> ProcessSupervisor::List() const {
  std::vector<JobRecord> records;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    records.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) {
      records.push_back(SnapshotLocked(*job));
    }
  }
  std::sort(records.begin(), records.end(),
            [](const JobRecord& a, const JobRecord& b) { return a.started_at < b.started_at; });
  return records;
}

size_t ProcessSupervisor::active_jobs() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return static_cast<size_t>(std::count_if(jobs_.begin(), jobs_.end(), [](const auto& entry) {
    return !IsTerminal(entry.second->state);
  }));
}

}  // namespace nr::exec
