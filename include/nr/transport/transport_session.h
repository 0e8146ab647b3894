#pragma once
// TSK406_Gateway_Protocol per-connection state machine

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "nr/auth/auth_gate.h"
#include "nr/exec/command_validator.h"
#include "nr/exec/process_supervisor.h"
#include "nr/orchestrator/idle_lock.h"

namespace nr::transport {

enum class SessionState : std::uint8_t { kConnecting, kAuthenticating, kReady, kExecuting, kClosed };

std::string_view SessionStateName(SessionState state) noexcept;

// Where a session writes. Implementations must accept calls from any thread;
// the websocket server queues them onto the connection's strand.
class Outbound {
 public:
  virtual ~Outbound() = default;
  virtual void Send(std::string message) = 0;
  virtual void Close(std::string_view reason) = 0;
};

// Shared by every session of one server. Only the supervisor and the auth
// gate carry mutable state, and both are internally synchronized.
struct SessionContext {
  std::shared_ptr<auth::AuthGate> auth;
  std::shared_ptr<const exec::CommandValidator> validator;
  std::shared_ptr<exec::ProcessSupervisor> supervisor;
  bool local_only{true};
  std::chrono::seconds idle_timeout{900};
  std::chrono::seconds job_timeout{0};
  size_t max_jobs_per_session{1};
};

struct PeerInfo {
  std::string address; // also the rate limiter key
  bool loopback{false};
  std::optional<std::string> bearer_token; // from the upgrade request
};

class TransportSession : public std::enable_shared_from_this<TransportSession> {
 public:
  TransportSession(SessionContext context, PeerInfo peer, std::shared_ptr<Outbound> outbound,
                   orchestrator::IdleLock::NowFn now = {});
  ~TransportSession();

  TransportSession(const TransportSession&) = delete;
  TransportSession& operator=(const TransportSession&) = delete;

  // Applies the local-only policy and any upgrade-header token. Must be called
  // once, after the session is owned by a shared_ptr.
  void Open();
  // One client frame. Calls for one session must not overlap.
  void HandleMessage(std::string_view text);
  // Periodic housekeeping: idle expiry and token expiry.
  void Tick();
  // Idempotent. Cancels every job the session still owns.
  void Close(std::string_view reason);

  SessionState state() const;
  size_t active_jobs() const;
  const PeerInfo& peer() const noexcept { return peer_; }

 private:
  void HandleAuth(const std::string* password, const std::string* token);
  void HandleCommand(exec::CommandRequest request);
  void HandleCancel(const std::optional<std::string>& job_id);
  void HandleStatus();
  void OnJobOutput(const exec::OutputEvent& event);
  void OnJobExit(const exec::ExitEvent& event);
  void SendError(std::string_view reason, std::string_view message);
  void RememberJobLocked(const exec::JobId& id);

  SessionContext context_;
  PeerInfo peer_;
  std::shared_ptr<Outbound> outbound_;
  orchestrator::IdleLock idle_;

  mutable std::mutex mutex_;
  SessionState state_{SessionState::kConnecting};
  std::optional<auth::Identity> identity_;
  std::set<exec::JobId> active_jobs_;
  std::deque<exec::JobId> owned_jobs_; // bounded, newest last
};

}  // namespace nr::transport
