#include "nr/transport/transport_session.h"

#include <algorithm>

#include "nr/error.h"
#include "nr/errors.h"
#include "nr/orchestrator/event_bus.h"
#include "nr/security/zeroizer.h"
#include "nr/transport/protocol.h"

using namespace nr::orchestrator;

namespace nr::transport {

namespace {

constexpr size_t kOwnedJobHistory = 32;

void PublishSessionEvent(std::string_view event_id, EventSeverity severity,
                         std::string_view message, const PeerInfo& peer,
                         std::string_view reason = {}) {
  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = severity;
  event.event_id = std::string(event_id);
  event.message = std::string(message);
  event.fields.emplace_back("peer", peer.address, FieldPrivacy::kHash);
  event.fields.emplace_back("loopback", peer.loopback ? "true" : "false");
  if (!reason.empty()) {
    event.fields.emplace_back("reason", std::string(reason));
  }
  EventBus::Instance().Publish(event);
}

}  // namespace

std::string_view SessionStateName(SessionState state) noexcept {
  switch (state) {
  case SessionState::kConnecting:
    return "connecting";
  case SessionState::kAuthenticating:
    return "authenticating";
  case SessionState::kReady:
    return "ready";
  case SessionState::kExecuting:
    return "executing";
  case SessionState::kClosed:
    return "closed";
  }
  return "closed";
}

TransportSession::TransportSession(SessionContext context, PeerInfo peer,
                                   std::shared_ptr<Outbound> outbound,
                                   orchestrator::IdleLock::NowFn now)
    : context_(std::move(context)),
      peer_(std::move(peer)),
      outbound_(std::move(outbound)),
      idle_(std::move(now)) {
  idle_.on_expire = [this]() {
    SendError("idle_timeout", errors::msg::kIdleTimeout);
    Close("idle_timeout");
  };
}

TransportSession::~TransportSession() { Close("session_released"); }

void TransportSession::Open() {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (state_ != SessionState::kConnecting) {
      return;
    }
  }
  // Without a configured secret the signing key is ephemeral and nothing off
  // this host may talk to the gateway.
  if (context_.local_only && !peer_.loopback) {
    PublishSessionEvent("session_rejected", EventSeverity::kWarning,
                        "Remote peer rejected in local-only mode", peer_, "local_only");
    SendError(ReasonCode(AuthFailure::kLocalOnly), errors::msg::kLocalOnly);
    Close("local_only");
    return;
  }
  PublishSessionEvent("session_opened", EventSeverity::kInfo, "Session opened", peer_);
  idle_.Arm(context_.idle_timeout);
  if (peer_.bearer_token) {
    std::string token = std::move(*peer_.bearer_token);
    peer_.bearer_token.reset();
    HandleAuth(nullptr, &token);
  }
}

void TransportSession::HandleMessage(std::string_view text) {
  if (state() == SessionState::kClosed) {
    return;
  }
  idle_.NotifyActivity();

  ClientMessage message;
  try {
    message = ParseClientMessage(text);
  } catch (const TransportError& ex) {
    SendError(TransportReasonCode(ex.code), ex.what());
    Close(TransportReasonCode(ex.code));
    return;
  }

  switch (message.type) {
  case ClientMessageType::kAuth:
    HandleAuth(message.password ? &*message.password : nullptr,
               message.token ? &*message.token : nullptr);
    if (message.password) {
      security::Zeroizer::WipeString(*message.password);
    }
    break;
  case ClientMessageType::kCommand: {
    exec::CommandRequest request;
    request.raw_text = std::move(message.command);
    request.argv = std::move(message.argv);
    request.working_directory = std::move(message.cwd);
    HandleCommand(std::move(request));
    break;
  }
  case ClientMessageType::kCancel:
    HandleCancel(message.job_id);
    break;
  case ClientMessageType::kStatus:
    HandleStatus();
    break;
  }
}

void TransportSession::HandleAuth(const std::string* password, const std::string* token) {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (state_ == SessionState::kConnecting) {
      state_ = SessionState::kAuthenticating;
    }
    if (state_ != SessionState::kAuthenticating) {
      outbound_->Send(ErrorMessage(TransportReasonCode(errors::transport::kUnexpectedMessage),
                                   errors::msg::kUnexpectedMessage));
      return;
    }
  }

  auth::Identity identity;
  std::string reply;
  try {
    if (password) {
      auto issued = context_.auth->IssueToken(peer_.address, *password);
      reply = AuthResultMessage(issued.identity, &issued.token);
      identity = std::move(issued.identity);
      security::Zeroizer::WipeString(issued.token);
    } else {
      identity = context_.auth->AuthenticateToken(peer_.address, *token);
      reply = AuthResultMessage(identity, nullptr);
    }
  } catch (const AuthError& ex) {
    std::optional<std::int64_t> retry_after;
    if (ex.reason == AuthFailure::kRateLimited) {
      retry_after = ex.retry_after_seconds;
    }
    outbound_->Send(AuthFailureMessage(ReasonCode(ex.reason), retry_after));
    return;
  }

  std::lock_guard<std::mutex> guard(mutex_);
  if (state_ != SessionState::kAuthenticating) {
    return;
  }
  identity_ = std::move(identity);
  state_ = SessionState::kReady;
  outbound_->Send(std::move(reply));
}

void TransportSession::HandleCommand(exec::CommandRequest request) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (state_ != SessionState::kReady && state_ != SessionState::kExecuting) {
    outbound_->Send(ErrorMessage(TransportReasonCode(errors::transport::kUnexpectedMessage),
                                 errors::msg::kUnexpectedMessage));
    return;
  }
  if (active_jobs_.size() >= context_.max_jobs_per_session) {
    outbound_->Send(ErrorMessage(ReasonCode(ExecutionFailure::kSessionBusy),
                                 errors::msg::kSessionBusy));
    return;
  }

  try {
    const auto plan = context_.validator->Validate(request);

    std::weak_ptr<TransportSession> weak = weak_from_this();
    exec::JobObserver observer;
    observer.on_output = [weak](const exec::OutputEvent& event) {
      if (auto self = weak.lock()) {
        self->OnJobOutput(event);
      }
    };
    observer.on_exit = [weak](const exec::ExitEvent& event) {
      if (auto self = weak.lock()) {
        self->OnJobExit(event);
      }
    };
    exec::StartOptions options;
    options.timeout = context_.job_timeout;
    options.owner = identity_ ? identity_->subject : std::string();

    // The lock is still held, so no output for this job can be relayed
    // before jobStarted.
    const auto id = context_.supervisor->Start(plan, std::move(observer), options);
    active_jobs_.insert(id);
    RememberJobLocked(id);
    state_ = SessionState::kExecuting;
    outbound_->Send(JobStartedMessage(id, plan.program()));
  } catch (const ValidationError& ex) {
    Event event;
    event.category = EventCategory::kSecurity;
    event.severity = EventSeverity::kWarning;
    event.event_id = "command_rejected";
    event.message = "Command rejected by validator";
    event.fields.emplace_back("peer", peer_.address, FieldPrivacy::kHash);
    event.fields.emplace_back("reason", std::string(ReasonCode(ex.reason)));
    EventBus::Instance().Publish(event);
    outbound_->Send(ErrorMessage(ReasonCode(ex.reason), ex.what()));
  } catch (const ExecutionError& ex) {
    outbound_->Send(ErrorMessage(ReasonCode(ex.reason), ex.what()));
  }
}

void TransportSession::HandleCancel(const std::optional<std::string>& job_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (state_ != SessionState::kReady && state_ != SessionState::kExecuting) {
    outbound_->Send(ErrorMessage(TransportReasonCode(errors::transport::kUnexpectedMessage),
                                 errors::msg::kUnexpectedMessage));
    return;
  }
  std::vector<exec::JobId> targets;
  if (job_id) {
    if (std::find(owned_jobs_.begin(), owned_jobs_.end(), *job_id) == owned_jobs_.end()) {
      // Other sessions' jobs are indistinguishable from unknown ones.
      outbound_->Send(ErrorMessage(ReasonCode(ExecutionFailure::kNotFound),
                                   errors::msg::kJobNotFound));
      return;
    }
    targets.push_back(*job_id);
  } else {
    targets.assign(active_jobs_.begin(), active_jobs_.end());
  }
  for (const auto& id : targets) {
    try {
      context_.supervisor->Cancel(id);
    } catch (const ExecutionError& ex) {
      outbound_->Send(ErrorMessage(ReasonCode(ex.reason), ex.what()));
    }
    // The exit result still arrives; the job just stops counting against
    // this session.
    active_jobs_.erase(id);
  }
  if (active_jobs_.empty() && state_ == SessionState::kExecuting) {
    state_ = SessionState::kReady;
  }
}

void TransportSession::HandleStatus() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (state_ != SessionState::kReady && state_ != SessionState::kExecuting) {
    outbound_->Send(ErrorMessage(TransportReasonCode(errors::transport::kUnexpectedMessage),
                                 errors::msg::kUnexpectedMessage));
    return;
  }
  std::vector<exec::JobRecord> records;
  for (const auto& id : owned_jobs_) {
    if (auto record = context_.supervisor->Snapshot(id)) {
      records.push_back(std::move(*record));
    }
  }
  outbound_->Send(StatusMessage(SessionStateName(state_), records));
}

void TransportSession::OnJobOutput(const exec::OutputEvent& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (state_ == SessionState::kClosed) {
    return;
  }
  outbound_->Send(OutputChunkMessage(event));
}

void TransportSession::OnJobExit(const exec::ExitEvent& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (state_ == SessionState::kClosed) {
    return;
  }
  active_jobs_.erase(event.job_id);
  if (active_jobs_.empty() && state_ == SessionState::kExecuting) {
    state_ = SessionState::kReady;
  }
  outbound_->Send(ExitResultMessage(event));
}

void TransportSession::Tick() {
  bool busy = false;
  bool token_expired = false;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (state_ == SessionState::kClosed) {
      return;
    }
    busy = !active_jobs_.empty();
    token_expired = identity_ && context_.auth->NowSeconds() > identity_->expires_at;
  }
  if (token_expired) {
    SendError(ReasonCode(AuthFailure::kExpired), errors::msg::kTokenExpired);
    Close("token_expired");
    return;
  }
  // A streaming job keeps the session alive even when the client is quiet.
  if (busy) {
    idle_.NotifyActivity();
  }
  idle_.Tick();
}

void TransportSession::Close(std::string_view reason) {
  std::deque<exec::JobId> owned;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (state_ == SessionState::kClosed) {
      return;
    }
    state_ = SessionState::kClosed;
    owned = owned_jobs_;
    active_jobs_.clear();
    identity_.reset();
  }
  idle_.Disarm();
  for (const auto& id : owned) {
    try {
      context_.supervisor->Cancel(id);
    } catch (const ExecutionError&) {
      // Finished long enough ago that the supervisor forgot the id.
    }
  }
  PublishSessionEvent("session_closed", EventSeverity::kInfo, "Session closed", peer_, reason);
  outbound_->Close(reason);
}

SessionState TransportSession::state() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return state_;
}

size_t TransportSession::active_jobs() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return active_jobs_.size();
}

void TransportSession::SendError(std::string_view reason, std::string_view message) {
  outbound_->Send(ErrorMessage(reason, message));
}

void TransportSession::RememberJobLocked(const exec::JobId& id) {
  owned_jobs_.push_back(id);
  while (owned_jobs_.size() > kOwnedJobHistory) {
    owned_jobs_.pop_front();
  }
}

}  // namespace nr::transport
