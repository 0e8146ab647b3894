#include "nr/auth/auth_gate.h"

#include <algorithm>

#include "nr/crypto/ct.h"
#include "nr/crypto/random.h"
#include "nr/error.h"
#include "nr/errors.h"
#include "nr/orchestrator/event_bus.h"
#include "nr/security/zeroizer.h"

using namespace nr::orchestrator;

namespace nr::auth {

namespace {

constexpr size_t kMinSigningKeyBytes = 32;
constexpr size_t kUniqueIdBytes = 16;

void PublishAuthEvent(std::string_view event_id, EventSeverity severity,
                      std::string_view message, const std::string& client_key,
                      std::vector<EventField> extra = {}) {
  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = severity;
  event.event_id = std::string(event_id);
  event.message = std::string(message);
  event.fields.emplace_back("client", client_key, FieldPrivacy::kHash);
  for (auto& field : extra) {
    event.fields.push_back(std::move(field));
  }
  EventBus::Instance().Publish(event);
}

}  // namespace

AuthGate::AuthGate(std::string_view password, std::vector<uint8_t> signing_key,
                   std::shared_ptr<RateLimiter> limiter, AuthGateOptions options,
                   AuthGateHooks hooks)
    : signing_key_(std::move(signing_key)),
      limiter_(std::move(limiter)),
      options_(std::move(options)),
      hooks_(std::move(hooks)) {
  if (password.empty()) {
    throw Error(ErrorDomain::Config, errors::config::kMissingValue,
                std::string(errors::msg::kPasswordMissing));
  }
  if (signing_key_.size() < kMinSigningKeyBytes) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                std::string(errors::msg::kSigningSecretTooShort));
  }
  if (!limiter_) {
    limiter_ = std::make_shared<RateLimiter>();
  }
  if (options_.token_ttl.count() <= 0) {
    options_.token_ttl = std::chrono::seconds(3600);
  }
  // Only a keyed digest of the password is kept; comparisons run over the
  // fixed-size digests so their duration does not depend on either input.
  crypto::SystemRandomBytes(compare_key_);
  password_digest_ = PasswordDigest(password);
}

AuthGate::~AuthGate() {
  security::Zeroizer::WipeVector(signing_key_);
  security::Zeroizer::Wipe(compare_key_);
  security::Zeroizer::Wipe(password_digest_);
}

AuthGate::Digest AuthGate::PasswordDigest(std::string_view secret) const {
  return crypto::HMAC_SHA256::Compute(compare_key_, secret);
}

std::int64_t AuthGate::NowSeconds() const {
  const auto now = hooks_.now ? hooks_.now() : std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

void AuthGate::Reject(const std::string& client_key, std::string_view event_id,
                      const AuthError& error) {
  std::vector<EventField> extra;
  extra.emplace_back("reason", std::string(ReasonCode(error.reason)));
  if (error.retry_after_seconds) {
    extra.emplace_back("retry_after", std::to_string(*error.retry_after_seconds),
                       FieldPrivacy::kPublic, true);
  }
  PublishAuthEvent(event_id, EventSeverity::kWarning, "Authentication rejected", client_key,
                   std::move(extra));
  throw error;
}

// Every path through here has already been counted by Admit; a success gives
// its slot back.
IssuedToken AuthGate::IssueToken(const std::string& client_key, std::string_view secret) {
  const auto decision = limiter_->Admit(client_key);
  if (!decision.allowed) {
    Reject(client_key, "auth_rate_limited",
           AuthError(AuthFailure::kRateLimited, std::string(errors::msg::kAuthenticationFailed),
                     decision.retry_after.count()));
  }

  auto presented = PasswordDigest(secret);
  const bool match = crypto::ct::CompareEqual(presented, password_digest_);
  security::Zeroizer::Wipe(presented);
  if (!match) {
    Reject(client_key, "auth_failed",
           AuthError(AuthFailure::kInvalidCredentials,
                     std::string(errors::msg::kAuthenticationFailed)));
  }
  limiter_->Forgive(client_key, decision.attempt);

  IssuedToken issued;
  issued.identity.subject = options_.subject;
  issued.identity.role = options_.role;
  issued.identity.issued_at = NowSeconds();
  issued.identity.expires_at = issued.identity.issued_at + options_.token_ttl.count();
  issued.identity.unique_id = crypto::RandomHex(kUniqueIdBytes);
  issued.token = EncodeToken(issued.identity, signing_key_);

  std::vector<EventField> extra;
  extra.emplace_back("token_id", issued.identity.unique_id, FieldPrivacy::kHash);
  extra.emplace_back("expires_at", std::to_string(issued.identity.expires_at),
                     FieldPrivacy::kPublic, true);
  PublishAuthEvent("auth_succeeded", EventSeverity::kInfo, "Session token issued", client_key,
                   std::move(extra));
  return issued;
}

Identity AuthGate::ValidateToken(std::string_view token) const {
  Identity identity = DecodeToken(token, signing_key_);
  const auto now = NowSeconds();
  if (now > identity.expires_at) {
    throw AuthError(AuthFailure::kExpired, std::string(errors::msg::kTokenExpired));
  }
  std::lock_guard<std::mutex> guard(revocation_mutex_);
  PruneRevocationsLocked(now);
  if (revoked_.count(identity.unique_id) != 0) {
    throw AuthError(AuthFailure::kRevoked, std::string(errors::msg::kTokenRevoked));
  }
  return identity;
}

Identity AuthGate::AuthenticateToken(const std::string& client_key, std::string_view token) {
  const auto decision = limiter_->Admit(client_key);
  if (!decision.allowed) {
    Reject(client_key, "auth_rate_limited",
           AuthError(AuthFailure::kRateLimited, std::string(errors::msg::kAuthenticationFailed),
                     decision.retry_after.count()));
  }
  Identity identity;
  try {
    identity = ValidateToken(token);
  } catch (const AuthError& ex) {
    Reject(client_key, "auth_token_rejected", ex);
  }
  limiter_->Forgive(client_key, decision.attempt);
  return identity;
}

void AuthGate::Revoke(const std::string& unique_id) {
  if (unique_id.empty()) {
    return;
  }
  const auto now = NowSeconds();
  // Any token carrying this id expires no later than one TTL from now.
  const auto useless_after = now + options_.token_ttl.count();
  std::lock_guard<std::mutex> guard(revocation_mutex_);
  PruneRevocationsLocked(now);
  if (revoked_.size() >= options_.max_revocations && revoked_.count(unique_id) == 0) {
    auto soonest = std::min_element(revoked_.begin(), revoked_.end(),
                                    [](const auto& a, const auto& b) { return a.second < b.second; });
    if (soonest != revoked_.end()) {
      revoked_.erase(soonest);
    }
  }
  revoked_[unique_id] = useless_after;

  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = EventSeverity::kInfo;
  event.event_id = "token_revoked";
  event.message = "Session token revoked";
  event.fields.emplace_back("token_id", unique_id, FieldPrivacy::kHash);
  EventBus::Instance().Publish(event);
}

size_t AuthGate::revoked_count() const {
  std::lock_guard<std::mutex> guard(revocation_mutex_);
  return revoked_.size();
}

void AuthGate::PruneRevocationsLocked(std::int64_t now) const {
  for (auto it = revoked_.begin(); it != revoked_.end();) {
    if (it->second < now) {
      it = revoked_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace nr::auth
