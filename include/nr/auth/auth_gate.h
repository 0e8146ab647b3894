#pragma once
// TSK401_Gateway_Auth password login, token validation and revocation

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "nr/auth/rate_limiter.h"
#include "nr/auth/token.h"
#include "nr/crypto/hmac_sha256.h"
#include "nr/error.h"

namespace nr::auth {

struct AuthGateOptions {
  std::chrono::seconds token_ttl{3600};
  std::string subject{"operator"};
  std::string role{"operator"};
  size_t max_revocations{4096};
};

struct AuthGateHooks { // test seam for token timestamps
  std::function<std::chrono::system_clock::time_point()> now;
};

struct IssuedToken {
  Identity identity;
  std::string token;
};

class AuthGate {
 public:
  // The password and signing key are copied into the gate; callers should wipe
  // their own buffers afterwards.
  AuthGate(std::string_view password, std::vector<uint8_t> signing_key,
           std::shared_ptr<RateLimiter> limiter, AuthGateOptions options = {},
           AuthGateHooks hooks = {});
  ~AuthGate();

  AuthGate(const AuthGate&) = delete;
  AuthGate& operator=(const AuthGate&) = delete;

  // Throws AuthError{kRateLimited} before looking at the secret when the client
  // key is throttled, AuthError{kInvalidCredentials} on mismatch. Both record an
  // attempt against the key; the attempt is admitted and recorded atomically
  // before the comparison, so parallel logins share one budget.
  IssuedToken IssueToken(const std::string& client_key, std::string_view secret);

  // Throws AuthError{kMalformed, kExpired, kRevoked}.
  Identity ValidateToken(std::string_view token) const;

  // ValidateToken behind the same throttle as IssueToken.
  Identity AuthenticateToken(const std::string& client_key, std::string_view token);

  void Revoke(const std::string& unique_id);
  size_t revoked_count() const;

  std::int64_t NowSeconds() const;
  const AuthGateOptions& options() const noexcept { return options_; }

 private:
  using Digest = std::array<uint8_t, crypto::HMAC_SHA256::TAG_SIZE>;

  Digest PasswordDigest(std::string_view secret) const;
  void PruneRevocationsLocked(std::int64_t now) const;
  [[noreturn]] void Reject(const std::string& client_key, std::string_view event_id,
                           const AuthError& error);

  std::vector<uint8_t> signing_key_;
  std::array<uint8_t, 32> compare_key_{};
  Digest password_digest_{};
  std::shared_ptr<RateLimiter> limiter_;
  AuthGateOptions options_;
  AuthGateHooks hooks_;

  mutable std::mutex revocation_mutex_;
  // unique id -> unix second after which the entry is useless
  mutable std::unordered_map<std::string, std::int64_t> revoked_;
};

}  // namespace nr::auth
