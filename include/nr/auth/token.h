#pragma once
// TSK401_Gateway_Auth signed identity tokens

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nr::auth {

struct Identity {
  std::string subject;
  std::string role;
  std::int64_t issued_at{0};  // unix seconds
  std::int64_t expires_at{0}; // unix seconds
  std::string unique_id;
};

std::string Base64UrlEncode(std::span<const uint8_t> data);
// Throws AuthError{kMalformed} on characters outside the url-safe alphabet.
std::vector<uint8_t> Base64UrlDecode(std::string_view text);

// base64url(json payload) "." base64url(HMAC-SHA256(key, encoded payload))
std::string EncodeToken(const Identity& identity, std::span<const uint8_t> key);

// Verifies the signature before looking at the payload. Every structural
// problem, a bad signature included, is AuthError{kMalformed}. Expiry and
// revocation are the caller's business.
Identity DecodeToken(std::string_view token, std::span<const uint8_t> key);

}  // namespace nr::auth
