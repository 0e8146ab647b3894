#include "nr/auth/token.h"

#include <openssl/evp.h>

#include <json/json.h>

#include <memory>
#include <algorithm>
#include <array>

#include "nr/crypto/ct.h"
#include "nr/crypto/hmac_sha256.h"
#include "nr/error.h"
#include "nr/errors.h"

namespace nr::auth {

namespace {

constexpr size_t kMaxTokenLength = 2048;
constexpr size_t kUniqueIdLength = 32; // 128 bits, hex

[[noreturn]] void ThrowMalformed() {
  throw AuthError(AuthFailure::kMalformed, std::string(errors::msg::kTokenInvalid));
}

std::span<const uint8_t> AsBytes(std::string_view text) {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

bool IsHex(std::string_view text) {
  for (char c : text) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) {
      return false;
    }
  }
  return true;
}

std::string SerializePayload(const Identity& identity) {
  Json::Value payload(Json::objectValue);
  payload["sub"] = identity.subject;
  payload["role"] = identity.role;
  payload["iat"] = Json::Int64{identity.issued_at};
  payload["exp"] = Json::Int64{identity.expires_at};
  payload["jti"] = identity.unique_id;
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  return Json::writeString(writer, payload);
}

Identity ParsePayload(const std::string& text) {
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value payload;
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &payload, &errs) ||
      !payload.isObject()) {
    ThrowMalformed();
  }
  const Json::Value& sub = payload["sub"];
  const Json::Value& iat = payload["iat"];
  const Json::Value& exp = payload["exp"];
  const Json::Value& jti = payload["jti"];
  if (!sub.isString() || !iat.isInt64() || !exp.isInt64() || !jti.isString()) {
    ThrowMalformed();
  }
  Identity identity;
  identity.subject = sub.asString();
  identity.issued_at = iat.asInt64();
  identity.expires_at = exp.asInt64();
  identity.unique_id = jti.asString();
  const Json::Value& role = payload["role"];
  if (role.isString()) {
    identity.role = role.asString();
  } else if (!role.isNull()) {
    ThrowMalformed();
  }
  if (identity.subject.empty() || identity.unique_id.size() != kUniqueIdLength ||
      !IsHex(identity.unique_id) || identity.expires_at < identity.issued_at) {
    ThrowMalformed();
  }
  return identity;
}

}  // namespace

std::string Base64UrlEncode(std::span<const uint8_t> data) {
  if (data.empty()) {
    return {};
  }
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                      data.data(), static_cast<int>(data.size()));
  out.resize(static_cast<size_t>(written));
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  for (char& c : out) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return out;
}

std::vector<uint8_t> Base64UrlDecode(std::string_view text) {
  if (text.empty()) {
    return {};
  }
  if (text.size() % 4 == 1) {
    ThrowMalformed();
  }
  std::string standard;
  standard.reserve(text.size() + 3);
  for (char c : text) {
    if (c == '-') {
      standard.push_back('+');
    } else if (c == '_') {
      standard.push_back('/');
    } else if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
      standard.push_back(c);
    } else {
      ThrowMalformed();
    }
  }
  size_t padding = 0;
  while (standard.size() % 4 != 0) {
    standard.push_back('=');
    ++padding;
  }
  std::vector<uint8_t> out(3 * (standard.size() / 4));
  const int decoded = EVP_DecodeBlock(out.data(),
                                      reinterpret_cast<const unsigned char*>(standard.data()),
                                      static_cast<int>(standard.size()));
  if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
    ThrowMalformed();
  }
  // EVP_DecodeBlock counts the zero bytes produced by padding.
  out.resize(static_cast<size_t>(decoded) - padding);
  return out;
}

std::string EncodeToken(const Identity& identity, std::span<const uint8_t> key) {
  const std::string payload = SerializePayload(identity);
  std::string encoded = Base64UrlEncode(AsBytes(payload));
  const auto tag = crypto::HMAC_SHA256::Compute(key, std::string_view(encoded));
  encoded.push_back('.');
  encoded += Base64UrlEncode(tag);
  return encoded;
}

Identity DecodeToken(std::string_view token, std::span<const uint8_t> key) {
  if (token.empty() || token.size() > kMaxTokenLength) {
    ThrowMalformed();
  }
  const auto dot = token.find('.');
  if (dot == std::string_view::npos || dot == 0 || token.find('.', dot + 1) != std::string_view::npos) {
    ThrowMalformed();
  }
  const std::string_view encoded_payload = token.substr(0, dot);
  const auto signature = Base64UrlDecode(token.substr(dot + 1));
  if (signature.size() != crypto::HMAC_SHA256::TAG_SIZE) {
    ThrowMalformed();
  }
  std::array<uint8_t, crypto::HMAC_SHA256::TAG_SIZE> presented{};
  std::copy(signature.begin(), signature.end(), presented.begin());
  const auto expected = crypto::HMAC_SHA256::Compute(key, encoded_payload);
  if (!crypto::ct::CompareEqual(expected, presented)) {
    ThrowMalformed();
  }
  const auto payload = Base64UrlDecode(encoded_payload);
  return ParsePayload(std::string(payload.begin(), payload.end()));
}

}  // namespace nr::auth
