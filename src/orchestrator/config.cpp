#include "nr/orchestrator/config.h"

#include <json/json.h>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <system_error>

#include "nr/error.h"
#include "nr/errors.h"
#include "nr/security/zeroizer.h"

namespace nr::orchestrator {

namespace {

constexpr std::uintmax_t kMaxConfigFileBytes = 1024 * 1024;
constexpr size_t kMinSigningSecretLength = 32;

struct EnvBinding {
  const char* variable;
  const char* key;
};

constexpr EnvBinding kEnvBindings[] = {
    {"NETREAPER_SECRET", "signing_secret"},
    {"NETREAPER_PASSWORD", "password"},
    {"NETREAPER_BIND", "bind"},
    {"NETREAPER_PORT", "port"},
    {"NETREAPER_ALLOWED_ORIGINS", "allowed_origins"},
    {"NETREAPER_TLS_CERT", "tls_cert"},
    {"NETREAPER_TLS_KEY", "tls_key"},
    {"NETREAPER_RATE_WINDOW", "rate_window"},
    {"NETREAPER_RATE_MAX", "rate_max"},
    {"NETREAPER_IDLE_TIMEOUT", "idle_timeout"},
    {"NETREAPER_JOB_TIMEOUT", "job_timeout"},
    {"NETREAPER_WORKDIR_ROOTS", "working_directory_roots"},
};

[[noreturn]] void ThrowInvalid(std::string_view key) {
  throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
              "Invalid value for configuration key '" + std::string(key) + "'");
}

std::optional<std::string> ProcessEnvironment(const char* name) {
  const char* value = std::getenv(name);
  if (!value) {
    return std::nullopt;
  }
  return std::string(value);
}

uint64_t ParseBounded(std::string_view key, std::string_view text, uint64_t min, uint64_t max) {
  uint64_t parsed = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || parsed < min ||
      parsed > max) {
    ThrowInvalid(key);
  }
  return parsed;
}

std::vector<std::string> SplitList(std::string_view text) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= text.size()) {
    auto comma = text.find(',', start);
    if (comma == std::string_view::npos) {
      comma = text.size();
    }
    auto item = text.substr(start, comma - start);
    while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) {
      item.remove_prefix(1);
    }
    while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) {
      item.remove_suffix(1);
    }
    if (!item.empty()) {
      out.emplace_back(item);
    }
    start = comma + 1;
  }
  return out;
}

std::string NormalizeKey(std::string_view name) {
  std::string key(name);
  for (char& c : key) {
    if (c == '-') {
      c = '_';
    }
  }
  return key;
}

// Single entry point for every scalar source. Returns false for unknown keys.
bool SetValue(GatewayConfig& config, std::string_view key, std::string_view value) {
  if (key == "signing_secret") {
    config.signing_secret.assign(value);
  } else if (key == "password") {
    config.password.assign(value);
  } else if (key == "bind") {
    if (value.empty()) {
      ThrowInvalid(key);
    }
    config.bind_address.assign(value);
  } else if (key == "port") {
    config.port = static_cast<uint16_t>(ParseBounded(key, value, 1, 65535));
  } else if (key == "allowed_origins") {
    config.allowed_origins = SplitList(value);
  } else if (key == "tls_cert") {
    config.tls_certificate = value.empty() ? std::nullopt
                                           : std::optional<std::filesystem::path>(std::string(value));
  } else if (key == "tls_key") {
    config.tls_private_key = value.empty() ? std::nullopt
                                           : std::optional<std::filesystem::path>(std::string(value));
  } else if (key == "rate_window") {
    config.rate_window = std::chrono::seconds(ParseBounded(key, value, 1, 86400));
  } else if (key == "rate_max") {
    config.rate_max_attempts = ParseBounded(key, value, 1, 1000);
  } else if (key == "idle_timeout") {
    config.idle_timeout = std::chrono::seconds(ParseBounded(key, value, 0, 86400));
  } else if (key == "token_ttl") {
    config.token_ttl = std::chrono::seconds(ParseBounded(key, value, 60, 86400));
  } else if (key == "job_timeout") {
    config.job_timeout = std::chrono::seconds(ParseBounded(key, value, 0, 7 * 86400));
  } else if (key == "cancel_grace") {
    config.cancel_grace = std::chrono::seconds(ParseBounded(key, value, 0, 60));
  } else if (key == "max_jobs_per_session") {
    config.max_jobs_per_session = ParseBounded(key, value, 1, 16);
  } else if (key == "max_concurrent_jobs") {
    config.max_concurrent_jobs = ParseBounded(key, value, 1, 256);
  } else if (key == "max_arguments") {
    config.max_arguments = ParseBounded(key, value, 1, 1024);
  } else if (key == "max_argument_length") {
    config.max_argument_length = ParseBounded(key, value, 1, 65536);
  } else if (key == "threads") {
    config.threads = ParseBounded(key, value, 1, 64);
  } else if (key == "working_directory_roots") {
    config.working_directory_roots.clear();
    for (auto& root : SplitList(value)) {
      config.working_directory_roots.emplace_back(std::move(root));
    }
  } else {
    return false;
  }
  return true;
}

std::string ScalarText(const Json::Value& value, std::string_view key) {
  if (value.isString()) {
    return value.asString();
  }
  if (value.isUInt64()) {
    return std::to_string(value.asUInt64());
  }
  ThrowInvalid(key);
}

std::vector<std::string> StringArray(const Json::Value& value, std::string_view key) {
  if (!value.isArray()) {
    ThrowInvalid(key);
  }
  std::vector<std::string> out;
  for (const auto& item : value) {
    if (!item.isString()) {
      ThrowInvalid(key);
    }
    out.push_back(item.asString());
  }
  return out;
}

std::vector<exec::AllowlistEntry> ParseAllowlist(const Json::Value& value) {
  if (!value.isArray() || value.empty()) {
    ThrowInvalid("allowlist");
  }
  std::vector<exec::AllowlistEntry> entries;
  for (const auto& item : value) {
    if (!item.isObject() || !item["id"].isString()) {
      ThrowInvalid("allowlist");
    }
    exec::AllowlistEntry entry;
    entry.id = item["id"].asString();
    if (item.isMember("executable")) {
      if (!item["executable"].isString()) {
        ThrowInvalid("allowlist");
      }
      entry.executable = item["executable"].asString();
    }
    if (item.isMember("aliases")) {
      entry.aliases = StringArray(item["aliases"], "allowlist");
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

}  // namespace

std::optional<TlsMaterial> GatewayConfig::tls() const {
  if (!tls_certificate || !tls_private_key) {
    return std::nullopt;
  }
  return TlsMaterial{*tls_certificate, *tls_private_key};
}

void ApplyEnvironment(GatewayConfig& config, const EnvironmentLookup& lookup) {
  for (const auto& binding : kEnvBindings) {
    auto value = lookup ? lookup(binding.variable) : ProcessEnvironment(binding.variable);
    if (!value) {
      continue;
    }
    (void)SetValue(config, binding.key, *value); // every binding names a known key
    security::Zeroizer::WipeString(*value);
  }
}

void ApplyConfigJson(GatewayConfig& config, std::string_view json_text) {
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errs;
  if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errs) ||
      !root.isObject()) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                "Configuration file is not a JSON object: " + errs);
  }

  for (const auto& name : root.getMemberNames()) {
    const Json::Value& value = root[name];
    if (name == "allowed_origins") {
      config.allowed_origins = StringArray(value, name);
    } else if (name == "working_directory_roots") {
      config.working_directory_roots.clear();
      for (auto& root_path : StringArray(value, name)) {
        config.working_directory_roots.emplace_back(std::move(root_path));
      }
    } else if (name == "allowlist") {
      config.allowlist = ParseAllowlist(value);
    } else if (name == "tls") {
      if (!value.isObject()) {
        ThrowInvalid(name);
      }
      for (const auto& tls_name : value.getMemberNames()) {
        if (tls_name == "cert") {
          SetValue(config, "tls_cert", ScalarText(value[tls_name], "tls.cert"));
        } else if (tls_name == "key") {
          SetValue(config, "tls_key", ScalarText(value[tls_name], "tls.key"));
        } else {
          throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                      "Unknown configuration key 'tls." + tls_name + "'");
        }
      }
    } else if (name == "rate_max_attempts") {
      SetValue(config, "rate_max", ScalarText(value, name));
    } else {
      std::string text = ScalarText(value, name);
      const bool known = SetValue(config, name, text);
      security::Zeroizer::WipeString(text);
      if (!known) {
        throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                    "Unknown configuration key '" + name + "'");
      }
    }
  }
}

void ApplyConfigFile(GatewayConfig& config, const std::filesystem::path& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec || size > kMaxConfigFileBytes) {
    throw Error(ErrorDomain::Config, errors::config::kUnreadableFile,
                "Configuration file is missing or too large: " + path.string(),
                ec ? std::optional<int>(ec.value()) : std::nullopt);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error(ErrorDomain::Config, errors::config::kUnreadableFile,
                "Configuration file could not be opened: " + path.string());
  }
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  ApplyConfigJson(config, text);
  security::Zeroizer::WipeString(text);
}

void ApplyFlag(GatewayConfig& config, std::string_view name, std::string_view value) {
  const std::string key = NormalizeKey(name);
  // Secrets on the command line end up in ps output and shell history.
  if (key == "password" || key == "signing_secret" || key == "secret") {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                "Secrets are accepted from the environment or the config file only");
  }
  if (!SetValue(config, key, value)) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                "Unknown option '--" + std::string(name) + "'");
  }
}

void ValidateConfig(const GatewayConfig& config) {
  if (config.password.empty()) {
    throw Error(ErrorDomain::Config, errors::config::kMissingValue,
                std::string(errors::msg::kPasswordMissing));
  }
  if (!config.signing_secret.empty() && config.signing_secret.size() < kMinSigningSecretLength) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                std::string(errors::msg::kSigningSecretTooShort));
  }
  if (config.tls_certificate.has_value() != config.tls_private_key.has_value()) {
    throw Error(ErrorDomain::Config, errors::config::kMissingValue,
                std::string(errors::msg::kTlsPairIncomplete));
  }
  if (auto tls = config.tls()) {
    for (const auto* file : {&tls->certificate, &tls->private_key}) {
      std::error_code ec;
      if (!std::filesystem::is_regular_file(*file, ec)) {
        throw Error(ErrorDomain::Config, errors::config::kUnreadableFile,
                    "TLS file is not readable: " + file->string());
      }
    }
  }
  for (const auto& root : config.working_directory_roots) {
    std::error_code ec;
    if (!root.is_absolute() || !std::filesystem::is_directory(root, ec)) {
      throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                  "Working directory root must be an existing absolute directory: " +
                      root.string());
    }
  }
  if (config.allowlist) {
    [[maybe_unused]] exec::Allowlist checked(*config.allowlist); // throws on bad entries
  }
  if (config.max_jobs_per_session > config.max_concurrent_jobs) {
    ThrowInvalid("max_jobs_per_session");
  }
}

GatewayConfig LoadGatewayConfig(const ConfigSources& sources) {
  GatewayConfig config;
  ApplyEnvironment(config, sources.environment);
  if (sources.config_file) {
    ApplyConfigFile(config, *sources.config_file);
  }
  for (const auto& [name, value] : sources.flags) {
    ApplyFlag(config, name, value);
  }
  ValidateConfig(config);
  return config;
}

void WipeSecrets(GatewayConfig& config) noexcept {
  security::Zeroizer::WipeString(config.password);
  security::Zeroizer::WipeString(config.signing_secret);
}

}  // namespace nr::orchestrator
