#pragma once
// TSK405_Gateway_Config environment, file and flag configuration

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "nr/exec/allowlist.h"

namespace nr::orchestrator {

struct TlsMaterial {
  std::filesystem::path certificate;
  std::filesystem::path private_key;
};

struct GatewayConfig {
  std::string signing_secret; // empty: ephemeral key, loopback peers only
  std::string password;
  std::string bind_address{"127.0.0.1"};
  uint16_t port{8765};
  std::vector<std::string> allowed_origins;
  std::optional<std::filesystem::path> tls_certificate;
  std::optional<std::filesystem::path> tls_private_key;

  std::chrono::seconds rate_window{300};
  size_t rate_max_attempts{5};
  std::chrono::seconds idle_timeout{900};
  std::chrono::seconds token_ttl{3600};
  std::chrono::seconds job_timeout{0};
  std::chrono::milliseconds cancel_grace{3000};
  size_t max_jobs_per_session{1};
  size_t max_concurrent_jobs{8};
  size_t max_arguments{64};
  size_t max_argument_length{4096};
  size_t threads{2};
  std::vector<std::filesystem::path> working_directory_roots;
  std::optional<std::vector<exec::AllowlistEntry>> allowlist; // unset: built-in list

  bool local_only() const noexcept { return signing_secret.empty(); }
  // Valid only after ValidateConfig succeeded.
  std::optional<TlsMaterial> tls() const;
};

// Lookup seam for tests; the default reads the process environment.
using EnvironmentLookup = std::function<std::optional<std::string>(const char* name)>;

// Each Apply* layer overwrites only the values it names. Malformed input
// throws nr::Error{ErrorDomain::Config}.
void ApplyEnvironment(GatewayConfig& config, const EnvironmentLookup& lookup = {});
void ApplyConfigJson(GatewayConfig& config, std::string_view json_text);
void ApplyConfigFile(GatewayConfig& config, const std::filesystem::path& path);
// `name` is the flag without the leading dashes, e.g. "port".
void ApplyFlag(GatewayConfig& config, std::string_view name, std::string_view value);

// Cross-field checks: password present, secret length, TLS pair, ranges.
void ValidateConfig(const GatewayConfig& config);

struct ConfigSources {
  EnvironmentLookup environment;
  std::optional<std::filesystem::path> config_file;
  std::vector<std::pair<std::string, std::string>> flags;
};

// Environment, then file, then flags, then ValidateConfig.
GatewayConfig LoadGatewayConfig(const ConfigSources& sources);

// Clears password and signing secret; read local_only() before calling.
void WipeSecrets(GatewayConfig& config) noexcept;

}  // namespace nr::orchestrator
