#include "nr/error.h"
#include "nr/orchestrator/config.h" // TSK405_Gateway_Config

#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <string>

namespace fs = std::filesystem;

namespace {

using nr::orchestrator::ApplyConfigJson;
using nr::orchestrator::ApplyEnvironment;
using nr::orchestrator::ApplyFlag;
using nr::orchestrator::ConfigSources;
using nr::orchestrator::EnvironmentLookup;
using nr::orchestrator::GatewayConfig;
using nr::orchestrator::LoadGatewayConfig;
using nr::orchestrator::ValidateConfig;

const std::string kSecret(40, 's');

EnvironmentLookup FakeEnvironment(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const char* name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

bool ThrowsConfig(const std::function<void()>& fn, int expected_code = 0) {
  try {
    fn();
  } catch (const nr::Error& err) {
    if (err.domain != nr::ErrorDomain::Config) {
      return false;
    }
    return expected_code == 0 || err.code == expected_code;
  }
  return false;
}

class TempDir {
public:
  TempDir() {
    path_ = fs::temp_directory_path() / ("nrgate_config_" + std::to_string(::getpid()));
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  fs::path Write(const std::string& name, const std::string& body) const {
    const auto file = path_ / name;
    std::ofstream out(file);
    out << body;
    return file;
  }
  const fs::path& path() const noexcept { return path_; }

private:
  fs::path path_;
};

void TestDefaults() {
  GatewayConfig config;
  assert(config.bind_address == "127.0.0.1");
  assert(config.port == 8765);
  assert(config.rate_window == std::chrono::seconds(300));
  assert(config.rate_max_attempts == 5);
  assert(config.idle_timeout == std::chrono::seconds(900));
  assert(config.local_only());
  assert(!config.tls());
  assert(!config.allowlist);

  // A password is the only required value.
  assert(ThrowsConfig([&]() { ValidateConfig(config); }, nr::errors::config::kMissingValue));
  config.password = "pw";
  ValidateConfig(config);
}

void TestEnvironment() {
  GatewayConfig config;
  ApplyEnvironment(config, FakeEnvironment({
                               {"NETREAPER_SECRET", kSecret},
                               {"NETREAPER_PASSWORD", "operator pw"},
                               {"NETREAPER_BIND", "0.0.0.0"},
                               {"NETREAPER_PORT", "9443"},
                               {"NETREAPER_ALLOWED_ORIGINS", "https://a.example, https://b.example ,"},
                               {"NETREAPER_RATE_WINDOW", "60"},
                               {"NETREAPER_RATE_MAX", "3"},
                               {"NETREAPER_IDLE_TIMEOUT", "0"},
                               {"NETREAPER_JOB_TIMEOUT", "3600"},
                           }));
  assert(config.signing_secret == kSecret);
  assert(!config.local_only());
  assert(config.password == "operator pw");
  assert(config.bind_address == "0.0.0.0");
  assert(config.port == 9443);
  assert((config.allowed_origins == std::vector<std::string>{"https://a.example", "https://b.example"}));
  assert(config.rate_window == std::chrono::seconds(60));
  assert(config.rate_max_attempts == 3);
  assert(config.idle_timeout == std::chrono::seconds(0));
  assert(config.job_timeout == std::chrono::seconds(3600));
  ValidateConfig(config);

  assert(ThrowsConfig([]() {
    GatewayConfig bad;
    ApplyEnvironment(bad, FakeEnvironment({{"NETREAPER_PORT", "70000"}}));
  }));
  assert(ThrowsConfig([]() {
    GatewayConfig bad;
    ApplyEnvironment(bad, FakeEnvironment({{"NETREAPER_RATE_MAX", "five"}}));
  }));
  assert(ThrowsConfig([]() {
    GatewayConfig bad;
    ApplyEnvironment(bad, FakeEnvironment({{"NETREAPER_PORT", "-1"}}));
  }));
}

void TestJsonFile() {
  TempDir dir;
  fs::create_directories(dir.path() / "work");
  const auto cert = dir.Write("cert.pem", "cert");
  const auto key = dir.Write("key.pem", "key");

  GatewayConfig config;
  config.password = "pw";
  ApplyConfigJson(config, R"({
    "port": 8443,
    "bind": "::1",
    "allowed_origins": ["https://console.example"],
    "tls": {"cert": ")" + cert.string() + R"(", "key": ")" + key.string() + R"("},
    "rate_max_attempts": 7,
    "token_ttl": "1200",
    "max_concurrent_jobs": 4,
    "working_directory_roots": [")" + (dir.path() / "work").string() + R"("],
    "allowlist": [
      {"id": "nmap"},
      {"id": "scanner", "executable": "/opt/scanner/bin/scan", "aliases": ["/usr/local/bin/scanner"]}
    ]
  })");
  assert(config.port == 8443);
  assert(config.bind_address == "::1");
  assert(config.allowed_origins.size() == 1);
  assert(config.rate_max_attempts == 7);
  assert(config.token_ttl == std::chrono::seconds(1200));
  assert(config.max_concurrent_jobs == 4);
  assert(config.working_directory_roots.size() == 1);
  assert(config.allowlist && config.allowlist->size() == 2);
  assert((*config.allowlist)[1].executable == "/opt/scanner/bin/scan");
  auto tls = config.tls();
  assert(tls && tls->certificate == cert && tls->private_key == key);
  ValidateConfig(config);

  assert(ThrowsConfig([]() {
    GatewayConfig bad;
    ApplyConfigJson(bad, R"({"prot": 1})");
  }));
  assert(ThrowsConfig([]() {
    GatewayConfig bad;
    ApplyConfigJson(bad, R"({"tls": {"certificate": "x"}})");
  }));
  assert(ThrowsConfig([]() {
    GatewayConfig bad;
    ApplyConfigJson(bad, R"({"port": true})");
  }));
  assert(ThrowsConfig([]() {
    GatewayConfig bad;
    ApplyConfigJson(bad, "[1, 2]");
  }));
  assert(ThrowsConfig([]() {
    GatewayConfig bad;
    ApplyConfigJson(bad, R"({"allowlist": []})");
  }));

  const auto file = dir.Write("gateway.json", R"({"port": 9000, "password": "from-file"})");
  ConfigSources sources;
  sources.environment = FakeEnvironment({{"NETREAPER_PORT", "8000"}, {"NETREAPER_PASSWORD", "env"}});
  sources.config_file = file;
  sources.flags = {{"port", "7000"}};
  auto layered = LoadGatewayConfig(sources);
  assert(layered.port == 7000);         // flags win
  assert(layered.password == "from-file"); // file beats environment

  sources.config_file = dir.path() / "missing.json";
  assert(ThrowsConfig([&]() { (void)LoadGatewayConfig(sources); }, nr::errors::config::kUnreadableFile));
}

void TestFlags() {
  GatewayConfig config;
  ApplyFlag(config, "max-jobs-per-session", "2");
  ApplyFlag(config, "idle_timeout", "30");
  ApplyFlag(config, "cancel-grace", "5");
  assert(config.max_jobs_per_session == 2);
  assert(config.idle_timeout == std::chrono::seconds(30));
  assert(config.cancel_grace == std::chrono::milliseconds(5000));

  assert(ThrowsConfig([&]() { ApplyFlag(config, "password", "hunter2"); }));
  assert(ThrowsConfig([&]() { ApplyFlag(config, "signing-secret", "x"); }));
  assert(ThrowsConfig([&]() { ApplyFlag(config, "secret", "x"); }));
  assert(config.password.empty());
  assert(ThrowsConfig([&]() { ApplyFlag(config, "no-such-flag", "1"); }));
  assert(ThrowsConfig([&]() { ApplyFlag(config, "token-ttl", "30"); }));
  assert(ThrowsConfig([&]() { ApplyFlag(config, "threads", "0"); }));
}

void TestValidation() {
  TempDir dir;
  GatewayConfig base;
  base.password = "pw";

  auto short_secret = base;
  short_secret.signing_secret = std::string(31, 'x');
  assert(ThrowsConfig([&]() { ValidateConfig(short_secret); }, nr::errors::config::kInvalidValue));

  auto half_tls = base;
  half_tls.tls_certificate = dir.Write("cert.pem", "c");
  assert(ThrowsConfig([&]() { ValidateConfig(half_tls); }, nr::errors::config::kMissingValue));

  auto missing_tls = base;
  missing_tls.tls_certificate = dir.path() / "nope.pem";
  missing_tls.tls_private_key = dir.path() / "nope.key";
  assert(ThrowsConfig([&]() { ValidateConfig(missing_tls); }, nr::errors::config::kUnreadableFile));

  auto relative_root = base;
  relative_root.working_directory_roots = {"relative/dir"};
  assert(ThrowsConfig([&]() { ValidateConfig(relative_root); }));

  auto bad_allowlist = base;
  bad_allowlist.allowlist = std::vector<nr::exec::AllowlistEntry>{{"bad id", "", {}}};
  assert(ThrowsConfig([&]() { ValidateConfig(bad_allowlist); }));

  auto per_session = base;
  per_session.max_concurrent_jobs = 2;
  per_session.max_jobs_per_session = 3;
  assert(ThrowsConfig([&]() { ValidateConfig(per_session); }));
}

void TestWipeSecrets() {
  GatewayConfig config;
  config.password = "pw";
  config.signing_secret = kSecret;
  nr::orchestrator::WipeSecrets(config);
  assert(config.password.empty());
  assert(config.signing_secret.empty());
}

}  // namespace

int main() {
  TestDefaults();
  TestEnvironment();
  TestJsonFile();
  TestFlags();
  TestValidation();
  TestWipeSecrets();
  std::cout << "config ok\n";
  return 0;
}
