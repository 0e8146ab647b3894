#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <pthread.h>
#include <signal.h>

#include "nr/auth/auth_gate.h"
#include "nr/auth/rate_limiter.h"
#include "nr/crypto/provider.h"
#include "nr/crypto/random.h"
#include "nr/error.h"
#include "nr/exec/allowlist.h"
#include "nr/exec/command_validator.h"
#include "nr/exec/process_supervisor.h"
#include "nr/exec/tool_probe.h"
#include "nr/orchestrator/config.h"
#include "nr/orchestrator/event_bus.h"
#include "nr/security/zeroizer.h"
#include "nr/transport/websocket_server.h"

namespace {

  // TSK009 sysexits-style codes
  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitSoftware = 70;
  constexpr int kExitIO = 74;
  constexpr int kExitConfig = 78;

  constexpr size_t kEphemeralKeyBytes = 32;

  void PrintUsage() {
    std::cerr << "NetReaper gateway daemon\n";
    std::cerr << "Usage:\n";
    std::cerr << "  nrgated [--config=<file>] [--<option>=<value>...]\n";
    std::cerr << "  nrgated --check-config [--config=<file>]\n";
    std::cerr << "  nrgated --probe-tools [--config=<file>]\n";
    std::cerr << "\nOptions (override the config file, which overrides NETREAPER_* variables):\n";
    std::cerr << "  --bind=<addr>                 Listen address (default 127.0.0.1)\n";
    std::cerr << "  --port=<n>                    Listen port (default 8765)\n";
    std::cerr << "  --allowed-origins=<a,b>       Origins accepted at upgrade\n";
    std::cerr << "  --tls-cert=<pem> --tls-key=<pem>\n";
    std::cerr << "  --rate-window=<s> --rate-max=<n>\n";
    std::cerr << "  --idle-timeout=<s> --token-ttl=<s> --job-timeout=<s> --cancel-grace=<s>\n";
    std::cerr << "  --max-jobs-per-session=<n> --max-concurrent-jobs=<n>\n";
    std::cerr << "  --max-arguments=<n> --max-argument-length=<n> --threads=<n>\n";
    std::cerr << "  --working-directory-roots=<dir,dir>\n";
    std::cerr << "\nSecrets come from NETREAPER_SECRET / NETREAPER_PASSWORD or the config file.\n";
  }

  std::string_view DomainPrefix(nr::ErrorDomain domain) {
    switch (domain) {
    case nr::ErrorDomain::Security:
      return "Security error"; // TSK020
    case nr::ErrorDomain::IO:
      return "I/O error";
    case nr::ErrorDomain::Crypto:
      return "Cryptography error";
    case nr::ErrorDomain::Validation:
      return "Validation error";
    case nr::ErrorDomain::Config:
      return "Configuration error";
    case nr::ErrorDomain::Execution:
      return "Execution error";
    case nr::ErrorDomain::Transport:
      return "Transport error";
    case nr::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  int ExitCodeFor(const nr::Error& err) {
    switch (err.domain) {
    case nr::ErrorDomain::Config:
      return kExitConfig;
    case nr::ErrorDomain::IO:
    case nr::ErrorDomain::Transport:
      return kExitIO;
    case nr::ErrorDomain::Validation:
      return kExitUsage;
    case nr::ErrorDomain::Security:
    case nr::ErrorDomain::Crypto:
    case nr::ErrorDomain::Execution:
    case nr::ErrorDomain::Internal:
    default:
      return kExitSoftware;
    }
  }

  void ReportError(const nr::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';

    nr::orchestrator::Event event; // TSK027
    event.category = nr::orchestrator::EventCategory::kDiagnostics;
    event.severity = nr::orchestrator::EventSeverity::kError;
    event.event_id = "daemon_error";
    event.message = err.what();
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code),
                              nr::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                nr::orchestrator::FieldPrivacy::kPublic, true);
    }
    try {
      nr::orchestrator::EventBus::Instance().Publish(event);
    } catch (const std::exception& publish_error) {
      std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
                << publish_error.what() << "\"}" << std::endl; // TSK116_Incorrect_Error_Propagation
    }
  }

  // Warnings and above also go to stderr so an operator running in the
  // foreground sees them without tailing the log.
  void InstallStderrMirror() {
    nr::orchestrator::EventBus::Instance().Subscribe([](const nr::orchestrator::Event& event) {
      if (event.severity < nr::orchestrator::EventSeverity::kWarning) {
        return;
      }
      std::cerr << nr::orchestrator::FormatEventLine(event) << '\n';
    });
  }

  std::string SearchPath() {
    const char* path = std::getenv("PATH");
    return path ? std::string(path) : std::string("/usr/local/bin:/usr/bin:/bin");
  }

  int ProbeAndPrint(const nr::exec::Allowlist& allowlist) {
    const auto statuses = nr::exec::ProbeTools(allowlist, SearchPath());
    size_t available = 0;
    for (const auto& status : statuses) {
      if (status.available()) {
        ++available;
        std::cout << "  [ok]      " << status.id << "  " << status.resolved->string() << '\n';
      } else {
        std::cout << "  [missing] " << status.id << '\n';
      }
    }
    std::cout << available << " of " << statuses.size() << " tools available" << std::endl;
    return kExitOk;
  }

  bool IsLoopbackBind(std::string_view bind) {
    return bind == "127.0.0.1" || bind == "::1" || bind == "localhost" ||
           bind.rfind("127.", 0) == 0;
  }

} // namespace

int main(int argc, char** argv) {
  try {
    nr::orchestrator::ConfigSources sources;
    bool check_only = false;
    bool probe_only = false;
    for (int index = 1; index < argc; ++index) { // TSK029 parse flags
      std::string_view arg = argv[index];
      if (arg == "--help" || arg == "-h") {
        PrintUsage();
        return kExitOk;
      }
      if (arg.rfind("--", 0) != 0) {
        PrintUsage();
        return kExitUsage;
      }
      if (arg == "--check-config") {
        check_only = true;
        continue;
      }
      if (arg == "--probe-tools") {
        probe_only = true;
        continue;
      }
      const auto eq = arg.find('=');
      if (eq == std::string_view::npos || eq == 2) {
        PrintUsage();
        return kExitUsage;
      }
      const std::string name(arg.substr(2, eq - 2));
      const std::string value(arg.substr(eq + 1));
      if (name == "config") {
        if (value.empty()) {
          PrintUsage();
          return kExitUsage;
        }
        sources.config_file = value;
        continue;
      }
      sources.flags.emplace_back(name, value);
    }

    nr::orchestrator::GatewayConfig config;
    try {
      config = nr::orchestrator::LoadGatewayConfig(sources);
    } catch (const nr::Error& err) {
      ReportError(err);
      return kExitConfig;
    }

    nr::exec::Allowlist allowlist =
        config.allowlist ? nr::exec::Allowlist(*config.allowlist) : nr::exec::Allowlist::BuiltIn();
    if (probe_only) {
      nr::orchestrator::WipeSecrets(config);
      return ProbeAndPrint(allowlist);
    }
    if (check_only) {
      nr::orchestrator::WipeSecrets(config);
      std::cout << "Configuration OK" << std::endl;
      return kExitOk;
    }

    InstallStderrMirror();
    nr::crypto::EnsureCryptoProviderInitialized(); // TSK072_CryptoProvider_Init_and_KAT

    // Workers inherit this mask; the main thread collects the signals with
    // sigwait. Children get a clean mask back before exec.
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    sigaddset(&shutdown_signals, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    nr::exec::ProbeTools(allowlist, SearchPath()); // TSK407_Tool_Probe

    const bool local_only = config.local_only();
    std::vector<uint8_t> signing_key;
    if (local_only) {
      signing_key.resize(kEphemeralKeyBytes);
      nr::crypto::SystemRandomBytes(signing_key);
    } else {
      signing_key.assign(config.signing_secret.begin(), config.signing_secret.end());
    }

    nr::auth::RateLimiterOptions limiter_options;
    limiter_options.max_attempts = config.rate_max_attempts;
    limiter_options.window = config.rate_window;
    auto limiter = std::make_shared<nr::auth::RateLimiter>(limiter_options);

    nr::auth::AuthGateOptions auth_options;
    auth_options.token_ttl = config.token_ttl;
    auto auth = std::make_shared<nr::auth::AuthGate>(config.password, signing_key, limiter, auth_options);
    nr::security::Zeroizer::WipeVector(signing_key);
    nr::orchestrator::WipeSecrets(config);

    nr::exec::ValidatorLimits limits;
    limits.max_arguments = config.max_arguments;
    limits.max_argument_length = config.max_argument_length;
    limits.working_directory_roots = config.working_directory_roots;
    auto validator = std::make_shared<const nr::exec::CommandValidator>(std::move(allowlist), limits);

    nr::exec::SupervisorOptions supervisor_options;
    supervisor_options.max_concurrent_jobs = config.max_concurrent_jobs;
    supervisor_options.cancel_grace = config.cancel_grace;
    auto supervisor = std::make_shared<nr::exec::ProcessSupervisor>(supervisor_options);

    nr::transport::SessionContext context;
    context.auth = auth;
    context.validator = validator;
    context.supervisor = supervisor;
    context.local_only = local_only;
    context.idle_timeout = config.idle_timeout;
    context.job_timeout = config.job_timeout;
    context.max_jobs_per_session = config.max_jobs_per_session;

    nr::transport::ServerOptions server_options;
    server_options.bind_address = config.bind_address;
    server_options.port = config.port;
    server_options.allowed_origins = config.allowed_origins;
    server_options.tls = config.tls();
    server_options.threads = config.threads;

    if (local_only && !IsLoopbackBind(config.bind_address)) {
      nr::orchestrator::Event event;
      event.category = nr::orchestrator::EventCategory::kSecurity;
      event.severity = nr::orchestrator::EventSeverity::kWarning;
      event.event_id = "local_only_mode";
      event.message = "No signing secret configured; remote peers will be rejected";
      event.fields.emplace_back("bind", config.bind_address);
      nr::orchestrator::EventBus::Instance().Publish(event);
    }

    {
      nr::transport::GatewayServer server(server_options, context);
      server.Start();
      std::cout << "nrgated listening on " << config.bind_address << ':' << server.port()
                << (server_options.tls ? " (tls)" : "") << std::endl;

      int received = 0;
      if (sigwait(&shutdown_signals, &received) != 0) {
        received = SIGTERM;
      }
      nr::orchestrator::Event event;
      event.category = nr::orchestrator::EventCategory::kLifecycle;
      event.severity = nr::orchestrator::EventSeverity::kInfo;
      event.event_id = "shutdown_requested";
      event.message = "Shutdown signal received";
      event.fields.emplace_back("signal", std::to_string(received),
                                nr::orchestrator::FieldPrivacy::kPublic, true);
      nr::orchestrator::EventBus::Instance().Publish(event);
      server.Stop();
    }

    // Sessions are gone; wait for monitors so no observer outlives main.
    supervisor->CancelAll();
    if (!supervisor->WaitIdle(config.cancel_grace + std::chrono::seconds(5))) {
      nr::orchestrator::Event event;
      event.category = nr::orchestrator::EventCategory::kLifecycle;
      event.severity = nr::orchestrator::EventSeverity::kError;
      event.event_id = "shutdown_abandoned_jobs";
      event.message = "Jobs still running at shutdown";
      event.fields.emplace_back("active_jobs", std::to_string(supervisor->active_jobs()),
                                nr::orchestrator::FieldPrivacy::kPublic, true);
      nr::orchestrator::EventBus::Instance().Publish(event);
      std::cerr << "Execution error: jobs still running at shutdown" << std::endl;
      // ~ProcessSupervisor would wait on the stuck monitors without a limit.
      std::_Exit(kExitSoftware);
    }
    return kExitOk;
  } catch (const nr::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
#ifdef NDEBUG
    std::cerr << "Internal error: Operation failed." << std::endl;
#else
    std::cerr << "Internal error: " << err.what() << std::endl;
#endif
    return kExitSoftware;
  }
}
