#pragma once
// TSK406_Gateway_Protocol WebSocket listener (Boost.Beast, optional TLS)

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "nr/orchestrator/config.h"
#include "nr/transport/transport_session.h"

namespace nr::transport {

struct ServerOptions {
  std::string bind_address{"127.0.0.1"};
  uint16_t port{8765}; // 0 picks an ephemeral port
  std::vector<std::string> allowed_origins;
  std::optional<orchestrator::TlsMaterial> tls;
  size_t threads{2};
  std::chrono::milliseconds tick_interval{1000};
  std::chrono::seconds handshake_timeout{30};
  size_t max_outbound_bytes{8 * 1024 * 1024}; // per connection; beyond it the peer is dropped
};

// Empty allow list: only loopback origins. A request without an Origin header
// is not a browser and passes; authentication still applies.
bool OriginAllowed(const std::vector<std::string>& allowed, std::string_view origin);

// "Bearer <token>" with a case-insensitive scheme; nullopt for anything else.
std::optional<std::string> ExtractBearerToken(std::string_view authorization);

class GatewayServer {
 public:
  GatewayServer(ServerOptions options, SessionContext context);
  ~GatewayServer();

  GatewayServer(const GatewayServer&) = delete;
  GatewayServer& operator=(const GatewayServer&) = delete;

  // Binds, listens and starts the worker threads. Throws nr::Error{IO} when
  // the endpoint is unusable and nr::Error{Config} for unusable TLS material.
  void Start();
  // Closes every session (cancelling their jobs) and joins the workers.
  void Stop();

  uint16_t port() const noexcept { return bound_port_; }
  size_t session_count();

  // Used by connections; not part of the public surface.
  void Register(const std::shared_ptr<TransportSession>& session);
  const ServerOptions& options() const noexcept { return options_; }
  const SessionContext& context() const noexcept { return context_; }

 private:
  void DoAccept();

  ServerOptions options_;
  SessionContext context_;
  std::unique_ptr<boost::asio::ssl::context> ssl_; // outlives every stream created from it
  boost::asio::io_context ioc_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::vector<std::thread> workers_;
  uint16_t bound_port_{0};
  bool running_{false};

  std::mutex sessions_mutex_;
  std::vector<std::weak_ptr<TransportSession>> sessions_;
};

}  // namespace nr::transport
