#include "nr/transport/websocket_server.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <algorithm>
#include <cctype>
#include <deque>
#include <type_traits>

#include "nr/error.h"
#include "nr/errors.h"
#include "nr/orchestrator/event_bus.h"
#include "nr/transport/protocol.h"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

using namespace nr::orchestrator;

namespace nr::transport {

namespace {

constexpr std::string_view kServerName{"nrgated"};
constexpr auto kShutdownDrain = std::chrono::seconds(2);

void PublishServerEvent(std::string_view event_id, EventSeverity severity,
                        std::string_view message, std::vector<EventField> fields = {}) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = std::string(event_id);
  event.message = std::string(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

std::string_view View(beast::string_view text) { return {text.data(), text.size()}; }

bool IsLoopback(const net::ip::address& address) {
  if (address.is_loopback()) {
    return true;
  }
  if (address.is_v6() && address.to_v6().is_v4_mapped()) {
    return net::ip::make_address_v4(net::ip::v4_mapped, address.to_v6()).is_loopback();
  }
  return false;
}

websocket::close_code CloseCodeFor(std::string_view reason) {
  if (reason == "malformed_message" || reason == "message_too_large") {
    return websocket::close_code::protocol_error;
  }
  if (reason == "server_shutdown") {
    return websocket::close_code::going_away;
  }
  if (reason == "local_only" || reason == "token_expired" || reason == "slow_consumer") {
    return websocket::close_code::policy_error;
  }
  return websocket::close_code::normal;
}

template <class Connection>
class WeakOutbound final : public Outbound {
 public:
  explicit WeakOutbound(std::weak_ptr<Connection> connection) : connection_(std::move(connection)) {}

  void Send(std::string message) override {
    if (auto connection = connection_.lock()) {
      connection->QueueSend(std::move(message));
    }
  }

  void Close(std::string_view reason) override {
    if (auto connection = connection_.lock()) {
      connection->QueueClose(std::string(reason));
    }
  }

 private:
  std::weak_ptr<Connection> connection_;
};

// One accepted socket: optional TLS handshake, HTTP upgrade with Origin and
// Authorization checks, then a websocket read loop feeding a TransportSession.
// Every handler runs on the socket's strand.
template <bool kTls>
class Connection : public std::enable_shared_from_this<Connection<kTls>> {
 public:
  using Stream = std::conditional_t<kTls, websocket::stream<beast::ssl_stream<beast::tcp_stream>>,
                                    websocket::stream<beast::tcp_stream>>;

  Connection(tcp::socket&& socket, GatewayServer& server, ssl::context* tls)
      : server_(server), timer_(socket.get_executor()) {
    if constexpr (kTls) {
      stream_ = std::make_unique<Stream>(std::move(socket), *tls);
    } else {
      (void)tls;
      stream_ = std::make_unique<Stream>(std::move(socket));
    }
  }

  void Run() {
    net::dispatch(stream_->get_executor(),
                  beast::bind_front_handler(&Connection::OnRun, this->shared_from_this()));
  }

  void QueueSend(std::string message) {
    net::post(stream_->get_executor(),
              [self = this->shared_from_this(), message = std::move(message)]() mutable {
                self->OnQueueSend(std::move(message));
              });
  }

  void QueueClose(std::string reason) {
    net::post(stream_->get_executor(),
              [self = this->shared_from_this(), reason = std::move(reason)]() mutable {
                self->OnQueueClose(std::move(reason));
              });
  }

 private:
  void OnRun() {
    beast::get_lowest_layer(*stream_).expires_after(server_.options().handshake_timeout);
    if constexpr (kTls) {
      stream_->next_layer().async_handshake(
          ssl::stream_base::server,
          beast::bind_front_handler(&Connection::OnTlsHandshake, this->shared_from_this()));
    } else {
      DoReadRequest();
    }
  }

  void OnTlsHandshake(beast::error_code ec) {
    if (ec) {
      return;
    }
    DoReadRequest();
  }

  void DoReadRequest() {
    http::async_read(stream_->next_layer(), buffer_, request_,
                     beast::bind_front_handler(&Connection::OnRequest, this->shared_from_this()));
  }

  void OnRequest(beast::error_code ec, std::size_t) {
    if (ec) {
      return;
    }
    if (!websocket::is_upgrade(request_)) {
      RejectHttp(http::status::bad_request, "websocket upgrade required");
      return;
    }
    if (!OriginAllowed(server_.options().allowed_origins, View(request_[http::field::origin]))) {
      std::vector<EventField> fields;
      fields.emplace_back("origin", std::string(View(request_[http::field::origin])),
                          FieldPrivacy::kHash);
      PublishServerEvent("origin_rejected", EventSeverity::kWarning,
                         "Upgrade rejected for origin", std::move(fields));
      RejectHttp(http::status::forbidden, errors::msg::kOriginRejected);
      return;
    }
    bearer_ = ExtractBearerToken(View(request_[http::field::authorization]));

    beast::get_lowest_layer(*stream_).expires_never();
    stream_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    stream_->set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
      res.set(http::field::server, std::string(kServerName));
    }));
    stream_->read_message_max(kMaxClientMessageBytes);
    stream_->async_accept(request_,
                          beast::bind_front_handler(&Connection::OnAccept, this->shared_from_this()));
  }

  void RejectHttp(http::status status, std::string_view body) {
    auto response = std::make_shared<http::response<http::string_body>>(status, request_.version());
    response->set(http::field::server, std::string(kServerName));
    response->set(http::field::content_type, "text/plain");
    response->keep_alive(false);
    response->body() = std::string(body);
    response->prepare_payload();
    http::async_write(stream_->next_layer(), *response,
                      [self = this->shared_from_this(), response](beast::error_code, std::size_t) {
                        beast::error_code ignored;
                        beast::get_lowest_layer(*self->stream_).socket().shutdown(
                            tcp::socket::shutdown_send, ignored);
                      });
  }

  void OnAccept(beast::error_code ec) {
    if (ec) {
      return;
    }
    beast::error_code endpoint_ec;
    const auto remote = beast::get_lowest_layer(*stream_).socket().remote_endpoint(endpoint_ec);
    if (endpoint_ec) {
      return;
    }
    PeerInfo peer;
    peer.address = remote.address().to_string();
    peer.loopback = IsLoopback(remote.address());
    peer.bearer_token = std::move(bearer_);
    bearer_.reset();

    auto outbound = std::make_shared<WeakOutbound<Connection>>(this->weak_from_this());
    session_ = std::make_shared<TransportSession>(server_.context(), std::move(peer), outbound);
    server_.Register(session_);
    session_->Open();
    ScheduleTick();
    DoRead();
  }

  void DoRead() {
    stream_->async_read(buffer_,
                        beast::bind_front_handler(&Connection::OnRead, this->shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec) {
      Finish(ec == websocket::error::message_too_big ? "message_too_large" : "disconnected");
      return;
    }
    if (!stream_->got_text()) {
      buffer_.consume(buffer_.size());
      OnQueueSend(ErrorMessage(TransportReasonCode(errors::transport::kMalformedMessage),
                               errors::msg::kMalformedMessage));
      Finish("malformed_message");
      return;
    }
    const std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    session_->HandleMessage(text);
    if (!close_started_) {
      DoRead();
    }
  }

  void OnQueueSend(std::string message) {
    if (close_started_ || dropping_) {
      return;
    }
    queued_bytes_ += message.size();
    if (queued_bytes_ > server_.options().max_outbound_bytes) {
      PublishServerEvent("slow_consumer", EventSeverity::kWarning,
                         "Outbound queue limit reached, dropping connection");
      dropping_ = true;
      // The front buffer backs the write in flight; OnWrite releases it.
      const size_t keep = writing_ ? 1 : 0;
      while (queue_.size() > keep) {
        queue_.pop_back();
      }
      queued_bytes_ = queue_.empty() ? 0 : queue_.front().size();
      Finish("slow_consumer");
      return;
    }
    queue_.push_back(std::move(message));
    if (!writing_) {
      DoWrite();
    }
  }

  void DoWrite() {
    writing_ = true;
    stream_->text(true);
    stream_->async_write(net::buffer(queue_.front()),
                         beast::bind_front_handler(&Connection::OnWrite, this->shared_from_this()));
  }

  void OnWrite(beast::error_code ec, std::size_t) {
    writing_ = false;
    if (ec) {
      queue_.clear();
      queued_bytes_ = 0;
      Finish("disconnected");
      return;
    }
    if (!queue_.empty()) {
      queued_bytes_ -= std::min(queued_bytes_, queue_.front().size());
      queue_.pop_front();
    }
    if (!queue_.empty()) {
      DoWrite();
    } else if (close_pending_) {
      DoClose();
    }
  }

  void OnQueueClose(std::string reason) {
    if (close_pending_ || close_started_) {
      return;
    }
    close_pending_ = true;
    close_reason_ = std::move(reason);
    if (!writing_) {
      DoClose();
    }
  }

  void DoClose() {
    if (close_started_) {
      return;
    }
    close_started_ = true;
    timer_.cancel();
    websocket::close_reason reason(CloseCodeFor(close_reason_));
    reason.reason.assign(close_reason_.data(), std::min<size_t>(close_reason_.size(), 64));
    stream_->async_close(reason, [self = this->shared_from_this()](beast::error_code) {});
  }

  // The session decides; the socket follows through the outbound Close.
  void Finish(std::string_view reason) {
    timer_.cancel();
    if (session_) {
      session_->Close(reason);
    }
  }

  void ScheduleTick() {
    timer_.expires_after(server_.options().tick_interval);
    timer_.async_wait(beast::bind_front_handler(&Connection::OnTick, this->shared_from_this()));
  }

  void OnTick(beast::error_code ec) {
    if (ec || close_started_ || !session_) {
      return;
    }
    session_->Tick();
    if (session_->state() != SessionState::kClosed) {
      ScheduleTick();
    }
  }

  GatewayServer& server_;
  net::steady_timer timer_;
  std::unique_ptr<Stream> stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> request_;
  std::optional<std::string> bearer_;
  std::shared_ptr<TransportSession> session_;
  std::deque<std::string> queue_;
  size_t queued_bytes_{0};
  bool writing_{false};
  bool dropping_{false}; // slow consumer: nothing more is queued
  bool close_pending_{false};
  bool close_started_{false};
  std::string close_reason_;
};

}  // namespace

bool OriginAllowed(const std::vector<std::string>& allowed, std::string_view origin) {
  if (origin.empty()) {
    return true;
  }
  std::string normalized = Lower(Trim(origin));
  while (!normalized.empty() && normalized.back() == '/') {
    normalized.pop_back();
  }
  if (!allowed.empty()) {
    for (const auto& entry : allowed) {
      std::string candidate = Lower(Trim(entry));
      while (!candidate.empty() && candidate.back() == '/') {
        candidate.pop_back();
      }
      if (!candidate.empty() && candidate == normalized) {
        return true;
      }
    }
    return false;
  }

  std::string_view rest(normalized);
  if (rest.rfind("http://", 0) == 0) {
    rest.remove_prefix(7);
  } else if (rest.rfind("https://", 0) == 0) {
    rest.remove_prefix(8);
  } else {
    return false;
  }
  std::string_view host;
  if (!rest.empty() && rest.front() == '[') {
    const auto closing = rest.find(']');
    if (closing == std::string_view::npos) {
      return false;
    }
    host = rest.substr(0, closing + 1);
    rest.remove_prefix(closing + 1);
  } else {
    const auto end = rest.find_first_of(":/");
    host = rest.substr(0, end);
    rest.remove_prefix(end == std::string_view::npos ? rest.size() : end);
  }
  if (!rest.empty() && rest.front() != ':') {
    return false;
  }
  return host == "localhost" || host == "127.0.0.1" || host == "[::1]";
}

std::optional<std::string> ExtractBearerToken(std::string_view authorization) {
  authorization = Trim(authorization);
  constexpr std::string_view kScheme{"bearer"};
  if (authorization.size() <= kScheme.size() ||
      Lower(authorization.substr(0, kScheme.size())) != kScheme ||
      (authorization[kScheme.size()] != ' ' && authorization[kScheme.size()] != '\t')) {
    return std::nullopt;
  }
  const auto token = Trim(authorization.substr(kScheme.size()));
  if (token.empty() || token.find_first_of(" \t") != std::string_view::npos) {
    return std::nullopt;
  }
  return std::string(token);
}

GatewayServer::GatewayServer(ServerOptions options, SessionContext context)
    : options_(std::move(options)), context_(std::move(context)) {
  if (options_.threads == 0) {
    options_.threads = 1;
  }
}

GatewayServer::~GatewayServer() { Stop(); }

void GatewayServer::Start() {
  if (running_) {
    return;
  }
  if (options_.tls) {
    ssl_ = std::make_unique<ssl::context>(ssl::context::tls_server);
    try {
      ssl_->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                        ssl::context::no_sslv3 | ssl::context::no_tlsv1 |
                        ssl::context::no_tlsv1_1 | ssl::context::single_dh_use);
      ssl_->use_certificate_chain_file(options_.tls->certificate.string());
      ssl_->use_private_key_file(options_.tls->private_key.string(), ssl::context::pem);
    } catch (const boost::system::system_error& ex) {
      throw Error(ErrorDomain::Config, errors::config::kUnreadableFile,
                  "TLS certificate or key could not be loaded", ex.code().value());
    }
  }

  boost::system::error_code ec;
  const auto address = net::ip::make_address(options_.bind_address, ec);
  if (ec) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                "Invalid bind address: " + options_.bind_address);
  }
  const tcp::endpoint endpoint(address, options_.port);
  acceptor_ = std::make_unique<tcp::acceptor>(net::make_strand(ioc_));
  auto fail = [&](std::string_view step) {
    throw Error(ErrorDomain::IO, errors::Make(ErrorDomain::IO, 0x01),
                "Listener " + std::string(step) + " failed: " + ec.message(), ec.value(),
                Retryability::kTransient);
  };
  acceptor_->open(endpoint.protocol(), ec);
  if (ec) {
    fail("open");
  }
  acceptor_->set_option(net::socket_base::reuse_address(true), ec);
  if (ec) {
    fail("setsockopt");
  }
  acceptor_->bind(endpoint, ec);
  if (ec) {
    fail("bind");
  }
  acceptor_->listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    fail("listen");
  }
  bound_port_ = acceptor_->local_endpoint(ec).port();
  running_ = true;
  DoAccept();

  for (size_t i = 0; i < options_.threads; ++i) {
    workers_.emplace_back([this]() {
      for (;;) {
        try {
          ioc_.run();
          break;
        } catch (const std::exception& ex) {
          std::vector<EventField> fields;
          fields.emplace_back("what", ex.what(), FieldPrivacy::kHash);
          PublishServerEvent("io_handler_failed", EventSeverity::kError,
                             "Connection handler threw", std::move(fields));
        }
      }
    });
  }

  std::vector<EventField> fields;
  fields.emplace_back("bind", options_.bind_address);
  fields.emplace_back("port", std::to_string(bound_port_), FieldPrivacy::kPublic, true);
  fields.emplace_back("tls", options_.tls ? "true" : "false");
  fields.emplace_back("local_only", context_.local_only ? "true" : "false");
  PublishServerEvent("server_listening", EventSeverity::kInfo, "Gateway listening",
                     std::move(fields));
}

void GatewayServer::DoAccept() {
  acceptor_->async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec == net::error::operation_aborted) {
        return;
      }
      std::vector<EventField> fields;
      fields.emplace_back("error", ec.message());
      PublishServerEvent("accept_failed", EventSeverity::kWarning, "Accept failed",
                         std::move(fields));
    } else if (ssl_) {
      std::make_shared<Connection<true>>(std::move(socket), *this, ssl_.get())->Run();
    } else {
      std::make_shared<Connection<false>>(std::move(socket), *this, nullptr)->Run();
    }
    if (acceptor_->is_open()) {
      DoAccept();
    }
  });
}

void GatewayServer::Register(const std::shared_ptr<TransportSession>& session) {
  std::lock_guard<std::mutex> guard(sessions_mutex_);
  sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                 [](const auto& weak) { return weak.expired(); }),
                  sessions_.end());
  sessions_.push_back(session);
}

size_t GatewayServer::session_count() {
  std::lock_guard<std::mutex> guard(sessions_mutex_);
  size_t count = 0;
  for (const auto& weak : sessions_) {
    auto session = weak.lock();
    if (session && session->state() != SessionState::kClosed) {
      ++count;
    }
  }
  return count;
}

void GatewayServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  net::post(acceptor_->get_executor(), [this]() {
    boost::system::error_code ignored;
    acceptor_->close(ignored);
  });

  std::vector<std::shared_ptr<TransportSession>> live;
  {
    std::lock_guard<std::mutex> guard(sessions_mutex_);
    for (const auto& weak : sessions_) {
      if (auto session = weak.lock()) {
        live.push_back(std::move(session));
      }
    }
    sessions_.clear();
  }
  for (const auto& session : live) {
    session->Close("server_shutdown");
  }
  live.clear();

  // Close frames get a short window to flush before the loop is stopped.
  auto deadline = std::make_shared<net::steady_timer>(ioc_, kShutdownDrain);
  deadline->async_wait([this, deadline](beast::error_code) { ioc_.stop(); });
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  PublishServerEvent("server_stopped", EventSeverity::kInfo, "Gateway stopped");
}

}  // namespace nr::transport
