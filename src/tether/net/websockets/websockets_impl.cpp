#include "websocket-transport.hpp"

#include "tether/trust/tls-context.hpp"
#include "tether/utils.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

namespace tether::net {

namespace asio = boost::asio;
namespace beast = boost::beast;

namespace detail {
class ClientSession;
}

// This pimpl needs to come first
struct WebsocketTransport::Pimpl {
  const ClientConfig config;
  const shared_ptr<const trust::TrustProvider> trust;
  TransportEvents* events = nullptr;

  std::atomic<TransportState> state{TransportState::UNCONNECTED};
  std::atomic<bool> interrupted{false};

  // Declaration order is destruction order: the session must go before the context
  std::optional<asio::ssl::context> ssl_context;
  asio::io_context io_context;

private:
  std::mutex padlock_;
  shared_ptr<detail::ClientSession> session_ = nullptr;

public:
  std::thread io_thread;

  Pimpl(ClientConfig config_, shared_ptr<const trust::TrustProvider> trust_)
      : config{std::move(config_)}, trust{std::move(trust_)}, io_context{1} {}

  void set_session(shared_ptr<detail::ClientSession> session) {
    std::lock_guard lock{padlock_};
    session_ = std::move(session);
  }

  shared_ptr<detail::ClientSession> session() {
    std::lock_guard lock{padlock_};
    return session_;
  }
};

} // namespace tether::net

namespace tether::net::detail {

// ----------------------------------------------------------------------------------- ClientSession

class ClientSession : public std::enable_shared_from_this<ClientSession> {
private:
  WebsocketTransport::Pimpl& owner_;
  beast::websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
  asio::ip::tcp::resolver resolver_;
  beast::flat_buffer buffer_;
  std::deque<string> outbox_;
  string host_; //! Value of the Host header, once connected

  // Only touched on the strand
  bool connect_done_ = false;
  WebsocketOperation connect_operation_ = WebsocketOperation::CONNECT;
  beast::error_code connect_ec_ = {};
  bool terminal_fired_ = false;

public:
  ClientSession(WebsocketTransport::Pimpl& owner)
      : owner_{owner}, ws_{asio::make_strand(owner.io_context), *owner.ssl_context},
        resolver_{ws_.get_executor()} {}

  bool connect_done() const { return connect_done_; }
  WebsocketOperation connect_operation() const { return connect_operation_; }
  beast::error_code connect_error() const { return connect_ec_; }

  // @{ Connection, driven by the thread blocked in `connect`
  void start() {
    asio::post(ws_.get_executor(), [self = shared_from_this()]() { self->do_resolve(); });
  }

  void cancel() {
    asio::post(ws_.get_executor(), [self = shared_from_this()]() {
      self->resolver_.cancel();
      beast::get_lowest_layer(self->ws_).cancel();
    });
  }

private:
  bool connect_failed(WebsocketOperation operation, beast::error_code ec) {
    if (!ec && owner_.interrupted.load(std::memory_order_acquire))
      ec = asio::error::operation_aborted;
    if (!ec)
      return false;
    connect_done_ = true;
    connect_operation_ = operation;
    connect_ec_ = ec;
    return true;
  }

  void do_resolve() {
    if (connect_failed(WebsocketOperation::CONNECT, {}))
      return;
    const auto& uri = owner_.config.uri;
    TRACE("resolving {}:{}", uri.host, uri.port);
    resolver_.async_resolve(
        uri.host, std::to_string(uri.port),
        beast::bind_front_handler(&ClientSession::on_resolve, shared_from_this()));
  }

  void on_resolve(beast::error_code ec, asio::ip::tcp::resolver::results_type results) {
    if (connect_failed(WebsocketOperation::CONNECT, ec))
      return;

    // Set a timeout on the operation
    beast::get_lowest_layer(ws_).expires_after(owner_.config.connect_timeout);

    // Make the connection on the IP address we get from a lookup
    beast::get_lowest_layer(ws_).async_connect(
        results, beast::bind_front_handler(&ClientSession::on_connect, shared_from_this()));
  }

  void on_connect(beast::error_code ec, asio::ip::tcp::resolver::results_type::endpoint_type ep) {
    if (connect_failed(WebsocketOperation::CONNECT, ec))
      return;

    const auto& host = owner_.config.uri.host;
    beast::get_lowest_layer(ws_).expires_after(owner_.config.connect_timeout);

    // Set SNI Hostname (many hosts need this to handshake successfully), but never for an
    // address literal
    boost::system::error_code address_ec;
    asio::ip::make_address(host, address_ec);
    if (address_ec) {
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
      const bool set_tls_successful =
          SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), host.c_str());
#pragma GCC diagnostic pop
      if (!set_tls_successful) {
        ec = beast::error_code{static_cast<int>(::ERR_get_error()),
                               asio::error::get_ssl_category()};
        connect_failed(WebsocketOperation::HANDSHAKE, ec);
        return;
      }
    }

    if (trust::verifies_peer(*owner_.trust))
      ws_.next_layer().set_verify_callback(asio::ssl::host_name_verification{host});

    // Host HTTP header for the WebSocket handshake.
    // See https://tools.ietf.org/html/rfc7230#section-5.4
    host_ = (ep.address().is_v6() && address_ec == boost::system::error_code{})
                ? format("[{}]:{}", host, ep.port())
                : format("{}:{}", host, ep.port());

    TRACE("tcp connected to {}, starting TLS handshake", host_);

    // Perform the SSL handshake
    ws_.next_layer().async_handshake(
        asio::ssl::stream_base::client,
        beast::bind_front_handler(&ClientSession::on_tls_handshake, shared_from_this()));
  }

  void on_tls_handshake(beast::error_code ec) {
    if (connect_failed(WebsocketOperation::HANDSHAKE, ec))
      return;

    // Turn off the timeout on the tcp_stream, because
    // the websocket stream has its own timeout system.
    beast::get_lowest_layer(ws_).expires_never();

    ws_.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::client));

    // User-Agent, and any headers the relay needs to route the session
    ws_.set_option(beast::websocket::stream_base::decorator(
        [&config = owner_.config](beast::websocket::request_type& req) {
          req.set(beast::http::field::user_agent,
                  format("{} {}", config.user_agent, BOOST_BEAST_VERSION_STRING));
          for (const auto& [name, value] : config.headers)
            req.set(name, value);
        }));

    // Perform the websocket handshake
    ws_.async_handshake(
        host_, owner_.config.uri.target,
        beast::bind_front_handler(&ClientSession::on_ws_handshake, shared_from_this()));
  }

  void on_ws_handshake(beast::error_code ec) {
    if (connect_failed(WebsocketOperation::HANDSHAKE, ec))
      return;
    TRACE("websocket handshake complete, host={}, target={}", host_, owner_.config.uri.target);
    connect_done_ = true;
  }
  // @}

public:
  // @{ Open connection, on the I/O thread
  void run() {
    asio::post(ws_.get_executor(), [self = shared_from_this()]() { self->do_read(); });
  }

  void close(uint16_t code, std::string_view reason) {
    asio::post(ws_.get_executor(),
               [self = shared_from_this(), code, reason = string{reason}]() {
                 self->do_close(code, reason);
               });
  }

  void write(std::string_view text) {
    asio::post(ws_.get_executor(), [self = shared_from_this(), text = string{text}]() mutable {
      self->outbox_.push_back(std::move(text));
      if (self->outbox_.size() == 1)
        self->do_write();
    });
  }
  // @}

private:
  void do_close(uint16_t code, const string& reason) {
    auto expected = TransportState::OPEN;
    if (!owner_.state.compare_exchange_strong(expected, TransportState::CLOSING)) {
      TRACE("close ignored, transport is {}", str(expected));
      return;
    }

    const auto close_reason =
        beast::websocket::close_reason{beast::websocket::close_code{code}, reason};
    ws_.async_close(close_reason,
                    [self = shared_from_this(), code, reason](beast::error_code ec) {
                      if (ec && ec != beast::websocket::error::closed)
                        WARN("error while closing websocket: {}", ec.message());
                      self->owner_.state.store(TransportState::CLOSED);
                      self->fire_close(code, reason, Initiator::LOCAL);
                    });
  }

  void do_read() {
    ws_.async_read(buffer_,
                   beast::bind_front_handler(&ClientSession::on_read, shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    const auto state = owner_.state.load();

    if (ec) {
      if (state != TransportState::OPEN) // the close (or failure) reports itself
        return;

      // This indicates that the session was closed
      if (ec == beast::websocket::error::closed) {
        owner_.state.store(TransportState::CLOSED);
        const auto& reason = ws_.reason();
        fire_close(reason.code, std::string_view{reason.reason.data(), reason.reason.size()},
                   Initiator::REMOTE);
        return;
      }

      fail(WebsocketOperation::READ, ec);
      return;
    }

    if (state == TransportState::OPEN) {
      const auto data = buffer_.data();
      const auto payload =
          std::span<const std::byte>{static_cast<const std::byte*>(data.data()), data.size()};
      const auto kind = ws_.got_text() ? FrameKind::TEXT : FrameKind::BINARY;
      try {
        owner_.events->on_message(payload, kind);
      } catch (std::exception& e) {
        FATAL("callback `on_message` must not throw: {}", e.what());
      } catch (...) {
        FATAL("callback `on_message` must not throw");
      }
    }

    // Clear the buffer
    buffer_.consume(buffer_.size());

    if (owner_.state.load() == TransportState::OPEN)
      do_read();
  }

  void do_write() {
    ws_.text(true);
    ws_.async_write(asio::buffer(outbox_.front()),
                    beast::bind_front_handler(&ClientSession::on_write, shared_from_this()));
  }

  void on_write(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec) {
      outbox_.clear();
      if (owner_.state.load() == TransportState::OPEN)
        fail(WebsocketOperation::WRITE, ec);
      return;
    }

    outbox_.pop_front();
    if (!outbox_.empty())
      do_write();
  }

  void fail(WebsocketOperation operation, beast::error_code ec) {
    const auto prior = owner_.state.exchange(TransportState::FAILED);
    if (prior == TransportState::CLOSED || prior == TransportState::FAILED) {
      owner_.state.store(prior);
      return;
    }

    WARN("websocket {} error: {}", str(operation), ec.message());

    boost::system::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);

    if (terminal_fired_)
      return;
    terminal_fired_ = true;
    try {
      owner_.events->on_error(operation, ec);
    } catch (std::exception& e) {
      FATAL("callback `on_error` must not throw: {}", e.what());
    } catch (...) {
      FATAL("callback `on_error` must not throw");
    }
  }

  void fire_close(uint16_t code, std::string_view reason, Initiator initiator) {
    if (terminal_fired_)
      return;
    terminal_fired_ = true;
    try {
      owner_.events->on_close(code, reason, initiator);
    } catch (std::exception& e) {
      FATAL("callback `on_close` must not throw: {}", e.what());
    } catch (...) {
      FATAL("callback `on_close` must not throw");
    }
  }
};

} // namespace tether::net::detail

namespace tether::net {

// ------------------------------------------------------------------------------------ Construction

WebsocketTransport::WebsocketTransport(ClientConfig config,
                                       shared_ptr<const trust::TrustProvider> trust)
    : pimpl_{make_unique<Pimpl>(std::move(config), std::move(trust))} {
  if (pimpl_->trust == nullptr)
    throw std::invalid_argument{"websocket transport requires a trust provider"};
}

WebsocketTransport::~WebsocketTransport() {
  if (pimpl_->io_thread.joinable() && pimpl_->io_thread.get_id() == std::this_thread::get_id())
    FATAL("websocket transport destroyed from within one of its own callbacks");

  pimpl_->io_context.stop();
  if (pimpl_->io_thread.joinable())
    pimpl_->io_thread.join();
}

void WebsocketTransport::set_events(TransportEvents& events) { pimpl_->events = &events; }

// ----------------------------------------------------------------------------------------- connect

void WebsocketTransport::connect() {
  auto& P = *pimpl_;

  auto expected = TransportState::UNCONNECTED;
  if (!P.state.compare_exchange_strong(expected, TransportState::CONNECTING))
    throw std::logic_error{format("connect called on a transport that is {}", str(expected))};

  if (P.events == nullptr) {
    P.state.store(TransportState::FAILED);
    throw std::logic_error{"connect called before set_events"};
  }

  if (P.interrupted.load(std::memory_order_acquire)) {
    P.state.store(TransportState::FAILED);
    INFO("connect interrupted before it started");
    throw SessionError{ecode::interrupted_connect, "connect interrupted"};
  }

  try {
    P.ssl_context.emplace(trust::make_tls_client_context(*P.trust));
  } catch (const SessionError& e) {
    P.state.store(TransportState::FAILED);
    throw SessionError{ecode::handshake_failure, e.what()};
  }

  const auto& uri = P.config.uri;
  INFO("connecting to wss://{}:{}{}, trust provider is '{}'", uri.host, uri.port, uri.target,
       P.trust->name());

  auto session = make_shared<detail::ClientSession>(P);
  P.set_session(session);
  session->start();

  // Drive the connection on this thread, until it completes or fails
  while (!session->connect_done() && P.io_context.run_one()) {}

  if (!session->connect_done() || session->connect_error()) {
    P.state.store(TransportState::FAILED);
    const auto ec = session->connect_error();
    if (P.interrupted.load(std::memory_order_acquire)) {
      INFO("connect to {}:{} interrupted", uri.host, uri.port);
      throw SessionError{ecode::interrupted_connect, "connect interrupted"};
    }
    LOG_ERR("{} failed: {}", str(session->connect_operation()), ec.message());
    throw SessionError{ecode::handshake_failure,
                       format("{} to {}:{} failed: {}", str(session->connect_operation()),
                              uri.host, uri.port, ec.message())};
  }

  P.state.store(TransportState::OPEN);
  P.events->on_open();

  session->run();
  P.io_thread = std::thread{[&P]() {
    P.io_context.run();
    TRACE("websocket I/O thread exiting");
  }};
}

// ------------------------------------------------------------------------------------------ others

void WebsocketTransport::send(std::string_view text) {
  const auto state = pimpl_->state.load();
  if (state != TransportState::OPEN)
    throw std::logic_error{format("send called on a transport that is {}", str(state))};
  auto session = pimpl_->session();
  Expects(session != nullptr);
  session->write(text);
}

void WebsocketTransport::close(uint16_t code, std::string_view reason) {
  auto state = pimpl_->state.load();
  if (state == TransportState::UNCONNECTED &&
      pimpl_->state.compare_exchange_strong(state, TransportState::CLOSED))
    return;

  if (state == TransportState::CONNECTING) {
    interrupt();
    return;
  }

  if (state != TransportState::OPEN)
    return; // already closing, or finished

  auto session = pimpl_->session();
  if (session != nullptr)
    session->close(code, reason);
}

void WebsocketTransport::interrupt() {
  const auto state = pimpl_->state.load();
  if (state != TransportState::UNCONNECTED && state != TransportState::CONNECTING)
    return;
  pimpl_->interrupted.store(true, std::memory_order_release);
  auto session = pimpl_->session();
  if (session != nullptr)
    session->cancel();
}

TransportState WebsocketTransport::state() const { return pimpl_->state.load(); }

SteadyTimerFactory WebsocketTransport::timer_factory() {
  return make_steady_timer_factory(pimpl_->io_context);
}

} // namespace tether::net
