#include "relay-stub.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>

#ifndef TETHER_TEST_CERTIFICATE_DIR
#define TETHER_TEST_CERTIFICATE_DIR "testcases/assets/test-certificate"
#endif

namespace tether::test {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

string test_certificate_path(std::string_view filename) {
  return join_path(TETHER_TEST_CERTIFICATE_DIR, filename);
}

namespace {

string to_string(beast::string_view s) { return string{s.data(), s.size()}; }

// ------------------------------------------------------------------------------------------ Shared

// What the tests observe, written by the I/O thread
struct Shared {
  mutable std::mutex padlock;
  std::condition_variable cv;
  bool connected = false;
  bool disconnected = false;
  std::deque<string> messages;
  std::map<string, string, std::less<>> headers;
  string target;

  void update(std::function<void(Shared&)> fn) {
    {
      std::lock_guard lock{padlock};
      fn(*this);
    }
    cv.notify_all();
  }
};

// ----------------------------------------------------------------------------------- StubSession

class StubSession : public std::enable_shared_from_this<StubSession> {
private:
  beast::websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
  shared_ptr<Shared> shared_;
  const bool reject_upgrade_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> request_;
  http::response<http::string_body> response_;
  std::deque<std::pair<string, bool>> outbox_; // (payload, is-text)

public:
  StubSession(asio::ip::tcp::socket&& socket, asio::ssl::context& ctx, shared_ptr<Shared> shared,
              bool reject_upgrade)
      : ws_{std::move(socket), ctx}, shared_{std::move(shared)}, reject_upgrade_{reject_upgrade} {}

  void run() {
    asio::dispatch(ws_.get_executor(),
                   beast::bind_front_handler(&StubSession::on_run, shared_from_this()));
  }

  void send(string payload, bool is_text) {
    asio::post(ws_.get_executor(),
               [self = shared_from_this(), payload = std::move(payload), is_text]() mutable {
                 self->outbox_.emplace_back(std::move(payload), is_text);
                 if (self->outbox_.size() == 1)
                   self->do_write();
               });
  }

  void close(uint16_t code, string reason) {
    asio::post(ws_.get_executor(), [self = shared_from_this(), code, reason]() {
      self->ws_.async_close(
          beast::websocket::close_reason{beast::websocket::close_code{code}, reason},
          [self](beast::error_code ec) {
            if (ec)
              TRACE("relay stub close: {}", ec.message());
            self->finish();
          });
    });
  }

  void drop() {
    asio::post(ws_.get_executor(), [self = shared_from_this()]() {
      beast::error_code ignored;
      beast::get_lowest_layer(self->ws_).socket().shutdown(asio::ip::tcp::socket::shutdown_both,
                                                           ignored);
      beast::get_lowest_layer(self->ws_).socket().close(ignored);
      self->finish();
    });
  }

private:
  void finish() {
    shared_->update([](Shared& s) { s.disconnected = true; });
  }

  void on_run() {
    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    ws_.next_layer().async_handshake(
        asio::ssl::stream_base::server,
        beast::bind_front_handler(&StubSession::on_tls_handshake, shared_from_this()));
  }

  void on_tls_handshake(beast::error_code ec) {
    if (ec) {
      TRACE("relay stub TLS handshake: {}", ec.message());
      return finish();
    }
    // Read the upgrade request ourselves, so that its headers can be inspected
    http::async_read(ws_.next_layer(), buffer_, request_,
                     beast::bind_front_handler(&StubSession::on_upgrade_request,
                                               shared_from_this()));
  }

  void on_upgrade_request(beast::error_code ec, std::size_t) {
    if (ec) {
      TRACE("relay stub reading upgrade: {}", ec.message());
      return finish();
    }

    shared_->update([this](Shared& s) {
      s.headers.clear();
      for (const auto& field : request_)
        s.headers.insert_or_assign(to_lower_copy(to_string(field.name_string())),
                                   to_string(field.value()));
      s.target = to_string(request_.target());
    });

    if (reject_upgrade_) {
      response_ = http::response<http::string_body>{http::status::forbidden, request_.version()};
      response_.set(http::field::content_type, "text/plain");
      response_.body() = "debug session rejected";
      response_.prepare_payload();
      http::async_write(ws_.next_layer(), response_,
                        [self = shared_from_this()](beast::error_code, std::size_t) {
                          beast::error_code ignored;
                          beast::get_lowest_layer(self->ws_).socket().close(ignored);
                          self->finish();
                        });
      return;
    }

    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.async_accept(request_,
                     beast::bind_front_handler(&StubSession::on_accept, shared_from_this()));
  }

  void on_accept(beast::error_code ec) {
    if (ec) {
      TRACE("relay stub accept: {}", ec.message());
      return finish();
    }
    shared_->update([](Shared& s) { s.connected = true; });
    do_read();
  }

  void do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&StubSession::on_read, shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec) {
      TRACE("relay stub read: {}", ec.message());
      return finish();
    }
    auto message = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    shared_->update([&message](Shared& s) { s.messages.push_back(std::move(message)); });
    do_read();
  }

  void do_write() {
    ws_.text(outbox_.front().second);
    ws_.async_write(asio::buffer(outbox_.front().first),
                    beast::bind_front_handler(&StubSession::on_write, shared_from_this()));
  }

  void on_write(beast::error_code ec, std::size_t) {
    if (ec) {
      TRACE("relay stub write: {}", ec.message());
      outbox_.clear();
      return;
    }
    outbox_.pop_front();
    if (!outbox_.empty())
      do_write();
  }
};

} // namespace

// ------------------------------------------------------------------------------------------- Pimpl

struct RelayStub::Pimpl {
  const Config config;
  asio::ssl::context ssl_context{asio::ssl::context::tls_server};
  asio::io_context io_context{1};
  asio::ip::tcp::acceptor acceptor{asio::make_strand(io_context)};
  shared_ptr<Shared> shared = make_shared<Shared>();
  std::mutex padlock;
  shared_ptr<StubSession> session = nullptr;
  std::thread thread;

  explicit Pimpl(Config config_) : config{std::move(config_)} {
    ssl_context.set_options(asio::ssl::context::default_workarounds |
                            asio::ssl::context::no_sslv2 | asio::ssl::context::no_sslv3);
    ssl_context.use_certificate_chain_file(config.certificate_chain_file);
    ssl_context.use_private_key_file(config.private_key_file, asio::ssl::context::pem);

    const auto endpoint = asio::ip::tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0};
    acceptor.open(endpoint.protocol());
    acceptor.set_option(asio::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(asio::socket_base::max_listen_connections);

    do_accept();
    thread = std::thread{[this]() { io_context.run(); }};
  }

  ~Pimpl() {
    io_context.stop();
    if (thread.joinable())
      thread.join();
  }

  void do_accept() {
    acceptor.async_accept(asio::make_strand(io_context),
                          [this](beast::error_code ec, asio::ip::tcp::socket socket) {
                            if (ec) {
                              TRACE("relay stub accept: {}", ec.message());
                              return;
                            }
                            shared->update([](Shared& s) {
                              s.connected = false;
                              s.disconnected = false;
                            });
                            auto next = make_shared<StubSession>(std::move(socket), ssl_context,
                                                                 shared, config.reject_upgrade);
                            {
                              std::lock_guard lock{padlock};
                              session = next;
                            }
                            next->run();
                            do_accept();
                          });
  }

  shared_ptr<StubSession> current() {
    std::lock_guard lock{padlock};
    return session;
  }
};

// ------------------------------------------------------------------------------------ Construction

RelayStub::RelayStub() : RelayStub{Config{}} {}

RelayStub::RelayStub(Config config) : pimpl_{make_unique<Pimpl>(std::move(config))} {}

RelayStub::~RelayStub() = default;

uint16_t RelayStub::port() const { return pimpl_->acceptor.local_endpoint().port(); }

string RelayStub::uri(std::string_view target) const {
  return format("wss://localhost:{}{}", port(), target);
}

// ----------------------------------------------------------------------------------- Observation

bool RelayStub::wait_for_client(std::chrono::milliseconds timeout) {
  auto& S = *pimpl_->shared;
  std::unique_lock lock{S.padlock};
  return S.cv.wait_for(lock, timeout, [&S]() { return S.connected; });
}

std::optional<string> RelayStub::request_header(std::string_view name) const {
  auto& S = *pimpl_->shared;
  std::lock_guard lock{S.padlock};
  const auto ii = S.headers.find(to_lower_copy(string{name}));
  if (ii == S.headers.end())
    return std::nullopt;
  return ii->second;
}

string RelayStub::request_target() const {
  auto& S = *pimpl_->shared;
  std::lock_guard lock{S.padlock};
  return S.target;
}

std::optional<string> RelayStub::next_message(std::chrono::milliseconds timeout) {
  auto& S = *pimpl_->shared;
  std::unique_lock lock{S.padlock};
  if (!S.cv.wait_for(lock, timeout, [&S]() { return !S.messages.empty(); }))
    return std::nullopt;
  auto out = std::move(S.messages.front());
  S.messages.pop_front();
  return out;
}

std::size_t RelayStub::pending_messages() const {
  auto& S = *pimpl_->shared;
  std::lock_guard lock{S.padlock};
  return S.messages.size();
}

bool RelayStub::wait_for_disconnect(std::chrono::milliseconds timeout) {
  auto& S = *pimpl_->shared;
  std::unique_lock lock{S.padlock};
  return S.cv.wait_for(lock, timeout, [&S]() { return S.disconnected; });
}

// --------------------------------------------------------------------------------------- Actions

void RelayStub::send_text(string text) {
  if (auto session = pimpl_->current())
    session->send(std::move(text), true);
}

void RelayStub::send_binary(string bytes) {
  if (auto session = pimpl_->current())
    session->send(std::move(bytes), false);
}

void RelayStub::close(uint16_t code, string reason) {
  if (auto session = pimpl_->current())
    session->close(code, std::move(reason));
}

void RelayStub::drop() {
  if (auto session = pimpl_->current())
    session->drop();
}

} // namespace tether::test
