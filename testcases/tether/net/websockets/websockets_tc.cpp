#include "tether/net/websockets/websocket-transport.hpp"
#include "tether/trust/tls-context.hpp"

#include "support/relay-stub.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <catch2/catch.hpp>

#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

namespace tether::test {

using namespace std::chrono_literals;

// ------------------------------------------------------------------------------- RecordingEvents

class RecordingEvents : public net::TransportEvents {
private:
  mutable std::mutex padlock_;
  std::condition_variable cv_;

public:
  int opens = 0;
  int terminals = 0;
  std::thread::id open_thread_id = {};
  vector<std::pair<string, net::FrameKind>> messages;
  uint16_t close_code = 0;
  string close_reason;
  std::optional<net::Initiator> close_initiator;
  std::optional<net::WebsocketOperation> error_operation;

  void on_open() override {
    std::lock_guard lock{padlock_};
    ++opens;
    open_thread_id = std::this_thread::get_id();
  }

  void on_message(std::span<const std::byte> payload, net::FrameKind kind) override {
    {
      std::lock_guard lock{padlock_};
      messages.emplace_back(string{reinterpret_cast<const char*>(payload.data()), payload.size()},
                            kind);
    }
    cv_.notify_all();
  }

  void on_close(uint16_t code, std::string_view reason, net::Initiator initiator) override {
    {
      std::lock_guard lock{padlock_};
      ++terminals;
      close_code = code;
      close_reason = string{reason};
      close_initiator = initiator;
    }
    cv_.notify_all();
  }

  void on_error(net::WebsocketOperation operation, std::error_code ec) override {
    {
      std::lock_guard lock{padlock_};
      ++terminals;
      error_operation = operation;
    }
    cv_.notify_all();
  }

  bool wait_for_messages(std::size_t count, std::chrono::milliseconds timeout = 10s) {
    std::unique_lock lock{padlock_};
    return cv_.wait_for(lock, timeout, [&]() { return messages.size() >= count; });
  }

  bool wait_for_terminal(std::chrono::milliseconds timeout = 10s) {
    std::unique_lock lock{padlock_};
    return cv_.wait_for(lock, timeout, [&]() { return terminals > 0; });
  }
};

// ---------------------------------------------------------------------------------------- helpers

static net::ClientConfig make_config(const RelayStub& stub, std::string_view target = "/") {
  net::ClientConfig config;
  config.uri = *net::parse_websocket_uri(stub.uri(target));
  config.user_agent = "tether-test";
  config.connect_timeout = 5s;
  return config;
}

static shared_ptr<const trust::TrustProvider> verify_against(std::string_view ca_filename) {
  string pem;
  CATCH_REQUIRE(!file_get_contents(test_certificate_path(ca_filename), pem));
  return make_shared<trust::FixedTrustProvider>(std::nullopt,
                                                trust::TrustMaterial{.certificate_authorities_pem = {pem}});
}

static error_code connect_error(net::WebsocketTransport& transport) {
  try {
    transport.connect();
  } catch (const SessionError& e) {
    return e.code();
  }
  return {};
}

// ----------------------------------------------------------------------------- trust-all session

CATCH_TEST_CASE("websocket-transport", "[websockets]") {
  RelayStub stub;

  CATCH_SECTION("trust-all-round-trip") {
    auto config = make_config(stub, "/debug?session=42");
    config.headers = {{"X-Debug-Token", "abc123"}};

    RecordingEvents events;
    net::WebsocketTransport transport{config, make_shared<trust::TrustAllProvider>()};
    transport.set_events(events);
    CATCH_REQUIRE(transport.state() == net::TransportState::UNCONNECTED);

    transport.connect();
    CATCH_REQUIRE(transport.state() == net::TransportState::OPEN);
    CATCH_REQUIRE(events.opens == 1);
    CATCH_REQUIRE(events.open_thread_id == std::this_thread::get_id());

    CATCH_REQUIRE(stub.wait_for_client());
    CATCH_REQUIRE(stub.request_target() == "/debug?session=42");
    CATCH_REQUIRE(stub.request_header("X-Debug-Token") == std::optional<string>{"abc123"});
    CATCH_REQUIRE(stub.request_header("User-Agent").value_or("").starts_with("tether-test"));

    stub.send_text("hello");
    CATCH_REQUIRE(events.wait_for_messages(1));
    CATCH_REQUIRE(events.messages[0].first == "hello");
    CATCH_REQUIRE(events.messages[0].second == net::FrameKind::TEXT);

    transport.send("first");
    transport.send("second");
    CATCH_REQUIRE(stub.next_message() == std::optional<string>{"first"});
    CATCH_REQUIRE(stub.next_message() == std::optional<string>{"second"});

    transport.close(1000, "done");
    transport.close(1000, "done again");
    CATCH_REQUIRE(events.wait_for_terminal());
    CATCH_REQUIRE(events.close_initiator == net::Initiator::LOCAL);
    CATCH_REQUIRE(events.close_code == 1000);
    CATCH_REQUIRE(transport.state() == net::TransportState::CLOSED);

    transport.close();
    std::this_thread::sleep_for(100ms);
    CATCH_REQUIRE(events.terminals == 1);
    CATCH_REQUIRE_THROWS_AS(transport.send("late"), std::logic_error);
  }

  CATCH_SECTION("binary-frames-are-delivered-whole") {
    RecordingEvents events;
    net::WebsocketTransport transport{make_config(stub), make_shared<trust::TrustAllProvider>()};
    transport.set_events(events);
    transport.connect();
    CATCH_REQUIRE(stub.wait_for_client());

    string bytes(70000, '\0');
    for (std::size_t i = 0; i < bytes.size(); ++i)
      bytes[i] = static_cast<char>(i % 251);
    stub.send_binary(bytes);

    CATCH_REQUIRE(events.wait_for_messages(1));
    CATCH_REQUIRE(events.messages[0].second == net::FrameKind::BINARY);
    CATCH_REQUIRE(events.messages[0].first == bytes);
    transport.close();
    CATCH_REQUIRE(events.wait_for_terminal());
  }

  CATCH_SECTION("remote-close") {
    RecordingEvents events;
    net::WebsocketTransport transport{make_config(stub), make_shared<trust::TrustAllProvider>()};
    transport.set_events(events);
    transport.connect();
    CATCH_REQUIRE(stub.wait_for_client());

    stub.close(4000, "relay going away");
    CATCH_REQUIRE(events.wait_for_terminal());
    CATCH_REQUIRE(events.close_initiator == net::Initiator::REMOTE);
    CATCH_REQUIRE(events.close_code == 4000);
    CATCH_REQUIRE(events.close_reason == "relay going away");
    CATCH_REQUIRE(transport.state() == net::TransportState::CLOSED);
    CATCH_REQUIRE(!events.error_operation.has_value());
  }

  CATCH_SECTION("dropped-connection-is-an-error") {
    RecordingEvents events;
    net::WebsocketTransport transport{make_config(stub), make_shared<trust::TrustAllProvider>()};
    transport.set_events(events);
    transport.connect();
    CATCH_REQUIRE(stub.wait_for_client());

    stub.drop();
    CATCH_REQUIRE(events.wait_for_terminal());
    CATCH_REQUIRE(events.error_operation == net::WebsocketOperation::READ);
    CATCH_REQUIRE(transport.state() == net::TransportState::FAILED);

    transport.close(); // no effect once failed
    std::this_thread::sleep_for(100ms);
    CATCH_REQUIRE(events.terminals == 1);
  }

  CATCH_SECTION("verified-against-the-issuing-ca") {
    RecordingEvents events;
    net::WebsocketTransport transport{make_config(stub), verify_against("ca.crt")};
    transport.set_events(events);
    transport.connect();
    CATCH_REQUIRE(transport.state() == net::TransportState::OPEN);
    transport.close();
    CATCH_REQUIRE(events.wait_for_terminal());
  }

  CATCH_SECTION("unrelated-ca-is-rejected") {
    RecordingEvents events;
    net::WebsocketTransport transport{make_config(stub), verify_against("other-ca.crt")};
    transport.set_events(events);
    CATCH_REQUIRE(connect_error(transport) == make_error_code(ecode::handshake_failure));
    CATCH_REQUIRE(transport.state() == net::TransportState::FAILED);
    CATCH_REQUIRE(events.opens == 0);
  }

  CATCH_SECTION("empty-trust-material-rejects-every-peer") {
    RecordingEvents events;
    net::WebsocketTransport transport{
        make_config(stub),
        make_shared<trust::FixedTrustProvider>(std::nullopt, trust::TrustMaterial{})};
    transport.set_events(events);
    CATCH_REQUIRE(connect_error(transport) == make_error_code(ecode::handshake_failure));
    CATCH_REQUIRE(transport.state() == net::TransportState::FAILED);
    CATCH_REQUIRE(events.opens == 0);
    CATCH_REQUIRE(events.terminals == 0);
  }

  CATCH_SECTION("misuse") {
    RecordingEvents events;
    net::WebsocketTransport transport{make_config(stub), make_shared<trust::TrustAllProvider>()};

    CATCH_REQUIRE_THROWS_AS(transport.connect(), std::logic_error); // no events set
    CATCH_REQUIRE_THROWS_AS(transport.connect(), std::logic_error); // and only once
    CATCH_REQUIRE_THROWS_AS(transport.send("x"), std::logic_error);
  }

  CATCH_SECTION("close-before-connect") {
    RecordingEvents events;
    net::WebsocketTransport transport{make_config(stub), make_shared<trust::TrustAllProvider>()};
    transport.set_events(events);
    transport.close();
    CATCH_REQUIRE(transport.state() == net::TransportState::CLOSED);
    CATCH_REQUIRE(events.terminals == 0);
    CATCH_REQUIRE_THROWS_AS(transport.connect(), std::logic_error);
  }
}

// ----------------------------------------------------------------------------- failing handshakes

CATCH_TEST_CASE("websocket-transport-handshake-failures", "[websockets]") {
  CATCH_SECTION("upgrade-rejected") {
    RelayStub stub{RelayStub::Config{.reject_upgrade = true}};
    RecordingEvents events;
    net::WebsocketTransport transport{make_config(stub), make_shared<trust::TrustAllProvider>()};
    transport.set_events(events);
    CATCH_REQUIRE(connect_error(transport) == make_error_code(ecode::handshake_failure));
    CATCH_REQUIRE(transport.state() == net::TransportState::FAILED);
    CATCH_REQUIRE(events.opens == 0);
  }

  CATCH_SECTION("connection-refused") {
    uint16_t port = 0;
    {
      boost::asio::io_context io_context;
      boost::asio::ip::tcp::acceptor acceptor{
          io_context, {boost::asio::ip::make_address("127.0.0.1"), 0}};
      port = acceptor.local_endpoint().port();
    } // nothing listens on `port` now

    net::ClientConfig config;
    config.uri = *net::parse_websocket_uri(format("wss://127.0.0.1:{}/", port));
    RecordingEvents events;
    net::WebsocketTransport transport{config, make_shared<trust::TrustAllProvider>()};
    transport.set_events(events);
    CATCH_REQUIRE(connect_error(transport) == make_error_code(ecode::handshake_failure));
  }

  CATCH_SECTION("interrupted") {
    // Accepts tcp connections (by way of the backlog), but never speaks TLS
    boost::asio::io_context io_context;
    boost::asio::ip::tcp::acceptor acceptor{io_context,
                                            {boost::asio::ip::make_address("127.0.0.1"), 0}};

    net::ClientConfig config;
    config.uri =
        *net::parse_websocket_uri(format("wss://127.0.0.1:{}/", acceptor.local_endpoint().port()));
    config.connect_timeout = 10s;

    RecordingEvents events;
    net::WebsocketTransport transport{config, make_shared<trust::TrustAllProvider>()};
    transport.set_events(events);

    std::thread interrupter{[&transport]() {
      while (transport.state() == net::TransportState::UNCONNECTED)
        std::this_thread::sleep_for(1ms);
      std::this_thread::sleep_for(200ms);
      transport.interrupt();
    }};

    const auto ec = connect_error(transport);
    interrupter.join();

    CATCH_REQUIRE(ec == make_error_code(ecode::interrupted_connect));
    CATCH_REQUIRE(transport.state() == net::TransportState::FAILED);
    CATCH_REQUIRE(events.opens == 0);
  }

  CATCH_SECTION("interrupted-before-connect") {
    RelayStub stub;
    RecordingEvents events;
    net::WebsocketTransport transport{make_config(stub, "/"),
                                      make_shared<trust::TrustAllProvider>()};
    transport.set_events(events);

    transport.interrupt();
    CATCH_REQUIRE(transport.state() == net::TransportState::UNCONNECTED);
    CATCH_REQUIRE(connect_error(transport) == make_error_code(ecode::interrupted_connect));
    CATCH_REQUIRE(transport.state() == net::TransportState::FAILED);
    CATCH_REQUIRE(events.opens == 0);
    CATCH_REQUIRE(!stub.wait_for_client(200ms));
  }
}

} // namespace tether::test
