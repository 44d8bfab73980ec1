#include "tether/session/envelope-codec.hpp"
#include "tether/session/session-controller.hpp"

#include "support/fake-transport.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

namespace tether::session::tests {

using test::FakeTransport;

static string request_text(std::string_view id, std::string_view payload) {
  return encode_request(RequestEnvelope{.request_id = string{id},
                                        .request_payload = string{payload}});
}

static ResponseEnvelope sent_response(const FakeTransport& fake, std::size_t index) {
  const auto sent = fake.sent();
  CATCH_REQUIRE(index < sent.size());
  const auto response = decode_response(sent[index]);
  CATCH_REQUIRE(response.has_value());
  return *response;
}

// Runs everything posted so far (and anything that posts), on this thread
static void drain(boost::asio::io_context& io_context) {
  io_context.restart();
  io_context.poll();
}

/**
 * A controller over a FakeTransport, with targets:
 * + "echo"      answers with its payload
 * + "reporting" throws, and wants its failures reported
 * + "silent"    throws, and does not
 * + "drop-link" fails the connection underneath itself
 */
struct Fixture {
  boost::asio::io_context io_context;
  shared_ptr<TargetRegistry> registry = make_shared<TargetRegistry>();
  FakeTransport* fake = nullptr;
  unique_ptr<SessionController> controller;

  explicit Fixture(std::chrono::seconds duration = std::chrono::hours{1},
                   string target_id = "echo") {
    auto transport = make_unique<FakeTransport>(io_context);
    fake = transport.get();

    registry->add("echo", []() { return make_shared<EchoTarget>(); });
    registry->add_function(
        "reporting", [](std::string_view) -> string { throw std::runtime_error{"boom"}; }, true);
    registry->add_function(
        "silent", [](std::string_view) -> string { throw std::runtime_error{"boom"}; }, false);
    registry->add_function("drop-link", [this](std::string_view payload) {
      fake->fail_now(net::WebsocketOperation::WRITE,
                     std::make_error_code(std::errc::connection_reset));
      return string{payload};
    });

    controller = make_unique<SessionController>(
        std::move(transport), make_shared<const Dispatcher>(registry), std::move(target_id),
        duration);
  }
};

CATCH_TEST_CASE("SessionController", "[session-controller]") {
  CATCH_SECTION("one-request-one-response") {
    Fixture f;
    CATCH_REQUIRE(f.controller->state() == SessionState::IDLE);
    f.controller->start();
    CATCH_REQUIRE(f.controller->state() == SessionState::ACTIVE);

    f.fake->deliver_text(request_text("r-1", R"({"intent":"hello"})"));
    drain(f.io_context);

    CATCH_REQUIRE(f.fake->sent().size() == 1);
    const auto response = sent_response(*f.fake, 0);
    CATCH_REQUIRE(response.is_success());
    CATCH_REQUIRE(response.original_request_id == "r-1");
    CATCH_REQUIRE(std::get<SuccessBody>(response.body).response_payload == R"({"intent":"hello"})");

    const auto counters = f.controller->counters();
    CATCH_REQUIRE(counters.received == 1);
    CATCH_REQUIRE(counters.responded == 1);
    CATCH_REQUIRE(counters.dropped == 0);
    CATCH_REQUIRE(f.controller->state() == SessionState::ACTIVE);
  }

  CATCH_SECTION("malformed-frames-are-dropped") {
    Fixture f;
    f.controller->start();

    f.fake->deliver_text("this is not json");
    f.fake->deliver_text(R"({"requestPayload":"no id"})");
    f.fake->deliver_text(request_text("r-2", "still here"));
    drain(f.io_context);

    CATCH_REQUIRE(f.fake->sent().size() == 1);
    CATCH_REQUIRE(sent_response(*f.fake, 0).original_request_id == "r-2");
    const auto counters = f.controller->counters();
    CATCH_REQUIRE(counters.received == 3);
    CATCH_REQUIRE(counters.responded == 1);
    CATCH_REQUIRE(counters.dropped == 2);
    CATCH_REQUIRE(f.controller->state() == SessionState::ACTIVE);
    CATCH_REQUIRE(f.controller->wait_for(0ms) == std::nullopt);
  }

  CATCH_SECTION("binary-frames-are-decoded-as-text") {
    Fixture f;
    f.controller->start();
    f.fake->deliver_binary(request_text("r-3", "from a binary frame"));
    drain(f.io_context);
    CATCH_REQUIRE(sent_response(*f.fake, 0).original_request_id == "r-3");
  }

  CATCH_SECTION("target-failure-is-reported") {
    Fixture f{std::chrono::hours{1}, "reporting"};
    f.controller->start();
    f.fake->deliver_text(request_text("r-4", "x"));
    drain(f.io_context);

    const auto response = sent_response(*f.fake, 0);
    CATCH_REQUIRE(!response.is_success());
    CATCH_REQUIRE(response.type == k_failure_type);
    CATCH_REQUIRE(std::get<FailureBody>(response.body).error_code == "500");
    CATCH_REQUIRE(std::get<FailureBody>(response.body).error_message == "boom");
    CATCH_REQUIRE(f.controller->state() == SessionState::ACTIVE);
  }

  CATCH_SECTION("escalated-failure-ends-the-session") {
    Fixture f{std::chrono::hours{1}, "silent"};
    f.controller->start();
    f.fake->deliver_text(request_text("r-5", "x"));
    f.fake->deliver_text(request_text("r-6", "never processed"));
    drain(f.io_context);

    CATCH_REQUIRE(f.fake->sent().empty());
    CATCH_REQUIRE(f.fake->last_close_code() == 1011);
    CATCH_REQUIRE(f.fake->state() == net::TransportState::CLOSED);
    CATCH_REQUIRE(f.controller->state() == SessionState::TERMINATED);
    CATCH_REQUIRE(f.controller->outcome() == SessionOutcome::FAILED);
    CATCH_REQUIRE(f.controller->wait() == make_error_code(ecode::invocation_failure));
    CATCH_REQUIRE(f.controller->counters().received == 1);
  }

  CATCH_SECTION("transport-error") {
    Fixture f;
    f.controller->start();
    f.fake->inject_error(net::WebsocketOperation::READ,
                         std::make_error_code(std::errc::connection_reset));
    f.fake->deliver_text(request_text("r-7", "too late"));
    drain(f.io_context);

    CATCH_REQUIRE(f.controller->state() == SessionState::TERMINATED);
    CATCH_REQUIRE(f.controller->outcome() == SessionOutcome::FAILED);
    CATCH_REQUIRE(f.controller->wait() == make_error_code(ecode::transport_error));
    CATCH_REQUIRE(f.fake->sent().empty());
    CATCH_REQUIRE(f.controller->counters().received == 0);
  }

  CATCH_SECTION("connection-lost-during-invocation") {
    Fixture f{std::chrono::hours{1}, "drop-link"};
    f.controller->start();
    f.fake->deliver_text(request_text("r-8", "x"));
    drain(f.io_context);

    CATCH_REQUIRE(f.fake->sent().empty());
    CATCH_REQUIRE(f.controller->outcome() == SessionOutcome::FAILED);
    CATCH_REQUIRE(f.controller->wait() == make_error_code(ecode::transport_error));
    const auto counters = f.controller->counters();
    CATCH_REQUIRE(counters.received == 1);
    CATCH_REQUIRE(counters.responded == 0);
    CATCH_REQUIRE(counters.dropped == 1);
  }

  CATCH_SECTION("remote-close") {
    Fixture f;
    f.controller->start();
    f.fake->remote_close(1001, "relay shutting down");
    drain(f.io_context);

    CATCH_REQUIRE(f.controller->state() == SessionState::TERMINATED);
    CATCH_REQUIRE(f.controller->outcome() == SessionOutcome::CLOSED);
    CATCH_REQUIRE(!f.controller->wait());
    CATCH_REQUIRE(f.fake->close_calls() == 0);
  }

  CATCH_SECTION("session-expires") {
    Fixture f{std::chrono::seconds{1}};
    f.controller->start();
    CATCH_REQUIRE(f.controller->state() == SessionState::ACTIVE);

    f.io_context.restart();
    f.io_context.run_for(5s);

    CATCH_REQUIRE(f.controller->state() == SessionState::TERMINATED);
    CATCH_REQUIRE(f.controller->outcome() == SessionOutcome::CLOSED);
    CATCH_REQUIRE(f.fake->last_close_code() == 1000);
    CATCH_REQUIRE(!f.controller->wait());
  }

  CATCH_SECTION("stop-while-active") {
    Fixture f;
    f.controller->start();
    f.controller->stop();
    f.controller->stop();
    CATCH_REQUIRE(f.controller->state() == SessionState::TERMINATED);
    CATCH_REQUIRE(f.controller->outcome() == SessionOutcome::CLOSED);
    CATCH_REQUIRE(f.fake->last_close_code() == 1000);
    CATCH_REQUIRE(f.fake->close_calls() == 1);

    // The expiry timer was cancelled, so nothing more happens
    drain(f.io_context);
    CATCH_REQUIRE(f.fake->close_calls() == 1);
  }

  CATCH_SECTION("stop-before-start") {
    Fixture f;
    f.controller->stop();
    CATCH_REQUIRE(f.controller->state() == SessionState::TERMINATED);
    CATCH_REQUIRE(f.controller->outcome() == SessionOutcome::CLOSED);
    CATCH_REQUIRE(f.fake->state() == net::TransportState::CLOSED);
    CATCH_REQUIRE_THROWS_AS(f.controller->start(), std::logic_error);
  }

  CATCH_SECTION("start-twice") {
    Fixture f;
    f.controller->start();
    CATCH_REQUIRE_THROWS_AS(f.controller->start(), std::logic_error);
    CATCH_REQUIRE(f.controller->state() == SessionState::ACTIVE);
  }

  CATCH_SECTION("handshake-failure") {
    Fixture f;
    f.fake->fail_connect_with(ecode::handshake_failure);
    try {
      f.controller->start();
      CATCH_FAIL("expected an exception");
    } catch (const SessionError& e) {
      CATCH_REQUIRE(e.code() == make_error_code(ecode::handshake_failure));
    }
    CATCH_REQUIRE(f.controller->state() == SessionState::TERMINATED);
    CATCH_REQUIRE(f.controller->outcome() == SessionOutcome::FAILED);
    CATCH_REQUIRE(f.controller->wait_for(0ms) == make_error_code(ecode::handshake_failure));
  }

  CATCH_SECTION("state-names") {
    CATCH_REQUIRE(str(SessionState::AWAITING_HANDSHAKE) == "AWAITING_HANDSHAKE");
    CATCH_REQUIRE(str(SessionState::TERMINATED) == "TERMINATED");
  }
}

} // namespace tether::session::tests
