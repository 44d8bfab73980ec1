#include "tether/session.hpp"

#include "support/relay-stub.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

namespace tether::session::tests {

using test::RelayStub;
using test::test_certificate_path;

static shared_ptr<TargetRegistry> make_registry() {
  auto registry = make_shared<TargetRegistry>();
  registry->add("echo", []() { return make_shared<EchoTarget>(); });
  registry->add_function(
      "silent", [](std::string_view) -> string { throw std::runtime_error{"boom"}; }, false);
  return registry;
}

static SessionConfig make_config(const RelayStub& stub, string target_id = "echo") {
  SessionConfig config;
  config.uri = stub.uri("/v1/debug");
  config.headers = {{"Authorization", "Bearer test-token"}};
  config.target_id = std::move(target_id);
  config.connect_timeout = 5s;
  return config;
}

static string request_text(std::string_view id, std::string_view payload) {
  return encode_request(RequestEnvelope{.request_id = string{id},
                                        .request_payload = string{payload}});
}

static error_code construction_error(const SessionConfig& config) {
  try {
    DebugSession session{config, make_registry()};
  } catch (const SessionError& e) {
    return e.code();
  }
  return {};
}

CATCH_TEST_CASE("DebugSession", "[debug-session]") {
  CATCH_SECTION("request-response-over-tls") {
    RelayStub stub;
    DebugSession session{make_config(stub), make_registry()};
    session.start();
    CATCH_REQUIRE(session.controller().state() == SessionState::ACTIVE);
    CATCH_REQUIRE(stub.wait_for_client());
    CATCH_REQUIRE(stub.request_target() == "/v1/debug");
    CATCH_REQUIRE(stub.request_header("Authorization") ==
                  std::optional<string>{"Bearer test-token"});

    stub.send_text("{ not a request");
    stub.send_text(request_text("r-1", R"({"request":{"type":"LaunchRequest"}})"));

    const auto reply = stub.next_message();
    CATCH_REQUIRE(reply.has_value());
    const auto response = decode_response(*reply);
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->is_success());
    CATCH_REQUIRE(response->original_request_id == "r-1");
    CATCH_REQUIRE(std::get<SuccessBody>(response->body).response_payload ==
                  R"({"request":{"type":"LaunchRequest"}})");
    CATCH_REQUIRE(stub.pending_messages() == 0);

    stub.close(1000, "done");
    CATCH_REQUIRE(!session.wait());
    CATCH_REQUIRE(session.controller().outcome() == SessionOutcome::CLOSED);
    const auto counters = session.controller().counters();
    CATCH_REQUIRE(counters.received == 2);
    CATCH_REQUIRE(counters.responded == 1);
    CATCH_REQUIRE(counters.dropped == 1);
  }

  CATCH_SECTION("verified-relay") {
    RelayStub stub;
    auto config = make_config(stub);
    config.trust.mode = trust::TrustSelector::Mode::FIXED;
    config.trust.ca_file = test_certificate_path("ca.crt");

    DebugSession session{config, make_registry()};
    session.start();
    session.stop();
    CATCH_REQUIRE(!session.wait());
    CATCH_REQUIRE(stub.wait_for_disconnect());
  }

  CATCH_SECTION("unverifiable-relay") {
    RelayStub stub;
    auto config = make_config(stub);
    config.trust.mode = trust::TrustSelector::Mode::FIXED;
    config.trust.ca_file = test_certificate_path("other-ca.crt");

    DebugSession session{config, make_registry()};
    CATCH_REQUIRE_THROWS_AS(session.start(), SessionError);
    CATCH_REQUIRE(session.controller().outcome() == SessionOutcome::FAILED);
    CATCH_REQUIRE(session.wait() == make_error_code(ecode::handshake_failure));
  }

  CATCH_SECTION("upgrade-rejected") {
    RelayStub stub{RelayStub::Config{.reject_upgrade = true}};
    DebugSession session{make_config(stub), make_registry()};
    CATCH_REQUIRE_THROWS_AS(session.start(), SessionError);
    CATCH_REQUIRE(session.wait() == make_error_code(ecode::handshake_failure));
  }

  CATCH_SECTION("escalation-closes-the-connection") {
    RelayStub stub;
    DebugSession session{make_config(stub, "silent"), make_registry()};
    session.start();
    CATCH_REQUIRE(stub.wait_for_client());

    stub.send_text(request_text("r-2", "x"));
    CATCH_REQUIRE(session.wait() == make_error_code(ecode::invocation_failure));
    CATCH_REQUIRE(session.controller().outcome() == SessionOutcome::FAILED);
    CATCH_REQUIRE(stub.wait_for_disconnect());
    CATCH_REQUIRE(stub.pending_messages() == 0);
  }

  CATCH_SECTION("destroyed-as-soon-as-it-terminates") {
    // The I/O thread is still unwinding from the terminal callback when `wait` returns
    RelayStub stub;
    for (int i = 0; i < 10; ++i) {
      const bool escalate = (i % 2 == 0);
      auto session = make_unique<DebugSession>(make_config(stub, escalate ? "silent" : "echo"),
                                               make_registry());
      session->start();
      CATCH_REQUIRE(stub.wait_for_client());
      if (escalate)
        stub.send_text(request_text(format("r-{}", i), "x"));
      else
        stub.close(1000, "done");
      const auto ec = session->wait();
      session.reset();
      CATCH_REQUIRE(ec == (escalate ? make_error_code(ecode::invocation_failure) : error_code{}));
      CATCH_REQUIRE(stub.wait_for_disconnect());
    }
  }

  CATCH_SECTION("session-expires") {
    RelayStub stub;
    auto config = make_config(stub);
    config.duration = std::chrono::seconds{1};

    DebugSession session{config, make_registry()};
    session.start();
    const auto ec = session.controller().wait_for(10s);
    CATCH_REQUIRE(ec.has_value());
    CATCH_REQUIRE(!*ec);
    CATCH_REQUIRE(session.controller().outcome() == SessionOutcome::CLOSED);
    CATCH_REQUIRE(stub.wait_for_disconnect());
  }

  CATCH_SECTION("invalid-configuration") {
    RelayStub stub;
    auto config = make_config(stub);
    config.uri = "https://localhost/";
    CATCH_REQUIRE(construction_error(config) == make_error_code(ecode::invalid_configuration));
  }

  CATCH_SECTION("missing-trust-material") {
    RelayStub stub;
    auto config = make_config(stub);
    config.trust.mode = trust::TrustSelector::Mode::FIXED;
    config.trust.ca_file = test_certificate_path("no-such-ca.crt");
    CATCH_REQUIRE(construction_error(config) == make_error_code(ecode::trust_material_error));
  }
}

} // namespace tether::session::tests
