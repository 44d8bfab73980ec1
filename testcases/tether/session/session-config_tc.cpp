#include "tether/session/session-config.hpp"

#include <catch2/catch.hpp>

namespace tether::session::tests {

static SessionConfig make_valid_config() {
  SessionConfig config;
  config.uri = "wss://relay.example.com/v1/debug";
  config.headers = {{"Authorization", "Bearer abc"}};
  config.target_id = "echo";
  return config;
}

CATCH_TEST_CASE("SessionConfig", "[session-config]") {
  CATCH_SECTION("defaults") {
    const SessionConfig config;
    CATCH_REQUIRE(config.duration == std::chrono::hours{1});
    CATCH_REQUIRE(config.connect_timeout == std::chrono::seconds{30});
    CATCH_REQUIRE(config.failure_policy == FailurePolicy::RESPECT_TARGET);
    CATCH_REQUIRE(config.trust.mode == trust::TrustSelector::Mode::TRUST_ALL);
    CATCH_REQUIRE(validate(make_valid_config()) == std::nullopt);
  }

  CATCH_SECTION("invalid") {
    const auto is_invalid = [](auto&& edit) {
      auto config = make_valid_config();
      edit(config);
      return validate(config).has_value();
    };

    CATCH_REQUIRE(is_invalid([](SessionConfig& c) { c.uri = "ws://relay.example.com"; }));
    CATCH_REQUIRE(is_invalid([](SessionConfig& c) { c.uri.clear(); }));
    CATCH_REQUIRE(is_invalid([](SessionConfig& c) { c.headers.emplace_back("", "x"); }));
    CATCH_REQUIRE(is_invalid([](SessionConfig& c) { c.headers.emplace_back("Bad Name", "x"); }));
    CATCH_REQUIRE(is_invalid([](SessionConfig& c) { c.headers.emplace_back("X-A", "a\r\nX-B: b"); }));
    CATCH_REQUIRE(is_invalid([](SessionConfig& c) { c.target_id.clear(); }));
    CATCH_REQUIRE(is_invalid([](SessionConfig& c) { c.duration = std::chrono::seconds{0}; }));
    CATCH_REQUIRE(is_invalid([](SessionConfig& c) { c.connect_timeout = -1ms; }));
    CATCH_REQUIRE(is_invalid([](SessionConfig& c) { c.trust.ca_file = "ca.crt"; }));
    CATCH_REQUIRE(is_invalid([](SessionConfig& c) {
      c.trust.mode = trust::TrustSelector::Mode::FIXED;
      c.trust.certificate_file = "client.crt";
    }));
    CATCH_REQUIRE(is_invalid([](SessionConfig& c) {
      c.trust.mode = trust::TrustSelector::Mode::FIXED;
      c.trust.private_key_file = "client.key";
    }));
  }

  CATCH_SECTION("valid-fixed-trust") {
    auto config = make_valid_config();
    config.trust.mode = trust::TrustSelector::Mode::FIXED;
    config.trust.ca_file = "ca.crt";
    config.trust.certificate_file = "client.crt";
    config.trust.private_key_file = "client.key";
    CATCH_REQUIRE(validate(config) == std::nullopt);
  }

  CATCH_SECTION("make-client-config") {
    auto config = make_valid_config();
    config.user_agent = "tether-test";
    config.connect_timeout = 1500ms;
    const auto client = make_client_config(config);
    CATCH_REQUIRE(client.uri.host == "relay.example.com");
    CATCH_REQUIRE(client.uri.port == 443);
    CATCH_REQUIRE(client.uri.target == "/v1/debug");
    CATCH_REQUIRE(client.headers == config.headers);
    CATCH_REQUIRE(client.user_agent == "tether-test");
    CATCH_REQUIRE(client.connect_timeout == 1500ms);

    config.target_id.clear();
    try {
      make_client_config(config);
      CATCH_FAIL("expected an exception");
    } catch (const SessionError& e) {
      CATCH_REQUIRE(e.code() == make_error_code(ecode::invalid_configuration));
    }
  }
}

} // namespace tether::session::tests
