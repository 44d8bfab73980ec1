#include "tether/net/uri.hpp"

#include <catch2/catch.hpp>

namespace tether::net::tests {

CATCH_TEST_CASE("WebsocketUri", "[uri]") {
  CATCH_SECTION("valid") {
    {
      const auto uri = parse_websocket_uri("wss://relay.example.com");
      CATCH_REQUIRE(uri.has_value());
      CATCH_REQUIRE(uri->host == "relay.example.com");
      CATCH_REQUIRE(uri->port == 443);
      CATCH_REQUIRE(uri->target == "/");
    }

    {
      const auto uri = parse_websocket_uri("WSS://localhost:8443/v1/skills/amzn1/debug?region=NA");
      CATCH_REQUIRE(uri.has_value());
      CATCH_REQUIRE(uri->host == "localhost");
      CATCH_REQUIRE(uri->port == 8443);
      CATCH_REQUIRE(uri->target == "/v1/skills/amzn1/debug?region=NA");
    }

    {
      const auto uri = parse_websocket_uri("wss://[::1]:9000?x=1");
      CATCH_REQUIRE(uri.has_value());
      CATCH_REQUIRE(uri->host == "::1");
      CATCH_REQUIRE(uri->port == 9000);
      CATCH_REQUIRE(uri->target == "/?x=1");
    }
  }

  CATCH_SECTION("invalid") {
    for (const auto* bad : {"", "ws://insecure.example", "https://relay.example", "wss://",
                            "wss://:443/", "wss://host:0", "wss://host:65536", "wss://host:12x",
                            "wss://user@host/", "wss://[::1", "wss://[::1]x/", "wss://host:",
                            "wss://host:/path", "wss://[::1]:"}) {
      const auto uri = parse_websocket_uri(bad);
      CATCH_REQUIRE(!uri.has_value());
      CATCH_REQUIRE(uri.error() == make_error_code(ecode::invalid_configuration));
    }
  }
}

} // namespace tether::net::tests
