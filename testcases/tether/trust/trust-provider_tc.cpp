#include "tether/trust/tls-context.hpp"
#include "tether/trust/trust-provider.hpp"

#include "support/relay-stub.hpp"

#include <openssl/ssl.h>

#include <catch2/catch.hpp>

namespace tether::trust::tests {

using test::test_certificate_path;

static error_code load_error(const TrustSelector& selector) {
  try {
    load_trust_provider(selector);
  } catch (const SessionError& e) {
    return e.code();
  }
  return {};
}

static error_code context_error(const TrustProvider& provider) {
  try {
    make_tls_client_context(provider);
  } catch (const SessionError& e) {
    return e.code();
  }
  return {};
}

CATCH_TEST_CASE("TrustProvider", "[trust]") {
  CATCH_SECTION("trust-all") {
    const auto provider = load_trust_provider(TrustSelector{});
    CATCH_REQUIRE(provider->name() == "trust-all");
    CATCH_REQUIRE(!provider->key_material().has_value());
    CATCH_REQUIRE(!provider->trust_material().has_value());
    CATCH_REQUIRE(!verifies_peer(*provider));
  }

  CATCH_SECTION("fixed-ca") {
    TrustSelector selector;
    selector.mode = TrustSelector::Mode::FIXED;
    selector.ca_file = test_certificate_path("ca.crt");
    const auto provider = load_trust_provider(selector);
    CATCH_REQUIRE(provider->name() == "fixed");
    CATCH_REQUIRE(!provider->key_material().has_value());
    const auto trust = provider->trust_material();
    CATCH_REQUIRE(trust.has_value());
    CATCH_REQUIRE(trust->certificate_authorities_pem.size() == 1);
    CATCH_REQUIRE(trust->certificate_authorities_pem[0].starts_with("-----BEGIN CERTIFICATE-----"));
    CATCH_REQUIRE(!trust->use_default_verify_paths);
    CATCH_REQUIRE(verifies_peer(*provider));
  }

  CATCH_SECTION("fixed-system-ca") {
    TrustSelector selector;
    selector.mode = TrustSelector::Mode::FIXED;
    selector.use_system_ca = true;
    const auto provider = load_trust_provider(selector);
    const auto trust = provider->trust_material();
    CATCH_REQUIRE(trust.has_value());
    CATCH_REQUIRE(trust->certificate_authorities_pem.empty());
    CATCH_REQUIRE(trust->use_default_verify_paths);
  }

  CATCH_SECTION("fixed-client-certificate") {
    TrustSelector selector;
    selector.mode = TrustSelector::Mode::FIXED;
    selector.certificate_file = test_certificate_path("server.crt");
    selector.private_key_file = test_certificate_path("server.key");
    const auto provider = load_trust_provider(selector);
    const auto key = provider->key_material();
    CATCH_REQUIRE(key.has_value());
    CATCH_REQUIRE(!key->certificate_chain_pem.empty());
    CATCH_REQUIRE(!key->private_key_pem.empty());
    CATCH_REQUIRE(!provider->trust_material().has_value());
  }

  CATCH_SECTION("unreadable-material") {
    TrustSelector selector;
    selector.mode = TrustSelector::Mode::FIXED;
    selector.ca_file = test_certificate_path("no-such-ca.crt");
    CATCH_REQUIRE(load_error(selector) == make_error_code(ecode::trust_material_error));
  }

  CATCH_SECTION("certificate-without-key") {
    TrustSelector selector;
    selector.mode = TrustSelector::Mode::FIXED;
    selector.certificate_file = test_certificate_path("server.crt");
    CATCH_REQUIRE(load_error(selector) == make_error_code(ecode::trust_material_error));
  }
}

CATCH_TEST_CASE("TlsClientContext", "[trust]") {
  CATCH_SECTION("trust-all-verifies-nothing") {
    auto context = make_tls_client_context(TrustAllProvider{});
    CATCH_REQUIRE(SSL_CTX_get_verify_mode(context.native_handle()) == SSL_VERIFY_NONE);
    CATCH_REQUIRE(SSL_CTX_get_min_proto_version(context.native_handle()) == TLS1_2_VERSION);
  }

  CATCH_SECTION("fixed-verifies-peer") {
    TrustSelector selector;
    selector.mode = TrustSelector::Mode::FIXED;
    selector.ca_file = test_certificate_path("ca.crt");
    auto context = make_tls_client_context(*load_trust_provider(selector));
    CATCH_REQUIRE((SSL_CTX_get_verify_mode(context.native_handle()) & SSL_VERIFY_PEER) != 0);
  }

  CATCH_SECTION("empty-authorities-still-verify") {
    auto context = make_tls_client_context(FixedTrustProvider{std::nullopt, TrustMaterial{}});
    CATCH_REQUIRE((SSL_CTX_get_verify_mode(context.native_handle()) & SSL_VERIFY_PEER) != 0);
  }

  CATCH_SECTION("encrypted-private-key") {
    string chain, key;
    CATCH_REQUIRE(!file_get_contents(test_certificate_path("server.crt"), chain));
    CATCH_REQUIRE(!file_get_contents(test_certificate_path("server-encrypted.key"), key));

    const FixedTrustProvider good{KeyMaterial{.certificate_chain_pem = chain,
                                              .private_key_pem = key,
                                              .private_key_password = "test"},
                                  std::nullopt};
    CATCH_REQUIRE(!context_error(good));

    const FixedTrustProvider bad{KeyMaterial{.certificate_chain_pem = chain,
                                             .private_key_pem = key,
                                             .private_key_password = "wrong"},
                                 std::nullopt};
    CATCH_REQUIRE(context_error(bad) == make_error_code(ecode::trust_material_error));
  }
}

} // namespace tether::trust::tests
