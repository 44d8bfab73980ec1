#include "tls-context.hpp"

#include <boost/asio/buffer.hpp>

#include <openssl/ssl.h>

namespace tether::trust {

namespace asio = boost::asio;

static void check(const boost::system::error_code& ec, std::string_view what) {
  if (ec)
    throw SessionError{ecode::trust_material_error, format("{}: {}", what, ec.message())};
}

asio::ssl::context make_tls_client_context(const TrustProvider& provider) {
  asio::ssl::context ctx{asio::ssl::context::tls_client};

  if (SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION) != 1)
    throw SessionError{ecode::trust_material_error, "failed to require TLS 1.2 or newer"};

  boost::system::error_code ec;
  ctx.set_options(asio::ssl::context::default_workarounds | asio::ssl::context::no_sslv2 |
                      asio::ssl::context::no_sslv3,
                  ec);
  check(ec, "failed to set TLS context options");

  const auto key_material = provider.key_material();
  if (key_material) {
    ctx.set_password_callback(
        [password = key_material->private_key_password](
            std::size_t, asio::ssl::context_base::password_purpose) { return password; },
        ec);
    check(ec, "failed to set private key password callback");

    ctx.use_certificate_chain(asio::buffer(key_material->certificate_chain_pem), ec);
    check(ec, "failed to load client certificate chain");

    ctx.use_private_key(asio::buffer(key_material->private_key_pem), asio::ssl::context::pem, ec);
    check(ec, "failed to load client private key");
  }

  const auto trust_material = provider.trust_material();
  if (!trust_material) {
    WARN("trust provider '{}' has no trust material: server certificates are NOT verified",
         provider.name());
    ctx.set_verify_mode(asio::ssl::verify_none, ec);
    check(ec, "failed to set verify mode");
    return ctx;
  }

  if (trust_material->use_default_verify_paths) {
    ctx.set_default_verify_paths(ec);
    check(ec, "failed to load the system certificate store");
  }

  for (const auto& pem : trust_material->certificate_authorities_pem) {
    ctx.add_certificate_authority(asio::buffer(pem), ec);
    check(ec, "failed to load certificate authority");
  }

  if (trust_material->certificate_authorities_pem.empty() &&
      !trust_material->use_default_verify_paths)
    WARN("trust provider '{}' trusts no certificate authority: every server will be rejected",
         provider.name());

  ctx.set_verify_mode(asio::ssl::verify_peer | asio::ssl::verify_fail_if_no_peer_cert, ec);
  check(ec, "failed to set verify mode");

  return ctx;
}

} // namespace tether::trust
