#pragma once

#include "trust-provider.hpp"

#include <boost/asio/ssl/context.hpp>

namespace tether::trust {

/**
 * @brief Build a TLS client context, TLS 1.2 or newer, initialized from `provider`.
 *
 * + No key material: no client certificate is presented.
 * + No trust material: `verify_none`, i.e., trust-all mode. A warning is logged.
 * + Trust material: `verify_peer` against exactly the listed authorities (plus the system store
 *   if asked), so an empty list rejects every server.
 *
 * Exceptions
 * + SessionError(ecode::trust_material_error) if OpenSSL rejects any of the material
 */
boost::asio::ssl::context make_tls_client_context(const TrustProvider& provider);

/**
 * @brief True iff a context built from `provider` verifies the server's certificate.
 */
inline bool verifies_peer(const TrustProvider& provider) {
  return provider.trust_material().has_value();
}

} // namespace tether::trust
