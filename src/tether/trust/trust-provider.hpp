#pragma once

#include "tether/utils.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup trust Trust Material
 * @ingroup tether
 *
 * Key and trust material for the TLS context of a debug session. A provider only *returns*
 * material; `make_tls_client_context` (tls-context.hpp) is what applies it.
 *
 * "Absent" and "present but empty" are different answers:
 * + absent trust material selects trust-all mode (any server certificate is accepted);
 * + present trust material with no authorities verifies against nothing, rejecting every peer.
 */

namespace tether::trust {

/**
 * @brief A client certificate, sent when the relay asks for one.
 */
struct KeyMaterial {
  string certificate_chain_pem = {};
  string private_key_pem = {};
  string private_key_password = {}; //!< For encrypted private keys
};

/**
 * @brief The certificate authorities that server certificates are verified against.
 */
struct TrustMaterial {
  vector<string> certificate_authorities_pem = {}; //!< Each entry may hold a bundle
  bool use_default_verify_paths = false;           //!< Also trust the system store
};

// ---------------------------------------------------------------------------------- TrustProvider

class TrustProvider {
public:
  virtual ~TrustProvider() = default;

  virtual std::optional<KeyMaterial> key_material() const = 0;
  virtual std::optional<TrustMaterial> trust_material() const = 0;

  /** @brief For logging */
  virtual std::string_view name() const = 0;
};

// ------------------------------------------------------------------------------- TrustAllProvider

/**
 * @brief Accept any server certificate, and present no client certificate.
 *
 * The default for local debugging. Never use it against an untrusted network: the relay is
 * not authenticated.
 */
class TrustAllProvider final : public TrustProvider {
public:
  std::optional<KeyMaterial> key_material() const override { return std::nullopt; }
  std::optional<TrustMaterial> trust_material() const override { return std::nullopt; }
  std::string_view name() const override { return "trust-all"; }
};

// ----------------------------------------------------------------------------- FixedTrustProvider

/**
 * @brief Material fixed at construction, for locked-down deployments.
 */
class FixedTrustProvider final : public TrustProvider {
private:
  std::optional<KeyMaterial> key_material_;
  std::optional<TrustMaterial> trust_material_;

public:
  FixedTrustProvider(std::optional<KeyMaterial> key_material,
                     std::optional<TrustMaterial> trust_material)
      : key_material_{std::move(key_material)}, trust_material_{std::move(trust_material)} {}

  std::optional<KeyMaterial> key_material() const override { return key_material_; }
  std::optional<TrustMaterial> trust_material() const override { return trust_material_; }
  std::string_view name() const override { return "fixed"; }
};

// ---------------------------------------------------------------------------------- TrustSelector

/**
 * @brief Which provider a session uses, and where fixed material lives on disk.
 */
struct TrustSelector {
  enum class Mode : int { TRUST_ALL, FIXED };

  Mode mode = Mode::TRUST_ALL;
  string ca_file = {};              //!< PEM bundle; empty means no trust material
  bool use_system_ca = false;       //!< Trust the system store (as well as `ca_file`)
  string certificate_file = {};     //!< PEM chain; empty means no key material
  string private_key_file = {};     //!< PEM key; required with `certificate_file`
  string private_key_password = {}; //!< For encrypted keys
};

/**
 * @brief Build the provider named by `selector`, reading any PEM files it names.
 *
 * Exceptions
 * + SessionError(ecode::trust_material_error) if a file cannot be read, or a certificate
 *   is given without its private key.
 */
std::shared_ptr<const TrustProvider> load_trust_provider(const TrustSelector& selector);

} // namespace tether::trust
