#include "trust-provider.hpp"

namespace tether::trust {

static string read_pem_file(std::string_view what, const string& filename) {
  string out;
  const auto ec = file_get_contents(filename, out);
  if (ec) {
    throw SessionError{ecode::trust_material_error,
                       format("failed to read {} '{}': {}", what, filename, ec.message())};
  }
  if (out.empty()) {
    throw SessionError{ecode::trust_material_error, format("{} '{}' is empty", what, filename)};
  }
  return out;
}

std::shared_ptr<const TrustProvider> load_trust_provider(const TrustSelector& selector) {
  if (selector.mode == TrustSelector::Mode::TRUST_ALL)
    return std::make_shared<TrustAllProvider>();

  std::optional<KeyMaterial> key_material;
  if (!selector.certificate_file.empty()) {
    if (selector.private_key_file.empty()) {
      throw SessionError{ecode::trust_material_error,
                         format("client certificate '{}' given without a private key",
                                selector.certificate_file)};
    }
    key_material = KeyMaterial{
        .certificate_chain_pem = read_pem_file("certificate chain", selector.certificate_file),
        .private_key_pem = read_pem_file("private key", selector.private_key_file),
        .private_key_password = selector.private_key_password};
  }

  std::optional<TrustMaterial> trust_material;
  if (!selector.ca_file.empty() || selector.use_system_ca) {
    trust_material = TrustMaterial{};
    trust_material->use_default_verify_paths = selector.use_system_ca;
    if (!selector.ca_file.empty())
      trust_material->certificate_authorities_pem.push_back(
          read_pem_file("certificate authorities", selector.ca_file));
  }

  LOG_DEBUG("fixed trust material: client-certificate={}, trust={}", key_material.has_value(),
            trust_material.has_value());

  return std::make_shared<FixedTrustProvider>(std::move(key_material), std::move(trust_material));
}

} // namespace tether::trust
