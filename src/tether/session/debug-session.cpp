#include "debug-session.hpp"

namespace tether::session {

DebugSession::DebugSession(const SessionConfig& config, shared_ptr<TargetResolver> resolver) {
  auto client_config = make_client_config(config);
  auto trust = trust::load_trust_provider(config.trust);
  auto dispatcher = make_shared<const Dispatcher>(std::move(resolver), config.failure_policy);

  LOG_DEBUG("debug session for target '{}', failure policy '{}', trust '{}'", config.target_id,
            str(config.failure_policy), trust->name());

  controller_ = make_unique<SessionController>(
      make_unique<net::WebsocketTransport>(std::move(client_config), std::move(trust)),
      std::move(dispatcher), config.target_id, config.duration);
}

} // namespace tether::session
