#pragma once

#include "session-config.hpp"
#include "session-controller.hpp"

namespace tether::session {

/**
 * @brief A debug session assembled from its configuration: trust material, transport,
 * dispatcher and controller.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto registry = std::make_shared<TargetRegistry>();
 * registry->add_function("hello", [](std::string_view) { return string{"{}"}; });
 * config.target_id = "hello";
 *
 * DebugSession session{config, registry};
 * session.start();            // throws SessionError on handshake failure
 * const auto ec = session.wait();
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
class DebugSession {
private:
  unique_ptr<SessionController> controller_;

public:
  /**
   * Exceptions
   * + SessionError(ecode::invalid_configuration) if `config` does not validate
   * + SessionError(ecode::trust_material_error) if the trust material cannot be loaded
   */
  DebugSession(const SessionConfig& config, shared_ptr<TargetResolver> resolver);

  void start() { controller_->start(); }
  error_code wait() { return controller_->wait(); }
  void stop() { controller_->stop(); }

  SessionController& controller() { return *controller_; }
  const SessionController& controller() const { return *controller_; }
};

} // namespace tether::session
