#pragma once

#include "dispatcher.hpp"

#include "tether/net/websockets/websocket-transport.hpp"
#include "tether/trust/trust-provider.hpp"

#include <chrono>
#include <optional>
#include <utility>

namespace tether::session {

/**
 * @brief Everything a debug session needs. Immutable once the session starts.
 */
struct SessionConfig {
  string uri = {}; //!< wss://host[:port][/path]
  vector<std::pair<string, string>> headers = {};
  trust::TrustSelector trust = {};
  string target_id = {};
  std::chrono::seconds duration{60 * 60}; //!< Upper bound on the session
  std::chrono::milliseconds connect_timeout{30 * 1000};
  string user_agent = "tether-debug";
  FailurePolicy failure_policy = FailurePolicy::RESPECT_TARGET;
};

/**
 * @return A description of the first problem found, or nothing if `config` is usable.
 */
std::optional<string> validate(const SessionConfig& config);

/**
 * @brief The transport's share of `config`.
 *
 * Exceptions
 * + SessionError(ecode::invalid_configuration) if `config` does not validate
 */
net::ClientConfig make_client_config(const SessionConfig& config);

} // namespace tether::session
