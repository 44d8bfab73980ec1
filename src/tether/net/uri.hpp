#pragma once

#include "tether/utils.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace tether::net {

/**
 * @brief The parts of a `wss://` URI that the transport needs.
 */
struct WebsocketUri {
  string host = {};
  uint16_t port = 443;
  string target = "/"; //!< path and query, as sent in the upgrade request

  bool operator==(const WebsocketUri&) const = default;
};

/**
 * @brief Parse `wss://host[:port][/path[?query]]`.
 *
 * Only secure websockets are accepted. IPv6 literals are written in brackets, as
 * in `wss://[::1]:8443/`. Fails with `ecode::invalid_configuration`.
 */
expected<WebsocketUri, error_code> parse_websocket_uri(std::string_view uri);

} // namespace tether::net
