#include "uri.hpp"

#include <charconv>
#include <optional>

namespace tether::net {

static auto invalid_uri() {
  return make_unexpected(make_error_code(ecode::invalid_configuration));
}

expected<WebsocketUri, error_code> parse_websocket_uri(std::string_view uri) {
  constexpr std::string_view k_scheme = "wss://";

  if (uri.size() < k_scheme.size() ||
      to_lower_copy(string{uri.substr(0, k_scheme.size())}) != k_scheme)
    return invalid_uri();

  const auto rest = uri.substr(k_scheme.size());
  const auto slash = rest.find_first_of("/?");
  const auto authority = (slash == std::string_view::npos) ? rest : rest.substr(0, slash);

  WebsocketUri out;
  if (slash != std::string_view::npos) {
    out.target = string{rest.substr(slash)};
    if (out.target.front() == '?')
      out.target.insert(out.target.begin(), '/');
  }

  // Userinfo is never sent in a websocket upgrade
  if (authority.find('@') != std::string_view::npos)
    return invalid_uri();

  std::string_view host = authority;
  std::optional<std::string_view> port; // set iff a ':' follows the host
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos)
      return invalid_uri();
    host = authority.substr(1, close - 1);
    const auto after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':')
        return invalid_uri();
      port = after.substr(1);
    }
  } else {
    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
      host = authority.substr(0, colon);
      port = authority.substr(colon + 1);
    }
  }

  if (host.empty())
    return invalid_uri();
  out.host = string{host};

  if (port) {
    const auto end = port->data() + port->size();
    unsigned value = 0;
    const auto [ptr, ec] = std::from_chars(port->data(), end, value);
    if (port->empty() || ec != std::errc{} || ptr != end || value == 0 || value > 65535)
      return invalid_uri();
    out.port = static_cast<uint16_t>(value);
  }

  return out;
}

} // namespace tether::net
