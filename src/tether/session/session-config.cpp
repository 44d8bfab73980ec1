#include "session-config.hpp"

#include <cctype>

namespace tether::session {

static bool is_token_char(char c) {
  // RFC 7230 tchar
  return std::isalnum(static_cast<unsigned char>(c)) ||
         string_view{"!#$%&'*+-.^_`|~"}.find(c) != string_view::npos;
}

static bool has_line_break(std::string_view s) { return s.find_first_of("\r\n") != s.npos; }

std::optional<string> validate(const SessionConfig& config) {
  if (!net::parse_websocket_uri(config.uri))
    return format("invalid uri '{}', expected wss://host[:port][/path]", config.uri);

  for (const auto& [name, value] : config.headers) {
    if (name.empty() || !ranges::all_of(name, is_token_char))
      return format("invalid header name '{}'", name);
    if (has_line_break(value))
      return format("value of header '{}' contains a line break", name);
  }

  if (config.target_id.empty())
    return string{"no invocation target"};

  if (config.duration.count() <= 0)
    return format("session duration must be positive, got {}s", config.duration.count());

  if (config.connect_timeout.count() <= 0)
    return format("connect timeout must be positive, got {}ms", config.connect_timeout.count());

  const auto& trust = config.trust;
  if (trust.mode == trust::TrustSelector::Mode::FIXED) {
    if (trust.certificate_file.empty() != trust.private_key_file.empty())
      return string{"a client certificate and its private key must be given together"};
  } else if (!trust.ca_file.empty() || !trust.certificate_file.empty() || trust.use_system_ca) {
    return string{"trust-all mode does not take certificate files"};
  }

  return std::nullopt;
}

net::ClientConfig make_client_config(const SessionConfig& config) {
  if (auto message = validate(config))
    throw SessionError{ecode::invalid_configuration, *message};

  return net::ClientConfig{.uri = *net::parse_websocket_uri(config.uri),
                           .headers = config.headers,
                           .user_agent = config.user_agent,
                           .connect_timeout = config.connect_timeout};
}

} // namespace tether::session
