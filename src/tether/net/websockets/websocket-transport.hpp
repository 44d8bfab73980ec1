#pragma once

#include "transport.hpp"

#include "tether/net/uri.hpp"
#include "tether/trust/trust-provider.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tether::net {

namespace detail {
class ClientSession;
}

/**
 * @brief Everything needed to open the connection, save the trust material.
 */
struct ClientConfig {
  WebsocketUri uri = {};
  vector<std::pair<string, string>> headers = {}; //!< Added to the upgrade request
  string user_agent = "tether-debug";
  std::chrono::milliseconds connect_timeout{30 * 1000}; //!< Per stage: tcp connect, TLS
};

/**
 * @brief A `Transport` over Boost.Beast: websocket, on TLS, on tcp.
 *
 * `connect` drives the connection and both handshakes on the calling thread. Once the
 * connection is open, the transport starts a single I/O thread that delivers every later
 * event, and that also runs the handlers of any timer made by `timer_factory`.
 *
 * The destructor stops the I/O thread, so the transport must not be destroyed from
 * within one of its own callbacks.
 */
class WebsocketTransport final : public Transport {
private:
  struct Pimpl;
  unique_ptr<Pimpl> pimpl_;

  friend class detail::ClientSession;

public:
  WebsocketTransport(ClientConfig config, shared_ptr<const trust::TrustProvider> trust);
  WebsocketTransport(const WebsocketTransport&) = delete;
  WebsocketTransport& operator=(const WebsocketTransport&) = delete;
  ~WebsocketTransport() override;

  void set_events(TransportEvents& events) override;
  void connect() override;
  void send(std::string_view text) override;
  void close(uint16_t code = 1000, std::string_view reason = "") override;
  void interrupt() override;
  TransportState state() const override;
  SteadyTimerFactory timer_factory() override;
};

} // namespace tether::net
