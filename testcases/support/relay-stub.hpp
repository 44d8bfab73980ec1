#pragma once

#include "tether/utils.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace tether::test {

/**
 * @brief Directory of the test certificates (`ca.crt`, `server.crt`, ...).
 */
string test_certificate_path(std::string_view filename);

/**
 * @brief A TLS websocket server on 127.0.0.1, standing in for the debugging relay.
 *
 * Runs its own I/O thread, and talks to one client at a time (the latest to connect).
 */
class RelayStub {
public:
  struct Config {
    string certificate_chain_file = test_certificate_path("server.crt");
    string private_key_file = test_certificate_path("server.key");
    bool reject_upgrade = false; //!< Answer the upgrade request with 403
  };

private:
  struct Pimpl;
  unique_ptr<Pimpl> pimpl_;

public:
  RelayStub();
  explicit RelayStub(Config config);
  RelayStub(const RelayStub&) = delete;
  RelayStub& operator=(const RelayStub&) = delete;
  ~RelayStub();

  uint16_t port() const;

  /** @brief `wss://localhost:<port><target>` */
  string uri(std::string_view target = "/") const;

  /** @brief Wait for a client to complete the websocket handshake. */
  bool wait_for_client(std::chrono::milliseconds timeout = std::chrono::seconds{10});

  /** @brief The value of `name` in the last upgrade request, if it was set. */
  std::optional<string> request_header(std::string_view name) const;

  /** @brief The target (path) of the last upgrade request. */
  string request_target() const;

  void send_text(string text);
  void send_binary(string bytes);

  /** @brief Orderly websocket close, from the relay's side. */
  void close(uint16_t code, string reason);

  /** @brief Drop the tcp connection without any closing handshake. */
  void drop();

  /** @brief The next frame the client sent, or nothing after `timeout`. */
  std::optional<string> next_message(std::chrono::milliseconds timeout = std::chrono::seconds{10});

  /** @brief Frames received so far, and not yet taken by `next_message`. */
  std::size_t pending_messages() const;

  /** @brief Wait until the client's connection has ended, however it ended. */
  bool wait_for_disconnect(std::chrono::milliseconds timeout = std::chrono::seconds{10});
};

} // namespace tether::test
