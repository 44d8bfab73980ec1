#pragma once

#include "tether/net/asio-timer-factory.hpp"

#include "tether/utils.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <system_error>

namespace tether::net {

enum class WebsocketOperation : int {
  CONNECT,   // Resolving and connecting the tcp socket
  HANDSHAKE, // TLS and websocket handshakes
  READ,      // During read operation
  WRITE,     // During a write operation
  CLOSE      // The websocket stream is being closed
};

constexpr std::string_view str(WebsocketOperation op) {
#define CASE(x)                                                                                    \
  case WebsocketOperation::x:                                                                      \
    return #x
  switch (op) {
    CASE(CONNECT);
    CASE(HANDSHAKE);
    CASE(READ);
    CASE(WRITE);
    CASE(CLOSE);
  }
#undef CASE
  return "<unknown case>";
}

/**
 * Lifecycle of the one physical connection. `FAILED` is terminal and reachable from any
 * non-terminal state; `CLOSED` is reached only through `CLOSING` once the connection was open.
 */
enum class TransportState : int { UNCONNECTED, CONNECTING, OPEN, CLOSING, CLOSED, FAILED };

constexpr std::string_view str(TransportState state) {
#define CASE(x)                                                                                    \
  case TransportState::x:                                                                          \
    return #x
  switch (state) {
    CASE(UNCONNECTED);
    CASE(CONNECTING);
    CASE(OPEN);
    CASE(CLOSING);
    CASE(CLOSED);
    CASE(FAILED);
  }
#undef CASE
  return "<unknown case>";
}

enum class FrameKind : int { TEXT, BINARY };

enum class Initiator : int { LOCAL, REMOTE };

constexpr std::string_view str(Initiator initiator) {
  return initiator == Initiator::LOCAL ? "us" : "remote";
}

// -------------------------------------------------------------------------------- TransportEvents

/**
 * @brief Receives the events of one connection.
 *
 * `on_open` fires once, on the thread that called `Transport::connect`. Every other event is
 * delivered on the transport's own I/O thread, one at a time. At most one of `on_close` and
 * `on_error` ever fires.
 */
class TransportEvents {
public:
  virtual ~TransportEvents() = default;

  virtual void on_open() = 0;

  /**
   * @brief A whole frame has arrived.
   * `payload` must be decoded immediately, because the underlying buffer will be reused.
   */
  virtual void on_message(std::span<const std::byte> payload, FrameKind kind) = 0;

  virtual void on_close(uint16_t code, std::string_view reason, Initiator initiator) = 0;

  virtual void on_error(WebsocketOperation operation, std::error_code ec) = 0;
};

// -------------------------------------------------------------------------------------- Transport

/**
 * @brief One encrypted duplex connection, as seen by the session that drives it.
 */
class Transport {
public:
  virtual ~Transport() = default;

  /**
   * @brief Must be set before `connect`; the events object must outlive the transport.
   */
  virtual void set_events(TransportEvents& events) = 0;

  /**
   * @brief Blocking connect and handshake on the calling thread.
   *
   * Exceptions
   * + SessionError(ecode::handshake_failure) when context setup, connect, or upgrade fails
   * + SessionError(ecode::interrupted_connect) when `interrupt` aborted the attempt
   * + std::logic_error if called more than once
   */
  virtual void connect() = 0;

  /**
   * @brief Queue one text frame. Only valid while `OPEN`. Frames are written whole, in the
   * order they were sent.
   *
   * Exceptions
   * + std::logic_error if the transport is not `OPEN`
   */
  virtual void send(std::string_view text) = 0;

  /**
   * @brief Begin an orderly close. Idempotent, and safe to call from any thread.
   */
  virtual void close(uint16_t code = 1000, std::string_view reason = "") = 0;

  /**
   * @brief Abort a blocking `connect` from another thread. Called before `connect`, the
   * next `connect` fails straight away. No effect once connected.
   */
  virtual void interrupt() = 0;

  virtual TransportState state() const = 0;

  /**
   * @brief Timers whose handlers run on the same thread as the transport's events.
   */
  virtual SteadyTimerFactory timer_factory() = 0;
};

} // namespace tether::net
