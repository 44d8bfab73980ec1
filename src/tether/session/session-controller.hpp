#pragma once

#include "dispatcher.hpp"

#include "tether/net/websockets/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace tether::session {

enum class SessionState : int { IDLE, AWAITING_HANDSHAKE, ACTIVE, TERMINATED };

constexpr std::string_view str(SessionState state) {
#define CASE(x)                                                                                    \
  case SessionState::x:                                                                            \
    return #x
  switch (state) {
    CASE(IDLE);
    CASE(AWAITING_HANDSHAKE);
    CASE(ACTIVE);
    CASE(TERMINATED);
  }
#undef CASE
  return "<unknown case>";
}

enum class SessionOutcome : int { NONE, CLOSED, FAILED };

struct SessionCounters {
  uint64_t received = 0;  //!< Frames that arrived
  uint64_t responded = 0; //!< Responses written
  uint64_t dropped = 0;   //!< Frames that got no response
};

/**
 * @brief The state machine of one debug session.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~
 * IDLE --start()--> AWAITING_HANDSHAKE --open--> ACTIVE --close/error/expiry--> TERMINATED
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * Owns the transport. Each message is decoded, dispatched, encoded, and answered
 * synchronously on the transport's I/O thread. A frame that does not decode is logged
 * and dropped; the session carries on. An escalated invocation failure ends the session.
 */
class SessionController final : public net::TransportEvents {
private:
  unique_ptr<net::Transport> transport_;
  shared_ptr<const Dispatcher> dispatcher_;
  const string target_id_;
  const std::chrono::seconds duration_;

  std::optional<boost::asio::steady_timer> session_timer_; // I/O thread only

  mutable std::mutex padlock_;
  std::condition_variable cv_;
  SessionState state_ = SessionState::IDLE;
  SessionOutcome outcome_ = SessionOutcome::NONE;
  error_code terminal_error_ = {};
  bool stop_requested_ = false;
  std::optional<error_code> escalated_error_; // set just before the transport is closed

  std::atomic<uint64_t> received_{0};
  std::atomic<uint64_t> responded_{0};
  std::atomic<uint64_t> dropped_{0};

public:
  SessionController(unique_ptr<net::Transport> transport,
                    shared_ptr<const Dispatcher> dispatcher, string target_id,
                    std::chrono::seconds duration = std::chrono::hours{1});
  SessionController(const SessionController&) = delete;
  SessionController& operator=(const SessionController&) = delete;
  ~SessionController() override;

  /**
   * @brief Connect, blocking until the session is ACTIVE.
   *
   * Exceptions
   * + SessionError(ecode::handshake_failure) or SessionError(ecode::interrupted_connect);
   *   the session is then TERMINATED(FAILED)
   * + std::logic_error if the session was already started
   */
  void start();

  /**
   * @brief Block until TERMINATED.
   * @return The terminal error; empty after a clean close.
   */
  error_code wait();

  /**
   * @return The terminal error, or nothing if still not TERMINATED after `timeout`.
   */
  std::optional<error_code> wait_for(std::chrono::milliseconds timeout);

  /**
   * @brief Close the session from any thread. Interrupts a connect in progress.
   */
  void stop();

  SessionState state() const;
  SessionOutcome outcome() const;
  SessionCounters counters() const;

  const net::Transport& transport() const { return *transport_; }

  // TransportEvents
  void on_open() override;
  void on_message(std::span<const std::byte> payload, net::FrameKind kind) override;
  void on_close(uint16_t code, std::string_view reason, net::Initiator initiator) override;
  void on_error(net::WebsocketOperation operation, std::error_code ec) override;

private:
  void arm_session_timer_();
  void on_session_expired_(const boost::system::error_code& ec);
  void terminate_(SessionOutcome outcome, error_code ec);
  void fail_(error_code ec, uint16_t close_code, std::string_view close_reason);
};

} // namespace tether::session
