#include "session-controller.hpp"

#include "envelope-codec.hpp"

#include <stdexcept>

namespace tether::session {

using net::Initiator;
using net::TransportState;

// ------------------------------------------------------------------------------------ Construction

SessionController::SessionController(unique_ptr<net::Transport> transport,
                                     shared_ptr<const Dispatcher> dispatcher, string target_id,
                                     std::chrono::seconds duration)
    : transport_{std::move(transport)}, dispatcher_{std::move(dispatcher)},
      target_id_{std::move(target_id)}, duration_{duration} {
  if (transport_ == nullptr || dispatcher_ == nullptr)
    throw std::invalid_argument{"session controller requires a transport and a dispatcher"};
  transport_->set_events(*this);
}

SessionController::~SessionController() {
  stop();
  wait();
  session_timer_.reset(); // before the transport, which owns the timer's io_context

  // Joins the I/O thread, which may still be returning from the terminal callback
  transport_.reset();
}

// ----------------------------------------------------------------------------------------- control

void SessionController::start() {
  {
    std::lock_guard lock{padlock_};
    if (state_ != SessionState::IDLE)
      throw std::logic_error{format("start called on a session that is {}", str(state_))};
    state_ = SessionState::AWAITING_HANDSHAKE;
  }

  try {
    transport_->connect();
  } catch (const SessionError& e) {
    LOG_ERR("debug session failed to start: {}", e.what());
    terminate_(SessionOutcome::FAILED, e.code());
    throw;
  }
}

error_code SessionController::wait() {
  std::unique_lock lock{padlock_};
  cv_.wait(lock, [this]() { return state_ == SessionState::TERMINATED; });
  return terminal_error_;
}

std::optional<error_code> SessionController::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock lock{padlock_};
  if (!cv_.wait_for(lock, timeout, [this]() { return state_ == SessionState::TERMINATED; }))
    return std::nullopt;
  return terminal_error_;
}

void SessionController::stop() {
  SessionState state;
  {
    std::lock_guard lock{padlock_};
    stop_requested_ = true;
    state = state_;
    if (state_ == SessionState::IDLE) {
      state_ = SessionState::TERMINATED;
      outcome_ = SessionOutcome::CLOSED;
    }
  }

  switch (state) {
  case SessionState::IDLE:
    transport_->close();
    cv_.notify_all();
    break;
  case SessionState::AWAITING_HANDSHAKE:
    transport_->interrupt();
    break;
  case SessionState::ACTIVE:
    transport_->close(1000, "debug session stopped");
    break;
  case SessionState::TERMINATED:
    break;
  }
}

SessionState SessionController::state() const {
  std::lock_guard lock{padlock_};
  return state_;
}

SessionOutcome SessionController::outcome() const {
  std::lock_guard lock{padlock_};
  return outcome_;
}

SessionCounters SessionController::counters() const {
  return {.received = received_.load(),
          .responded = responded_.load(),
          .dropped = dropped_.load()};
}

// ---------------------------------------------------------------------------------- events: open

void SessionController::on_open() {
  bool stop_requested = false;
  {
    std::lock_guard lock{padlock_};
    if (state_ != SessionState::AWAITING_HANDSHAKE)
      return;
    state_ = SessionState::ACTIVE;
    stop_requested = stop_requested_;
  }

  if (stop_requested) {
    INFO("debug session stopped during the handshake");
    transport_->close(1000, "debug session stopped");
    return;
  }

  INFO("*****Starting Skill Debug Session*****");
  INFO("*****NOTE: Skill debugging is currently only available for invocations from customers "
       "in the North America region*****");
  if (duration_ == std::chrono::hours{1}) {
    INFO("*****Session will last for 1 hour*****");
  } else {
    INFO("*****Session will last for {} seconds*****", duration_.count());
  }

  arm_session_timer_();
}

void SessionController::arm_session_timer_() {
  session_timer_.emplace(transport_->timer_factory()());
  session_timer_->expires_after(duration_);
  session_timer_->async_wait(
      [this](const boost::system::error_code& ec) { on_session_expired_(ec); });
}

void SessionController::on_session_expired_(const boost::system::error_code& ec) {
  if (ec == boost::asio::error::operation_aborted)
    return;
  if (ec) {
    WARN("session timer error: {}", ec.message());
    return;
  }
  if (state() != SessionState::ACTIVE)
    return;
  INFO("debug session expired after {} seconds", duration_.count());
  transport_->close(1000, "debug session expired");
}

// ------------------------------------------------------------------------------- events: message

void SessionController::on_message(std::span<const std::byte> payload, net::FrameKind kind) {
  received_.fetch_add(1, std::memory_order_acq_rel);

  const auto drop = [this]() { dropped_.fetch_add(1, std::memory_order_acq_rel); };

  if (state() != SessionState::ACTIVE || transport_->state() != TransportState::OPEN) {
    drop();
    return;
  }

  const auto text = frame_to_text(payload);
  if (kind == net::FrameKind::BINARY)
    TRACE("binary frame:\n{}", hexdump(payload));

  const auto request = decode_request(text);
  if (!request) {
    WARN("dropping malformed {} frame ({} bytes): {}",
         (kind == net::FrameKind::TEXT ? "text" : "binary"), payload.size(), elide(text, 120));
    drop();
    return;
  }

  LOG_DEBUG("Skill request {}:\n{}", request->request_id, elide(request->request_payload, 4096));

  auto response = dispatcher_->invoke(*request, target_id_);
  if (!response) {
    drop();
    fail_(response.error(), 1011, "invocation failure");
    return;
  }

  // The connection can fail while the target runs
  if (transport_->state() != TransportState::OPEN) {
    WARN("connection lost before the response to request {} could be sent",
         request->request_id);
    drop();
    return;
  }

  const auto encoded = encode_response(*response);
  LOG_DEBUG("Skill response {}:\n{}", request->request_id, elide(encoded, 4096));
  transport_->send(encoded);
  responded_.fetch_add(1, std::memory_order_acq_rel);
}

// ------------------------------------------------------------------------ events: close and error

void SessionController::on_close(uint16_t code, std::string_view reason, Initiator initiator) {
  INFO("Connection closed by {}, code: {}, reason: '{}'", str(initiator), code, reason);
  terminate_(SessionOutcome::CLOSED, {});
}

void SessionController::on_error(net::WebsocketOperation operation, std::error_code ec) {
  LOG_ERR("Encountered error in websocket connection, during {}: {}", str(operation),
          ec.message());
  terminate_(SessionOutcome::FAILED, make_error_code(ecode::transport_error));
}

// ----------------------------------------------------------------------------------- termination

void SessionController::fail_(error_code ec, uint16_t close_code, std::string_view close_reason) {
  LOG_ERR("debug session failed: {}", ec.message());
  {
    std::lock_guard lock{padlock_};
    if (state_ == SessionState::TERMINATED)
      return;
    escalated_error_ = ec;
  }
  // The close may report back synchronously, and `terminate_` must be the last thing done
  transport_->close(close_code, close_reason);
  terminate_(SessionOutcome::FAILED, ec);
}

void SessionController::terminate_(SessionOutcome outcome, error_code ec) {
  {
    std::lock_guard lock{padlock_};
    if (state_ == SessionState::TERMINATED)
      return;
    if (escalated_error_) {
      outcome = SessionOutcome::FAILED;
      ec = *escalated_error_;
    }
    state_ = SessionState::TERMINATED;
    outcome_ = outcome;
    terminal_error_ = ec;
    if (session_timer_)
      session_timer_->cancel(); // under the lock, so `wait` returns after the cancel

    INFO("debug session terminated ({}), received={}, responded={}, dropped={}",
         (outcome == SessionOutcome::CLOSED ? "closed" : "failed"), received_.load(),
         responded_.load(), dropped_.load());
    cv_.notify_all();
  }
}

} // namespace tether::session
