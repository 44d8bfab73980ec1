#pragma once

#include "tether/net/websockets/transport.hpp"
#include "tether/utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <atomic>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace tether::test {

/**
 * @brief An in-memory `Transport`. Inbound events are posted to `io_context`, which the
 * test runs, standing in for the transport's I/O thread. `close` completes synchronously.
 */
class FakeTransport final : public net::Transport {
private:
  boost::asio::io_context& io_context_;
  net::TransportEvents* events_ = nullptr;
  std::atomic<net::TransportState> state_{net::TransportState::UNCONNECTED};
  std::optional<ecode> connect_failure_;
  bool terminal_fired_ = false;

  mutable std::mutex padlock_;
  vector<string> sent_;
  int close_calls_ = 0;
  uint16_t last_close_code_ = 0;
  bool interrupted_ = false;

public:
  explicit FakeTransport(boost::asio::io_context& io_context) : io_context_{io_context} {}

  /** @brief The next `connect` throws `SessionError(code)`. */
  void fail_connect_with(ecode code) { connect_failure_ = code; }

  // @{ Transport
  void set_events(net::TransportEvents& events) override { events_ = &events; }

  void connect() override {
    auto expected = net::TransportState::UNCONNECTED;
    if (!state_.compare_exchange_strong(expected, net::TransportState::CONNECTING))
      throw std::logic_error{"connect called twice"};
    if (interrupted()) {
      state_.store(net::TransportState::FAILED);
      throw SessionError{ecode::interrupted_connect, "fake connect interrupted"};
    }
    if (connect_failure_) {
      state_.store(net::TransportState::FAILED);
      throw SessionError{*connect_failure_, "fake connect failure"};
    }
    state_.store(net::TransportState::OPEN);
    events_->on_open();
  }

  void send(std::string_view text) override {
    if (state_.load() != net::TransportState::OPEN)
      throw std::logic_error{"send outside OPEN"};
    std::lock_guard lock{padlock_};
    sent_.emplace_back(text);
  }

  void close(uint16_t code, std::string_view reason) override {
    {
      std::lock_guard lock{padlock_};
      ++close_calls_;
      last_close_code_ = code;
    }
    auto expected = net::TransportState::UNCONNECTED;
    if (state_.compare_exchange_strong(expected, net::TransportState::CLOSED))
      return;
    expected = net::TransportState::OPEN;
    if (!state_.compare_exchange_strong(expected, net::TransportState::CLOSED))
      return;
    fire_close_(code, reason, net::Initiator::LOCAL);
  }

  void interrupt() override {
    std::lock_guard lock{padlock_};
    interrupted_ = true;
  }

  net::TransportState state() const override { return state_.load(); }

  net::SteadyTimerFactory timer_factory() override {
    return net::make_steady_timer_factory(io_context_);
  }
  // @}

  // @{ Test drivers, delivered when the test runs `io_context`
  void deliver_text(string text) { deliver_(std::move(text), net::FrameKind::TEXT); }
  void deliver_binary(string bytes) { deliver_(std::move(bytes), net::FrameKind::BINARY); }

  void remote_close(uint16_t code, string reason) {
    boost::asio::post(io_context_, [this, code, reason]() {
      auto expected = net::TransportState::OPEN;
      if (state_.compare_exchange_strong(expected, net::TransportState::CLOSED))
        fire_close_(code, reason, net::Initiator::REMOTE);
    });
  }

  void inject_error(net::WebsocketOperation operation, std::error_code ec) {
    boost::asio::post(io_context_, [this, operation, ec]() { fail_now(operation, ec); });
  }

  /** @brief Fail synchronously, as if a write failed underneath the current callback. */
  void fail_now(net::WebsocketOperation operation, std::error_code ec) {
    const auto prior = state_.exchange(net::TransportState::FAILED);
    if (prior == net::TransportState::CLOSED || prior == net::TransportState::FAILED) {
      state_.store(prior);
      return;
    }
    if (!terminal_fired_) {
      terminal_fired_ = true;
      events_->on_error(operation, ec);
    }
  }
  // @}

  vector<string> sent() const {
    std::lock_guard lock{padlock_};
    return sent_;
  }

  int close_calls() const {
    std::lock_guard lock{padlock_};
    return close_calls_;
  }

  uint16_t last_close_code() const {
    std::lock_guard lock{padlock_};
    return last_close_code_;
  }

  bool interrupted() const {
    std::lock_guard lock{padlock_};
    return interrupted_;
  }

private:
  void deliver_(string payload, net::FrameKind kind) {
    boost::asio::post(io_context_, [this, payload = std::move(payload), kind]() {
      if (state_.load() != net::TransportState::OPEN)
        return;
      events_->on_message(
          std::span<const std::byte>{reinterpret_cast<const std::byte*>(payload.data()),
                                     payload.size()},
          kind);
    });
  }

  void fire_close_(uint16_t code, std::string_view reason, net::Initiator initiator) {
    if (terminal_fired_)
      return;
    terminal_fired_ = true;
    events_->on_close(code, reason, initiator);
  }
};

} // namespace tether::test
