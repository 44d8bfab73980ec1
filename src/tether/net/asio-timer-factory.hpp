#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <functional>

namespace tether::net {

using SteadyTimerFactory = std::function<boost::asio::steady_timer()>;

/**
 * @brief Type erase the creation of steady-timer objects
 */
inline SteadyTimerFactory make_steady_timer_factory(boost::asio::io_context& io_context) {
  return [&io_context]() { return boost::asio::steady_timer{io_context}; };
}

} // namespace tether::net
