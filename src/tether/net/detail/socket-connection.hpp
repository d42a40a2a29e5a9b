
#pragma once

#include "tether/net/connection.hpp"
#include "tether/utils/error-codes.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>

#include <atomic>
#include <mutex>
#include <string>

namespace tether::net::detail {

/**
 * @private
 * @brief The io_context that owns every blocking socket. It is never run: blocking
 *        socket operations do not need it, but asio sockets must belong to one.
 */
boost::asio::io_context& blocking_io_context();

/**
 * @private
 * @brief Convert an asio error to a `std::error_code`; eof becomes `ecode::end_of_stream`.
 */
std::error_code to_error_code(const boost::system::error_code& ec);

std::string to_string(const boost::asio::ip::tcp::endpoint& endpoint);
std::string to_string(const boost::asio::local::stream_protocol::endpoint& endpoint);

/**
 * @private
 * @brief `Connection` over an asio stream socket (tcp, or unix domain).
 */
template <typename Protocol> class SocketConnection final : public Connection {
private:
  using SocketType = typename Protocol::socket;

  SocketType socket_;
  std::string remote_address_;
  mutable std::mutex padlock_; // Guards shutdown
  std::atomic<bool> is_closed_{false};

public:
  SocketConnection(SocketType&& socket, std::string remote_address)
      : socket_{std::move(socket)}, remote_address_{std::move(remote_address)} {}

  ~SocketConnection() override {
    boost::system::error_code ignored;
    socket_.close(ignored);
  }

  std::size_t read_some(std::span<std::byte> buffer, std::error_code& ec) override {
    boost::system::error_code asio_ec;
    const auto n = socket_.read_some(boost::asio::buffer(buffer.data(), buffer.size()), asio_ec);
    ec = to_error_code(asio_ec);
    return n;
  }

  std::error_code write_all(std::span<const std::byte> buffer) override {
    if (is_closed_.load(std::memory_order_acquire))
      return make_error_code(ecode::shutdown);
    boost::system::error_code asio_ec;
    boost::asio::write(socket_, boost::asio::buffer(buffer.data(), buffer.size()), asio_ec);
    return to_error_code(asio_ec);
  }

  std::error_code close() override {
    std::lock_guard lock{padlock_};
    if (is_closed_.exchange(true, std::memory_order_acq_rel))
      return {};
    boost::system::error_code asio_ec;
    socket_.shutdown(SocketType::shutdown_both, asio_ec);
    if (asio_ec == boost::asio::error::not_connected)
      return {}; // The peer got there first
    return to_error_code(asio_ec);
  }

  bool is_closed() const override { return is_closed_.load(std::memory_order_acquire); }

  std::string remote_address() const override { return remote_address_; }
};

using TcpConnection = SocketConnection<boost::asio::ip::tcp>;
using UnixConnection = SocketConnection<boost::asio::local::stream_protocol>;

} // namespace tether::net::detail
