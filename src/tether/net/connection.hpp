
#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tether::net {

/**
 * @brief A bidirectional, blocking byte stream: a connected TCP or unix socket.
 *
 * One thread may read while another thread writes. `close` may be called from any
 * thread: it shuts the stream down in both directions, so that a blocked reader
 * wakes up with `ecode::end_of_stream` (or an error). The underlying descriptor is
 * released when the connection is destroyed.
 */
class Connection {
public:
  virtual ~Connection() = default;

  /**
   * @brief Read at least one byte into `buffer`, blocking until data arrives.
   * A clean close by the peer is reported as `ecode::end_of_stream`.
   * @return The number of bytes read.
   */
  virtual std::size_t read_some(std::span<std::byte> buffer, std::error_code& ec) = 0;

  /**
   * @brief Write all of `buffer`, blocking until it has been handed to the operating system.
   */
  virtual std::error_code write_all(std::span<const std::byte> buffer) = 0;

  /**
   * @brief Shut the stream down; idempotent.
   */
  virtual std::error_code close() = 0;

  virtual bool is_closed() const = 0;

  /**
   * @brief A printable description of the peer, for logging.
   */
  virtual std::string remote_address() const = 0;
};

/**
 * @brief Fill `buffer` exactly, or fail. A peer that closes part way through
 *        results in `ecode::premature_eof`; before the first byte in `ecode::end_of_stream`.
 */
std::error_code read_exact(Connection& connection, std::span<std::byte> buffer);

/**
 * @brief Open a connection.
 * @param network Either "tcp" (`address` is "host:port") or "unix" (`address` is a path).
 * @param out Set to the new connection on success.
 */
std::error_code dial(std::string_view network, std::string_view address,
                     std::unique_ptr<Connection>& out);

/**
 * @brief Create two unix-domain connections that are connected to each other.
 */
std::error_code make_connection_pair(std::unique_ptr<Connection>& a,
                                     std::unique_ptr<Connection>& b);

/**
 * @brief Split "host:port" (or "[v6-host]:port") into its parts.
 * @return false if `address` is malformed.
 */
bool split_host_port(std::string_view address, std::string& host, std::string& port);

} // namespace tether::net
