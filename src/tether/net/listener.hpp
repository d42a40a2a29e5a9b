
#pragma once

#include "connection.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace tether::net {

/**
 * @brief Accepts incoming connections on a tcp port, or a unix-domain socket path.
 */
class Listener {
public:
  virtual ~Listener() = default;

  /**
   * @brief Block until a new connection arrives.
   * After `close`, returns `boost::asio::error::operation_aborted` (as a `std::error_code`).
   */
  virtual std::error_code accept(std::unique_ptr<Connection>& out) = 0;

  /**
   * @brief Stop listening. Safe to call from any thread; wakes a blocked `accept`.
   */
  virtual void close() = 0;

  virtual bool is_closed() const = 0;

  /** @brief "host:port" for tcp, or the socket path for unix listeners */
  virtual std::string local_address() const = 0;

  /** @brief The bound port for tcp listeners, `0` otherwise */
  virtual uint16_t port() const = 0;
};

/**
 * @brief Start listening.
 * @param network Either "tcp" (`address` is "host:port", port `0` picks a free port) or
 *                "unix" (`address` is a filesystem path, which must not exist).
 */
std::error_code listen(std::string_view network, std::string_view address,
                       std::unique_ptr<Listener>& out);

} // namespace tether::net
