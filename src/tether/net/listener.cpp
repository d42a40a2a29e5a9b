
#include "stdinc.hpp"

#include "listener.hpp"

#include "detail/socket-connection.hpp"

#include <boost/asio/post.hpp>

#include <filesystem>
#include <type_traits>

namespace tether::net {

namespace asio = boost::asio;

namespace detail {

// ---------------------------------------------------------------------------------- SocketListener

/**
 * @private
 * Accepts are performed asynchronously on a private io_context that is run by the
 * accepting thread, so that `close` can cancel them by posting to that io_context.
 */
template <typename Protocol> class SocketListener final : public Listener {
private:
  using AcceptorType = typename Protocol::acceptor;
  using SocketType = typename Protocol::socket;

  asio::io_context io_context_;
  AcceptorType acceptor_;
  std::string local_address_;
  uint16_t port_{0};
  bool is_bound_{false};
  std::mutex accept_padlock_; // One accept at a time
  std::atomic<bool> is_closed_{false};

public:
  SocketListener() : acceptor_{io_context_} {}

  ~SocketListener() override {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    if constexpr (std::is_same_v<Protocol, asio::local::stream_protocol>) {
      std::error_code fs_ec; // The socket file is ours to remove
      if (is_bound_)
        std::filesystem::remove(local_address_, fs_ec);
    }
  }

  /**
   * @brief Open, bind and listen on `endpoint`.
   */
  std::error_code bind(const typename Protocol::endpoint& endpoint, bool reuse_address) {
    boost::system::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec && reuse_address)
      acceptor_.set_option(typename AcceptorType::reuse_address{true}, ec);
    if (!ec)
      acceptor_.bind(endpoint, ec);
    if (!ec)
      acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec)
      return to_error_code(ec);

    const auto bound = acceptor_.local_endpoint(ec);
    if (ec)
      return to_error_code(ec);
    local_address_ = to_string(bound);
    is_bound_ = true;
    if constexpr (std::is_same_v<Protocol, asio::ip::tcp>)
      port_ = bound.port();
    return {};
  }

  std::error_code accept(std::unique_ptr<Connection>& out) override {
    std::lock_guard lock{accept_padlock_};
    if (is_closed())
      return to_error_code(asio::error::operation_aborted);

    SocketType socket{blocking_io_context()};
    typename Protocol::endpoint endpoint;
    boost::system::error_code result = asio::error::would_block;
    acceptor_.async_accept(socket, endpoint,
                           [&result](const boost::system::error_code& ec) { result = ec; });
    io_context_.restart();
    io_context_.run();

    if (result)
      return to_error_code(result);
    out = std::make_unique<SocketConnection<Protocol>>(std::move(socket), to_string(endpoint));
    return {};
  }

  void close() override {
    if (is_closed_.exchange(true, std::memory_order_acq_rel))
      return;
    asio::post(io_context_, [this]() {
      boost::system::error_code ignored;
      acceptor_.close(ignored);
    });
  }

  bool is_closed() const override { return is_closed_.load(std::memory_order_acquire); }

  std::string local_address() const override { return local_address_; }

  uint16_t port() const override { return port_; }
};

} // namespace detail

// ------------------------------------------------------------------------------------------ listen

static std::error_code listen_tcp(std::string_view address, std::unique_ptr<Listener>& out) {
  std::string host, port;
  if (!split_host_port(address, host, port))
    return make_error_code(ecode::invalid_address);

  boost::system::error_code ec;
  asio::ip::tcp::resolver resolver{detail::blocking_io_context()};
  const auto endpoints = resolver.resolve(host, port, asio::ip::tcp::resolver::passive, ec);
  if (ec)
    return detail::to_error_code(ec);
  if (endpoints.empty())
    return make_error_code(ecode::invalid_address);

  auto listener = std::make_unique<detail::SocketListener<asio::ip::tcp>>();
  if (auto bind_ec = listener->bind(*endpoints.begin(), true))
    return bind_ec;
  out = std::move(listener);
  return {};
}

static std::error_code listen_unix(std::string_view path, std::unique_ptr<Listener>& out) {
  if (path.empty())
    return make_error_code(ecode::invalid_address);

  auto listener = std::make_unique<detail::SocketListener<asio::local::stream_protocol>>();
  if (auto ec = listener->bind(asio::local::stream_protocol::endpoint{std::string{path}}, false))
    return ec;
  out = std::move(listener);
  return {};
}

std::error_code listen(std::string_view network, std::string_view address,
                       std::unique_ptr<Listener>& out) {
  if (network == "tcp")
    return listen_tcp(address, out);
  if (network == "unix")
    return listen_unix(address, out);
  return make_error_code(ecode::invalid_address);
}

} // namespace tether::net
