
#include "stdinc.hpp"

#include "connection.hpp"

#include "detail/socket-connection.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/local/connect_pair.hpp>

namespace tether::net {

namespace asio = boost::asio;

namespace detail {

asio::io_context& blocking_io_context() {
  static asio::io_context io_context;
  return io_context;
}

std::error_code to_error_code(const boost::system::error_code& ec) {
  if (!ec)
    return {};
  if (ec == asio::error::eof)
    return make_error_code(ecode::end_of_stream);
  if (ec.category() == boost::system::system_category())
    return {ec.value(), std::system_category()};
  return static_cast<std::error_code>(ec);
}

std::string to_string(const asio::ip::tcp::endpoint& endpoint) {
  const auto address = endpoint.address();
  return address.is_v6() ? format("[{}]:{}", address.to_string(), endpoint.port())
                         : format("{}:{}", address.to_string(), endpoint.port());
}

std::string to_string(const asio::local::stream_protocol::endpoint& endpoint) {
  return endpoint.path();
}

} // namespace detail

// -------------------------------------------------------------------------------------- read_exact

std::error_code read_exact(Connection& connection, std::span<std::byte> buffer) {
  std::size_t offset = 0;
  while (offset < buffer.size()) {
    std::error_code ec;
    const auto n = connection.read_some(buffer.subspan(offset), ec);
    offset += n;
    if (ec) {
      if (ec == ecode::end_of_stream && offset > 0 && offset < buffer.size())
        return make_error_code(ecode::premature_eof);
      if (offset < buffer.size())
        return ec;
    }
  }
  return {};
}

// --------------------------------------------------------------------------------- split_host_port

bool split_host_port(std::string_view address, std::string& host, std::string& port) {
  const auto pos = address.rfind(':');
  if (pos == std::string_view::npos || pos + 1 == address.size())
    return false;
  auto host_part = address.substr(0, pos);
  if (host_part.size() >= 2 && host_part.front() == '[' && host_part.back() == ']')
    host_part = host_part.substr(1, host_part.size() - 2);
  else if (host_part.find(':') != std::string_view::npos)
    return false; // An ipv6 host must be bracketed
  host = std::string{host_part};
  port = std::string{address.substr(pos + 1)};
  return std::all_of(cbegin(port), cend(port), [](char c) { return c >= '0' && c <= '9'; });
}

// -------------------------------------------------------------------------------------------- dial

static std::error_code dial_tcp(std::string_view address, std::unique_ptr<Connection>& out) {
  std::string host, port;
  if (!split_host_port(address, host, port))
    return make_error_code(ecode::invalid_address);

  boost::system::error_code ec;
  asio::ip::tcp::resolver resolver{detail::blocking_io_context()};
  const auto endpoints = resolver.resolve(host, port, ec);
  if (ec)
    return detail::to_error_code(ec);

  asio::ip::tcp::socket socket{detail::blocking_io_context()};
  const auto endpoint = asio::connect(socket, endpoints, ec);
  if (ec)
    return detail::to_error_code(ec);

  socket.set_option(asio::ip::tcp::no_delay{true}, ec);
  if (ec)
    WARN("failed to set TCP_NODELAY on connection to {}: {}", address, ec.message());

  out = std::make_unique<detail::TcpConnection>(std::move(socket), detail::to_string(endpoint));
  return {};
}

static std::error_code dial_unix(std::string_view path, std::unique_ptr<Connection>& out) {
  if (path.empty())
    return make_error_code(ecode::invalid_address);

  boost::system::error_code ec;
  asio::local::stream_protocol::socket socket{detail::blocking_io_context()};
  socket.connect(asio::local::stream_protocol::endpoint{std::string{path}}, ec);
  if (ec)
    return detail::to_error_code(ec);

  out = std::make_unique<detail::UnixConnection>(std::move(socket), std::string{path});
  return {};
}

std::error_code dial(std::string_view network, std::string_view address,
                     std::unique_ptr<Connection>& out) {
  if (network == "tcp")
    return dial_tcp(address, out);
  if (network == "unix")
    return dial_unix(address, out);
  return make_error_code(ecode::invalid_address);
}

// ---------------------------------------------------------------------------- make_connection_pair

std::error_code make_connection_pair(std::unique_ptr<Connection>& a,
                                     std::unique_ptr<Connection>& b) {
  asio::local::stream_protocol::socket s1{detail::blocking_io_context()};
  asio::local::stream_protocol::socket s2{detail::blocking_io_context()};
  boost::system::error_code ec;
  asio::local::connect_pair(s1, s2, ec);
  if (ec)
    return detail::to_error_code(ec);
  a = std::make_unique<detail::UnixConnection>(std::move(s1), "socketpair");
  b = std::make_unique<detail::UnixConnection>(std::move(s2), "socketpair");
  return {};
}

} // namespace tether::net
