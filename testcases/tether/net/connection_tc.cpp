
#include "stdinc.hpp"

#include "tether/net.hpp"
#include "tether/utils/error-codes.hpp"

#include <catch2/catch.hpp>

#include <thread>

namespace tether::net::tests {

namespace {
std::span<const std::byte> as_bytes(std::string_view ss) {
  return std::as_bytes(std::span<const char>{ss.data(), ss.size()});
}
} // namespace

CATCH_TEST_CASE("Buffer", "[buffer]") {
  CATCH_SECTION("integers-are-big-endian") {
    BufferType buffer;
    append_integer(buffer, uint32_t(0x01020304));
    CATCH_REQUIRE(buffer.size() == 4);
    CATCH_REQUIRE(buffer[0] == std::byte{0x01});
    CATCH_REQUIRE(buffer[3] == std::byte{0x04});
    CATCH_REQUIRE(load_integer<uint32_t>(buffer) == 0x01020304u);
  }

  CATCH_SECTION("strings") {
    BufferType buffer = make_send_buffer("ab");
    buffer << std::string_view{"cd"};
    CATCH_REQUIRE(buffer.size() == 4);
    CATCH_REQUIRE(buffer[2] == std::byte{'c'});
  }
}

CATCH_TEST_CASE("Connection", "[connection]") {
  CATCH_SECTION("split-host-port") {
    std::string host, port;
    CATCH_REQUIRE(split_host_port("127.0.0.1:80", host, port));
    CATCH_REQUIRE(host == "127.0.0.1");
    CATCH_REQUIRE(port == "80");
    CATCH_REQUIRE(split_host_port("[::1]:8080", host, port));
    CATCH_REQUIRE(host == "::1");
    CATCH_REQUIRE(port == "8080");
    CATCH_REQUIRE(split_host_port(":0", host, port));
    CATCH_REQUIRE(host.empty());
    CATCH_REQUIRE(!split_host_port("localhost", host, port));
    CATCH_REQUIRE(!split_host_port("localhost:", host, port));
    CATCH_REQUIRE(!split_host_port("localhost:http", host, port));
    CATCH_REQUIRE(!split_host_port("::1:80", host, port));
  }

  CATCH_SECTION("dial-bad-network") {
    std::unique_ptr<Connection> connection;
    CATCH_REQUIRE(dial("udp", "127.0.0.1:80", connection) == ecode::invalid_address);
    CATCH_REQUIRE(dial("tcp", "no-port-here", connection) == ecode::invalid_address);
    CATCH_REQUIRE(connection == nullptr);
  }

  CATCH_SECTION("pair-read-write") {
    std::unique_ptr<Connection> a, b;
    CATCH_REQUIRE(!make_connection_pair(a, b));
    CATCH_REQUIRE(!a->write_all(as_bytes("hello")));

    std::array<std::byte, 5> buffer;
    CATCH_REQUIRE(!read_exact(*b, buffer));
    CATCH_REQUIRE(buffer[0] == std::byte{'h'});
    CATCH_REQUIRE(buffer[4] == std::byte{'o'});
  }

  CATCH_SECTION("read-exact-eof") {
    std::unique_ptr<Connection> a, b;
    CATCH_REQUIRE(!make_connection_pair(a, b));
    CATCH_REQUIRE(!a->write_all(as_bytes("abc")));
    CATCH_REQUIRE(!a->close());

    std::array<std::byte, 8> buffer;
    CATCH_REQUIRE(read_exact(*b, buffer) == ecode::premature_eof);
    CATCH_REQUIRE(read_exact(*b, buffer) == ecode::end_of_stream);
  }

  CATCH_SECTION("close-wakes-a-blocked-reader") {
    std::unique_ptr<Connection> a, b;
    CATCH_REQUIRE(!make_connection_pair(a, b));

    std::error_code read_ec;
    std::thread reader{[&]() {
      std::array<std::byte, 4> buffer;
      read_ec = read_exact(*b, buffer);
    }};
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    CATCH_REQUIRE(!b->close());
    reader.join();

    CATCH_REQUIRE(read_ec);
    CATCH_REQUIRE(b->is_closed());
    CATCH_REQUIRE(!b->close()); // idempotent
    CATCH_REQUIRE(b->write_all(as_bytes("x")));
  }
}

CATCH_TEST_CASE("BufferedReader", "[buffered-reader]") {
  std::unique_ptr<Connection> a, b;
  CATCH_REQUIRE(!make_connection_pair(a, b));

  CATCH_SECTION("small-capacity-reads-across-fills") {
    BufferType data;
    append_integer(data, uint64_t(0x1122334455667788ull));
    data << std::string_view{"tether"};
    CATCH_REQUIRE(!a->write_all(to_span_bytes(data)));
    CATCH_REQUIRE(!a->close());

    BufferedReader reader{*b, 3};
    uint64_t value = 0;
    CATCH_REQUIRE(!reader.read_integer(value));
    CATCH_REQUIRE(value == 0x1122334455667788ull);

    std::string text;
    CATCH_REQUIRE(!reader.read_string(3, text));
    CATCH_REQUIRE(text == "tet");
    CATCH_REQUIRE(!reader.skip(2));
    CATCH_REQUIRE(!reader.read_string(1, text));
    CATCH_REQUIRE(text == "tetr");

    uint8_t byte = 0;
    CATCH_REQUIRE(reader.read_integer(byte) == ecode::end_of_stream);
  }

  CATCH_SECTION("eof-part-way") {
    CATCH_REQUIRE(!a->write_all(as_bytes("ab")));
    CATCH_REQUIRE(!a->close());

    BufferedReader reader{*b};
    uint32_t value = 0;
    CATCH_REQUIRE(reader.read_integer(value) == ecode::premature_eof);
  }
}

} // namespace tether::net::tests
