
#include "stdinc.hpp"

#include "tether/net.hpp"
#include "tether/utils/error-codes.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <thread>
#include <unistd.h>

namespace tether::net::tests {

CATCH_TEST_CASE("Listener", "[listener]") {
  CATCH_SECTION("tcp-ephemeral-port") {
    std::unique_ptr<Listener> listener;
    CATCH_REQUIRE(!listen("tcp", "127.0.0.1:0", listener));
    CATCH_REQUIRE(listener->port() != 0);

    std::unique_ptr<Connection> accepted;
    std::error_code accept_ec;
    std::thread acceptor{[&]() { accept_ec = listener->accept(accepted); }};

    std::unique_ptr<Connection> dialed;
    CATCH_REQUIRE(!dial("tcp", format("127.0.0.1:{}", listener->port()), dialed));
    acceptor.join();
    CATCH_REQUIRE(!accept_ec);
    CATCH_REQUIRE(accepted != nullptr);

    const std::array<std::byte, 2> ping{std::byte{1}, std::byte{2}};
    CATCH_REQUIRE(!dialed->write_all(ping));
    std::array<std::byte, 2> pong;
    CATCH_REQUIRE(!read_exact(*accepted, pong));
    CATCH_REQUIRE(pong == ping);
  }

  CATCH_SECTION("close-unblocks-accept") {
    std::unique_ptr<Listener> listener;
    CATCH_REQUIRE(!listen("tcp", "127.0.0.1:0", listener));

    std::error_code accept_ec;
    std::thread acceptor{[&]() {
      std::unique_ptr<Connection> accepted;
      accept_ec = listener->accept(accepted);
    }};
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    listener->close();
    acceptor.join();

    CATCH_REQUIRE(accept_ec == std::errc::operation_canceled);
    CATCH_REQUIRE(listener->is_closed());
  }

  CATCH_SECTION("unix") {
    const auto path = (std::filesystem::temp_directory_path()
                       / format("tether-listener-{}.sock", ::getpid()))
                          .string();
    std::filesystem::remove(path);
    {
      std::unique_ptr<Listener> listener;
      CATCH_REQUIRE(!listen("unix", path, listener));
      CATCH_REQUIRE(listener->local_address() == path);
      CATCH_REQUIRE(listener->port() == 0);

      std::unique_ptr<Connection> accepted;
      std::error_code accept_ec;
      std::thread acceptor{[&]() { accept_ec = listener->accept(accepted); }};
      std::unique_ptr<Connection> dialed;
      CATCH_REQUIRE(!dial("unix", path, dialed));
      acceptor.join();
      CATCH_REQUIRE(!accept_ec);
      CATCH_REQUIRE(accepted != nullptr);
    }
    CATCH_REQUIRE(!std::filesystem::exists(path));
  }

  CATCH_SECTION("bad-network") {
    std::unique_ptr<Listener> listener;
    CATCH_REQUIRE(listen("sctp", "127.0.0.1:0", listener) == ecode::invalid_address);
  }
}

} // namespace tether::net::tests
