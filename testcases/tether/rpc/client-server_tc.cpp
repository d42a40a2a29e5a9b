
#include "stdinc.hpp"

#include "arith-service.hpp"

#include "tether/net.hpp"
#include "tether/rpc.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace tether::rpc::tests {

namespace {
/**
 * A server with the Arith service, accepting on an ephemeral tcp port.
 */
struct ServerFixture {
  Server server{Server::Config{4}};
  std::shared_ptr<Service> arith;
  std::unique_ptr<net::Listener> listener;
  std::thread accepting;

  explicit ServerFixture(std::string_view network = "tcp",
                         std::string_view address = "127.0.0.1:0") {
    CATCH_REQUIRE(!build_arith(arith));
    CATCH_REQUIRE(!server.register_service(arith));
    CATCH_REQUIRE(!net::listen(network, address, listener));
    accepting = std::thread{[this]() { server.accept(*listener); }};
  }

  ~ServerFixture() {
    listener->close();
    accepting.join();
    server.shutdown();
  }

  std::string address() const {
    return (listener->port() == 0) ? listener->local_address()
                                   : format("127.0.0.1:{}", listener->port());
  }

  std::unique_ptr<Client> dial(std::string_view network = "tcp") {
    std::unique_ptr<Client> client;
    CATCH_REQUIRE(!Client::dial(network, address(), client));
    CATCH_REQUIRE(client->is_available());
    return client;
  }
};
} // namespace

CATCH_TEST_CASE("ClientServer", "[client][server]") {
  ServerFixture fixture;
  auto client = fixture.dial();

  CATCH_SECTION("add") {
    int64_t reply = 0;
    const auto status = client->call("Arith.Add", Args{1, 2}, reply);
    CATCH_REQUIRE(status.ok());
    CATCH_REQUIRE(reply == 3);
    CATCH_REQUIRE(fixture.arith->find_method("Add")->num_calls() == 1);
  }

  CATCH_SECTION("record-reply") {
    Quotient reply;
    CATCH_REQUIRE(client->call("Arith.Divide", Args{7, 2}, reply).ok());
    CATCH_REQUIRE(reply.quo == 3);
    CATCH_REQUIRE(reply.rem == 1);
  }

  CATCH_SECTION("sequence-reply") {
    std::vector<int64_t> reply;
    CATCH_REQUIRE(client->call("Arith.Range", Args{2, 5}, reply).ok());
    CATCH_REQUIRE(reply == std::vector<int64_t>{2, 3, 4});
    CATCH_REQUIRE(client->call("Arith.Range", Args{5, 5}, reply).ok());
    CATCH_REQUIRE(reply.empty());
  }

  CATCH_SECTION("unknown-method-then-valid-call") {
    int64_t reply = 0;
    auto status = client->call("Arith.Missing", Args{1, 2}, reply);
    CATCH_REQUIRE(status.error_code() == ecode::remote_error);
    CATCH_REQUIRE(status.error_message() ==
                  "rpc server: cannot find method Missing on service Arith");

    // The connection survives, and the stream is still aligned
    status = client->call("Arith.Add", Args{20, 22}, reply);
    CATCH_REQUIRE(status.ok());
    CATCH_REQUIRE(reply == 42);
    CATCH_REQUIRE(client->is_available());
  }

  CATCH_SECTION("unknown-service-and-ill-formed-names") {
    int64_t reply = 0;
    auto status = client->call("Nope.Add", Args{}, reply);
    CATCH_REQUIRE(status.error_message() == "rpc server: cannot find service Nope");
    status = client->call("ArithAdd", Args{}, reply);
    CATCH_REQUIRE(status.error_message()
                  == "rpc server: service/method request ill-formed: ArithAdd");
    CATCH_REQUIRE(client->call("Arith.Multiply", Args{6, 7}, reply).ok());
    CATCH_REQUIRE(reply == 42);
  }

  CATCH_SECTION("call-level-errors") {
    Quotient quotient;
    auto status = client->call("Arith.Divide", Args{1, 0}, quotient);
    CATCH_REQUIRE(status.error_code() == ecode::remote_error);
    CATCH_REQUIRE(status.error_message() == "divide by zero");

    int64_t reply = 0;
    status = client->call("Arith.Error", Args{}, reply);
    CATCH_REQUIRE(status.error_message() == "ERROR");
    CATCH_REQUIRE(client->is_available());
  }

  CATCH_SECTION("argument-of-the-wrong-shape") {
    int64_t reply = 0;
    const auto status = client->call("Arith.Add", std::string{"one plus two"}, reply);
    CATCH_REQUIRE(status.error_code() == ecode::remote_error);
    CATCH_REQUIRE(status.error_message() == "rpc server: read argument error: type error");
    CATCH_REQUIRE(fixture.arith->find_method("Add")->num_calls() == 0);
    CATCH_REQUIRE(client->call("Arith.Add", Args{1, 1}, reply).ok());
  }

  CATCH_SECTION("reply-of-the-wrong-shape") {
    int64_t reply = 0;
    auto status = client->call("Arith.Range", Args{0, 3}, reply);
    CATCH_REQUIRE(status.error_code() == ecode::type_error);
    CATCH_REQUIRE(client->is_available());
    CATCH_REQUIRE(client->call("Arith.Add", Args{1, 1}, reply).ok());
    CATCH_REQUIRE(reply == 2);
  }

  CATCH_SECTION("responses-out-of-order") {
    auto done = std::make_shared<CallQueue>();
    int64_t slow = 0;
    int64_t fast = 0;
    auto slow_call = client->go_call("Arith.Sleep", Args{200, 7}, slow, done);
    auto fast_call = client->go_call("Arith.Add", Args{1, 2}, fast, done);

    CATCH_REQUIRE(done->pop() == fast_call);
    CATCH_REQUIRE(fast == 3);
    CATCH_REQUIRE(done->pop() == slow_call);
    CATCH_REQUIRE(slow == 7);
    CATCH_REQUIRE(slow_call->sequence() + 1 == fast_call->sequence());
  }

  CATCH_SECTION("concurrent-callers") {
    constexpr int k_threads = 8;
    constexpr int k_calls = 50;
    std::atomic<int> failures{0};
    std::vector<std::thread> callers;
    for (int t = 0; t < k_threads; ++t) {
      callers.emplace_back([&, t]() {
        for (int i = 0; i < k_calls; ++i) {
          int64_t reply = 0;
          const auto status = client->call("Arith.Multiply", Args{t, i}, reply);
          if (!status.ok() || reply != int64_t(t) * i)
            failures.fetch_add(1);
        }
      });
    }
    for (auto& thread : callers)
      thread.join();
    CATCH_REQUIRE(failures.load() == 0);
    CATCH_REQUIRE(fixture.arith->find_method("Multiply")->num_calls() == k_threads * k_calls);
    CATCH_REQUIRE(client->pending_count() == 0);
  }

  CATCH_SECTION("large-responses-never-interleave") {
    // Many big replies are written concurrently on one connection
    constexpr int k_calls = 32;
    auto done = std::make_shared<CallQueue>();
    std::vector<std::string> texts(k_calls);
    std::vector<std::string> replies(k_calls);
    for (int i = 0; i < k_calls; ++i) {
      texts[std::size_t(i)] = std::string(64 * 1024 + std::size_t(i), char('a' + i % 26));
      client->go_call("Arith.Echo", texts[std::size_t(i)], replies[std::size_t(i)], done);
    }
    for (int i = 0; i < k_calls; ++i)
      CATCH_REQUIRE(done->pop()->status().ok());
    CATCH_REQUIRE(replies == texts);
  }

  CATCH_SECTION("close") {
    CATCH_REQUIRE(!client->close());
    CATCH_REQUIRE(!client->is_available());
    CATCH_REQUIRE(client->close() == ecode::already_closed);

    int64_t reply = 0;
    const auto status = client->call("Arith.Add", Args{1, 2}, reply);
    CATCH_REQUIRE(status.error_code() == ecode::shutdown);
    CATCH_REQUIRE(reply == 0);
  }

  CATCH_SECTION("many-clients") {
    auto other = fixture.dial();
    int64_t a = 0;
    int64_t b = 0;
    CATCH_REQUIRE(client->call("Arith.Add", Args{1, 1}, a).ok());
    CATCH_REQUIRE(other->call("Arith.Add", Args{2, 2}, b).ok());
    CATCH_REQUIRE(!other->close());
    CATCH_REQUIRE(client->call("Arith.Add", Args{3, 3}, a).ok());
    CATCH_REQUIRE(a == 6);
    CATCH_REQUIRE(b == 4);
  }

  CATCH_SECTION("server-shutdown-settles-pending-calls") {
    int64_t reply = 0;
    auto call = client->go_call("Arith.Sleep", Args{300, 1}, reply);
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    fixture.server.shutdown();

    // The method finishes, but the connection is already closed
    const auto status = call->wait();
    CATCH_REQUIRE(status.error_code() == ecode::shutdown);
    CATCH_REQUIRE(!client->is_available());
  }

  CATCH_SECTION("a-peer-that-never-reads-stalls-only-itself") {
    std::unique_ptr<net::Connection> stalled;
    CATCH_REQUIRE(!net::dial("tcp", fixture.address(), stalled));
    CATCH_REQUIRE(!stalled->write_all(encode_preamble(k_binary_codec)));

    // Far more response bytes than the socket buffers hold; never read
    constexpr int k_requests = 16;
    const std::string text(1024 * 1024, 'x');
    for (int i = 0; i < k_requests; ++i) {
      net::BufferType buffer;
      CATCH_REQUIRE(!BinaryCodec::encode(buffer, Header{uint64_t(i + 1), "Arith.Echo", ""}));
      CATCH_REQUIRE(!BinaryCodec::encode(buffer, Value{text}));
      CATCH_REQUIRE(!stalled->write_all(net::to_span_bytes(buffer)));
    }

    auto* echo = fixture.arith->find_method("Echo");
    for (int i = 0; i < 200 && echo->num_calls() == 0; ++i)
      std::this_thread::sleep_for(std::chrono::milliseconds{10});
    CATCH_REQUIRE(echo->num_calls() > 0);
    std::this_thread::sleep_for(std::chrono::milliseconds{100});

    int64_t reply = 0;
    const auto status =
        client->call_for("Arith.Add", Args{1, 2}, reply, std::chrono::seconds{3});
    CATCH_REQUIRE(status.ok());
    CATCH_REQUIRE(reply == 3);
  }
}

CATCH_TEST_CASE("ClientServerUnix", "[client][server]") {
  const auto path = (std::filesystem::temp_directory_path()
                     / format("tether-rpc-{}.sock", ::getpid()))
                        .string();
  std::filesystem::remove(path);

  ServerFixture fixture{"unix", path};
  auto client = fixture.dial("unix");
  int64_t reply = 0;
  CATCH_REQUIRE(client->call("Arith.Add", Args{1, 2}, reply).ok());
  CATCH_REQUIRE(reply == 3);
}

CATCH_TEST_CASE("Dial", "[client]") {
  CATCH_SECTION("unknown-codec") {
    ServerFixture fixture;
    std::unique_ptr<Client> client;
    CATCH_REQUIRE(Client::dial("tcp", fixture.address(), client, k_json_codec)
                  == ecode::invalid_codec);
    CATCH_REQUIRE(client == nullptr);
  }

  CATCH_SECTION("nobody-listening") {
    std::unique_ptr<net::Listener> listener;
    CATCH_REQUIRE(!net::listen("tcp", "127.0.0.1:0", listener));
    const auto address = format("127.0.0.1:{}", listener->port());
    listener.reset();

    std::unique_ptr<Client> client;
    CATCH_REQUIRE(Client::dial("tcp", address, client));
    CATCH_REQUIRE(client == nullptr);
  }
}

} // namespace tether::rpc::tests
