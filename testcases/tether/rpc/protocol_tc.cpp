
#include "stdinc.hpp"

#include "arith-service.hpp"

#include "tether/net.hpp"
#include "tether/rpc.hpp"

#include <catch2/catch.hpp>

#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <thread>

namespace tether::rpc::tests {

namespace {
/**
 * A client whose server is played by hand, through `peer`.
 */
struct ScriptedPeer {
  std::unique_ptr<Client> client;
  std::shared_ptr<BinaryCodec> peer;
  net::Connection* wire = nullptr; // owned by `peer`

  ScriptedPeer() {
    std::unique_ptr<net::Connection> a, b;
    CATCH_REQUIRE(!net::make_connection_pair(a, b));
    CATCH_REQUIRE(!Client::make(std::move(a), k_binary_codec, client));

    Preamble preamble;
    CATCH_REQUIRE(!net::read_exact(*b, preamble));
    uint32_t codec_type = 99;
    CATCH_REQUIRE(!decode_preamble(preamble, codec_type));
    CATCH_REQUIRE(codec_type == k_binary_codec);
    wire = b.get();
    peer = std::make_shared<BinaryCodec>(std::move(b));
  }

  Header read_request(Value* body = nullptr) {
    Header header;
    CATCH_REQUIRE(!peer->read_header(header));
    CATCH_REQUIRE(!peer->read_body(body));
    return header;
  }

  void respond(const Header& request, const Value& reply, std::string error_text = "") {
    CATCH_REQUIRE(!peer->write(Header{request.sequence, request.procedure_name, error_text},
                               error_text.empty() ? reply : Value{}));
  }
};

/**
 * A server, fed by hand through `raw`.
 */
struct ScriptedClient {
  Server server{Server::Config{2}};
  std::unique_ptr<net::Connection> raw;
  std::shared_ptr<BinaryCodec> codec; // takes over `raw`, see `speak_binary()`
  net::Connection* wire = nullptr;
  std::thread serving;

  ScriptedClient() {
    std::shared_ptr<Service> arith;
    CATCH_REQUIRE(!build_arith(arith));
    CATCH_REQUIRE(!server.register_service(arith));

    std::unique_ptr<net::Connection> end;
    CATCH_REQUIRE(!net::make_connection_pair(raw, end));
    wire = raw.get();
    serving = std::thread{[this, end = std::move(end)]() mutable {
      server.serve_connection(std::move(end));
    }};
  }

  ~ScriptedClient() {
    const auto ec = raw ? raw->close() : codec->close();
    if (ec) {
      TRACE("close: {}", ec.message());
    }
    if (serving.joinable())
      serving.join();
  }

  void send(std::span<const std::byte> bytes) { CATCH_REQUIRE(!raw->write_all(bytes)); }

  BinaryCodec& speak_binary() {
    send(encode_preamble(k_binary_codec));
    codec = std::make_shared<BinaryCodec>(std::move(raw));
    return *codec;
  }

  std::error_code raw_write(const net::BufferType& buffer) {
    return wire->write_all(net::to_span_bytes(buffer));
  }
};

/**
 * Hands the server a fixed list of requests, then reports end of stream. Records every
 * response, and how many had been written when the server closed it.
 */
class ScriptedCodec final : public Codec {
private:
  mutable std::mutex padlock_;
  std::deque<std::pair<Header, Value>> requests_;
  Value body_;
  std::vector<std::pair<Header, Value>> written_;
  std::optional<std::size_t> written_before_close_;

public:
  void add_request(Header header, Value body) {
    requests_.emplace_back(std::move(header), std::move(body));
  }

  std::error_code read_header(Header& header) override {
    std::lock_guard lock{padlock_};
    if (requests_.empty())
      return make_error_code(ecode::end_of_stream);
    header = std::move(requests_.front().first);
    body_ = std::move(requests_.front().second);
    requests_.pop_front();
    return {};
  }

  std::error_code read_body(Value* target) override {
    std::lock_guard lock{padlock_};
    if (target != nullptr)
      *target = std::move(body_);
    return {};
  }

  std::error_code write(const Header& header, const Value& body) override {
    std::lock_guard lock{padlock_};
    if (written_before_close_)
      return make_error_code(ecode::already_closed);
    written_.emplace_back(header, body);
    return {};
  }

  std::error_code close() override {
    std::lock_guard lock{padlock_};
    if (!written_before_close_)
      written_before_close_ = written_.size();
    return {};
  }

  uint32_t type_tag() const override { return 99; }

  std::vector<std::pair<Header, Value>> written() const {
    std::lock_guard lock{padlock_};
    return written_;
  }

  std::optional<std::size_t> written_before_close() const {
    std::lock_guard lock{padlock_};
    return written_before_close_;
  }
};

Value nested_arrays(int depth) {
  Value value{int64_t(1)};
  for (int i = 0; i < depth; ++i)
    value = Value{Array{std::move(value)}};
  return value;
}
} // namespace

CATCH_TEST_CASE("ClientProtocol", "[client][protocol]") {
  ScriptedPeer fixture;
  auto& client = *fixture.client;

  CATCH_SECTION("request-on-the-wire") {
    int64_t reply = 0;
    auto call = client.go_call("Arith.Add", Args{1, 2}, reply);

    Value body;
    const auto request = fixture.read_request(&body);
    CATCH_REQUIRE(request.sequence == 1);
    CATCH_REQUIRE(request.procedure_name == "Arith.Add");
    CATCH_REQUIRE(request.error_text.empty());
    CATCH_REQUIRE(body == to_value(Args{1, 2}));
    CATCH_REQUIRE(!call->is_settled());
    CATCH_REQUIRE(client.pending_count() == 1);

    fixture.respond(request, Value{3});
    CATCH_REQUIRE(call->wait().ok());
    CATCH_REQUIRE(reply == 3);
    CATCH_REQUIRE(client.pending_count() == 0);
  }

  CATCH_SECTION("sequence-numbers-are-unique") {
    constexpr std::size_t k_threads = 4;
    constexpr std::size_t k_calls = 25;
    constexpr std::size_t k_total = k_threads * k_calls;
    auto done = std::make_shared<CallQueue>();
    std::vector<uint64_t> replies(k_total);

    std::vector<std::thread> callers;
    for (std::size_t t = 0; t < k_threads; ++t)
      callers.emplace_back([&, t]() {
        for (std::size_t i = 0; i < k_calls; ++i)
          client.go_call("Arith.Add", Args{}, replies[t * k_calls + i], done);
      });

    std::vector<Header> requests;
    std::set<uint64_t> sequences;
    for (std::size_t n = 0; n < k_total; ++n) {
      requests.push_back(fixture.read_request());
      sequences.insert(requests.back().sequence);
    }
    for (auto& thread : callers)
      thread.join();

    CATCH_REQUIRE(sequences.size() == k_total);
    CATCH_REQUIRE(*sequences.begin() == 1);
    CATCH_REQUIRE(*sequences.rbegin() == k_total);

    // Answer in reverse: each reply is its own sequence number
    for (auto ii = requests.rbegin(); ii != requests.rend(); ++ii)
      fixture.respond(*ii, Value{ii->sequence});

    for (std::size_t n = 0; n < k_total; ++n) {
      auto call = done->pop();
      CATCH_REQUIRE(call->status().ok());
      CATCH_REQUIRE(call->is_settled());
    }
    std::set<uint64_t> answers(cbegin(replies), cend(replies));
    CATCH_REQUIRE(answers == sequences);
  }

  CATCH_SECTION("unmatched-response-is-discarded") {
    int64_t reply = 0;
    auto call = client.go_call("Arith.Add", Args{1, 2}, reply);
    const auto request = fixture.read_request();

    // A response nobody asked for, with a body, arrives first
    fixture.respond(Header{999, "Arith.Add", ""}, Value{Array{Value{1}, Value{"two"}}});
    fixture.respond(request, Value{3});

    CATCH_REQUIRE(call->wait().ok());
    CATCH_REQUIRE(reply == 3);
    CATCH_REQUIRE(client.is_available());
  }

  CATCH_SECTION("error-response") {
    int64_t reply = 5;
    auto call = client.go_call("Arith.Add", Args{1, 2}, reply);
    fixture.respond(fixture.read_request(), Value{}, "it broke");
    const auto status = call->wait();
    CATCH_REQUIRE(status.error_code() == ecode::remote_error);
    CATCH_REQUIRE(status.error_message() == "it broke");
    CATCH_REQUIRE(reply == 5);
  }

  CATCH_SECTION("failed-send-settles-the-call-with-the-write-error") {
    int64_t reply = 0;
    const auto too_deep = nested_arrays(BinaryCodec::k_max_depth + 16);
    auto call = client.go_call("Arith.Echo", too_deep, reply);

    // Settled on the send path, before anything reached the peer
    CATCH_REQUIRE(call->is_settled());
    CATCH_REQUIRE(call->status().error_code() == ecode::invalid_data);
    CATCH_REQUIRE(client.pending_count() == 0);

    // The codec closed the connection, so the receive loop shuts the client down
    for (int i = 0; i < 500 && client.is_available(); ++i)
      std::this_thread::sleep_for(std::chrono::milliseconds{10});
    CATCH_REQUIRE(!client.is_available());

    auto late = client.go_call("Arith.Add", Args{}, reply);
    CATCH_REQUIRE(late->status().error_code() == ecode::shutdown);
  }

  CATCH_SECTION("shutdown-fan-out") {
    constexpr std::size_t k_pending = 5;
    auto done = std::make_shared<CallQueue>();
    std::vector<int64_t> replies(k_pending);
    for (std::size_t i = 0; i < k_pending; ++i)
      client.go_call("Arith.Sleep", Args{}, replies[i], done);
    for (std::size_t i = 0; i < k_pending; ++i)
      fixture.read_request();
    CATCH_REQUIRE(client.pending_count() == k_pending);

    CATCH_REQUIRE(!fixture.peer->close());

    for (std::size_t i = 0; i < k_pending; ++i) {
      auto call = done->pop();
      CATCH_REQUIRE(call->status().error_code() == ecode::shutdown);
    }
    CATCH_REQUIRE(done->size() == 0); // each call settles exactly once
    CATCH_REQUIRE(client.pending_count() == 0);
    CATCH_REQUIRE(!client.is_available());

    // A new call fails at once, without touching the connection
    int64_t reply = 0;
    auto late = client.go_call("Arith.Add", Args{}, reply);
    CATCH_REQUIRE(late->is_settled());
    CATCH_REQUIRE(late->status().error_code() == ecode::shutdown);
    CATCH_REQUIRE(late->sequence() == 0);
    CATCH_REQUIRE(client.close() == ecode::already_closed);
  }

  CATCH_SECTION("deadline") {
    int64_t reply = 0;
    auto status = client.call_for("Arith.Add", Args{1, 2}, reply, std::chrono::milliseconds{30});
    CATCH_REQUIRE(status.error_code() == ecode::deadline_exceeded);
    CATCH_REQUIRE(client.pending_count() == 0);

    // The late response is read and dropped
    const auto request = fixture.read_request();
    fixture.respond(request, Value{3});

    int64_t second = 0;
    auto call = client.go_call("Arith.Add", Args{2, 2}, second);
    const auto next = fixture.read_request();
    CATCH_REQUIRE(next.sequence == request.sequence + 1);
    fixture.respond(next, Value{4});
    CATCH_REQUIRE(call->wait().ok());
    CATCH_REQUIRE(second == 4);
    CATCH_REQUIRE(reply == 0);
  }

  CATCH_SECTION("deadline-met") {
    int64_t reply = 0;
    std::thread responder{[&fixture]() {
      Header header;
      if (!fixture.peer->read_header(header) && !fixture.peer->read_body(nullptr)) {
        if (auto ec = fixture.peer->write(Header{header.sequence, header.procedure_name, ""},
                                          Value{3}))
          WARN("respond: {}", ec.message());
      }
    }};
    const auto status =
        client.call_for("Arith.Add", Args{1, 2}, reply, std::chrono::seconds{10});
    responder.join();
    CATCH_REQUIRE(status.ok());
    CATCH_REQUIRE(reply == 3);
  }

  CATCH_SECTION("malformed-response-is-connection-level") {
    int64_t first = 0, second = 0;
    auto call = client.go_call("Arith.Add", Args{}, first);
    auto other = client.go_call("Arith.Add", Args{}, second);
    fixture.read_request();
    fixture.read_request();

    // An int where the header array belongs
    net::BufferType garbage;
    CATCH_REQUIRE(!BinaryCodec::encode(garbage, Value{42}));
    CATCH_REQUIRE(!fixture.wire->write_all(net::to_span_bytes(garbage)));

    CATCH_REQUIRE(call->wait().error_code() == ecode::shutdown);
    CATCH_REQUIRE(other->wait().error_code() == ecode::shutdown);
    CATCH_REQUIRE(!client.is_available());
  }
}

CATCH_TEST_CASE("ServerProtocol", "[server][protocol]") {
  ScriptedClient fixture;

  CATCH_SECTION("bad-magic") {
    auto preamble = encode_preamble(k_binary_codec);
    preamble[1] = std::byte{0};
    fixture.send(preamble);

    // The server hangs up without a word
    std::array<std::byte, 1> buffer;
    CATCH_REQUIRE(net::read_exact(*fixture.raw, buffer) == ecode::end_of_stream);
  }

  CATCH_SECTION("unknown-codec") {
    fixture.send(encode_preamble(k_json_codec));
    std::array<std::byte, 1> buffer;
    CATCH_REQUIRE(net::read_exact(*fixture.raw, buffer) == ecode::end_of_stream);
  }

  CATCH_SECTION("short-preamble") {
    const auto preamble = encode_preamble(k_binary_codec);
    fixture.send(std::span<const std::byte>{preamble}.first(5));
    CATCH_REQUIRE(!fixture.raw->close());
    fixture.serving.join(); // the server gives up on the connection
    fixture.serving = std::thread{};
  }

  CATCH_SECTION("one-body-per-response") {
    auto& codec = fixture.speak_binary();

    // Two requests in a single write, the first for a method that does not exist
    net::BufferType buffer;
    CATCH_REQUIRE(!BinaryCodec::encode(buffer, Header{5, "Arith.Missing", ""}));
    CATCH_REQUIRE(!BinaryCodec::encode(buffer, to_value(Args{1, 2})));
    CATCH_REQUIRE(!BinaryCodec::encode(buffer, Header{6, "Arith.Add", ""}));
    CATCH_REQUIRE(!BinaryCodec::encode(buffer, to_value(Args{1, 2})));
    CATCH_REQUIRE(!fixture.raw_write(buffer));

    std::map<uint64_t, std::pair<Header, Value>> responses;
    for (int i = 0; i < 2; ++i) {
      Header header;
      Value body;
      CATCH_REQUIRE(!codec.read_header(header));
      CATCH_REQUIRE(!codec.read_body(&body));
      responses[header.sequence] = {header, body};
    }

    CATCH_REQUIRE(responses.size() == 2);
    const auto& [missing, missing_body] = responses.at(5);
    CATCH_REQUIRE(missing.procedure_name == "Arith.Missing");
    CATCH_REQUIRE(missing.error_text == "rpc server: cannot find method Missing on service Arith");
    CATCH_REQUIRE(missing_body.is_nil());

    const auto& [added, added_body] = responses.at(6);
    CATCH_REQUIRE(added.error_text.empty());
    CATCH_REQUIRE(added_body == Value{3});
  }

  CATCH_SECTION("exception-becomes-error-response") {
    auto& codec = fixture.speak_binary();
    net::BufferType buffer;
    CATCH_REQUIRE(!BinaryCodec::encode(buffer, Header{1, "Arith.Error", ""}));
    CATCH_REQUIRE(!BinaryCodec::encode(buffer, to_value(Args{})));
    CATCH_REQUIRE(!fixture.raw_write(buffer));

    Header header;
    Value body;
    CATCH_REQUIRE(!codec.read_header(header));
    CATCH_REQUIRE(!codec.read_body(&body));
    CATCH_REQUIRE(header.sequence == 1);
    CATCH_REQUIRE(header.error_text == "ERROR");
    CATCH_REQUIRE(body.is_nil());
  }
}

CATCH_TEST_CASE("ServerDrain", "[server][protocol]") {
  Server server{Server::Config{2}};
  std::shared_ptr<Service> arith;
  CATCH_REQUIRE(!build_arith(arith));
  CATCH_REQUIRE(!server.register_service(arith));

  CATCH_SECTION("in-flight-responses-are-written-before-close") {
    // The peer hangs up while the request is still being served
    auto codec = std::make_shared<ScriptedCodec>();
    codec->add_request(Header{7, "Arith.Sleep", ""}, to_value(Args{200, 9}));
    server.serve_codec(codec);

    const auto written = codec->written();
    CATCH_REQUIRE(written.size() == 1);
    CATCH_REQUIRE(written[0].first.sequence == 7);
    CATCH_REQUIRE(written[0].first.error_text.empty());
    CATCH_REQUIRE(written[0].second == Value{9});
    CATCH_REQUIRE(codec->written_before_close() == std::optional<std::size_t>{1});
  }

  CATCH_SECTION("error-responses-are-drained-too") {
    auto codec = std::make_shared<ScriptedCodec>();
    codec->add_request(Header{1, "Arith.Sleep", ""}, to_value(Args{100, 1}));
    codec->add_request(Header{2, "Nowhere.Add", ""}, to_value(Args{}));
    codec->add_request(Header{3, "Arith.Add", ""}, Value{"not a record"});
    server.serve_codec(codec);

    std::map<uint64_t, std::string> errors;
    for (const auto& [header, body] : codec->written())
      errors[header.sequence] = header.error_text;
    CATCH_REQUIRE(errors.size() == 3);
    CATCH_REQUIRE(errors[1].empty());
    CATCH_REQUIRE(errors[2] == "rpc server: cannot find service Nowhere");
    CATCH_REQUIRE(errors[3] == "rpc server: read argument error: type error");
    CATCH_REQUIRE(codec->written_before_close() == std::optional<std::size_t>{3});
  }
}

} // namespace tether::rpc::tests
