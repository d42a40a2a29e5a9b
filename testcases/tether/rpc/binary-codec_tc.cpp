
#include "stdinc.hpp"

#include "tether/net.hpp"
#include "tether/rpc/binary-codec.hpp"
#include "tether/rpc/handshake.hpp"

#include <catch2/catch.hpp>

namespace tether::rpc::tests {

namespace {
using net::BufferType;

struct CodecPair {
  std::unique_ptr<net::Connection> raw; // The peer, for writing hand-made bytes
  std::shared_ptr<BinaryCodec> codec;

  CodecPair() {
    std::unique_ptr<net::Connection> end;
    CATCH_REQUIRE(!net::make_connection_pair(raw, end));
    codec = std::make_shared<BinaryCodec>(std::move(end));
  }

  void send(const BufferType& buffer) {
    CATCH_REQUIRE(!raw->write_all(net::to_span_bytes(buffer)));
  }
};

BufferType bytes(std::initializer_list<uint8_t> list) {
  BufferType buffer;
  for (auto x : list)
    buffer.push_back(std::byte{x});
  return buffer;
}

Value nested_arrays(int depth) {
  Value value{};
  for (int i = 0; i < depth; ++i)
    value = Value{Array{value}};
  return value;
}
} // namespace

CATCH_TEST_CASE("BinaryCodec", "[binary-codec]") {
  CATCH_SECTION("header-layout") {
    BufferType buffer;
    CATCH_REQUIRE(!BinaryCodec::encode(buffer, Header{1, "A.B", ""}));
    const auto expected = bytes({0x08, 0, 0, 0, 3,                   // array of 3
                                 0x04, 0, 0, 0, 0, 0, 0, 0, 1,       // uint64 sequence
                                 0x06, 0, 0, 0, 3, 'A', '.', 'B',    // name
                                 0x06, 0, 0, 0, 0});                 // error
    CATCH_REQUIRE(buffer == expected);
  }

  CATCH_SECTION("value-layout") {
    BufferType buffer;
    CATCH_REQUIRE(!BinaryCodec::encode(buffer, Value{Object{{"n", -2}, {"ok", true}}}));
    const auto expected = bytes({0x09, 0, 0, 0, 2,                                 // 2 members
                                 0x06, 0, 0, 0, 1, 'n',                            // "n"
                                 0x03, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xfe, // -2
                                 0x06, 0, 0, 0, 2, 'o', 'k',                       // "ok"
                                 0x02});                                           // true
    CATCH_REQUIRE(buffer == expected);
  }

  CATCH_SECTION("write-then-read") {
    std::unique_ptr<net::Connection> a, b;
    CATCH_REQUIRE(!net::make_connection_pair(a, b));
    BinaryCodec writer{std::move(a)};
    BinaryCodec reader{std::move(b)};

    const Value body{Array{Value{nullptr}, Value{1.25}, Value{uint64_t(7)}, Value{"s"},
                           Value{Bytes{std::byte{0xde}, std::byte{0xad}}}}};
    CATCH_REQUIRE(!writer.write(Header{42, "Arith.Add", ""}, body));
    CATCH_REQUIRE(!writer.write(Header{43, "Arith.Add", "boom"}, Value{}));

    Header header;
    Value decoded;
    CATCH_REQUIRE(!reader.read_header(header));
    CATCH_REQUIRE(header == Header{42, "Arith.Add", ""});
    CATCH_REQUIRE(!reader.read_body(&decoded));
    CATCH_REQUIRE(decoded == body);

    CATCH_REQUIRE(!reader.read_header(header));
    CATCH_REQUIRE(header.error_text == "boom");
    CATCH_REQUIRE(!reader.read_body(nullptr));

    CATCH_REQUIRE(!writer.close());
    CATCH_REQUIRE(reader.read_header(header) == ecode::end_of_stream);
  }

  CATCH_SECTION("eof-inside-a-message") {
    CodecPair pair;
    pair.send(bytes({0x08, 0, 0, 0, 3, 0x04, 0, 0}));
    CATCH_REQUIRE(!pair.raw->close());
    Header header;
    CATCH_REQUIRE(pair.codec->read_header(header) == ecode::premature_eof);
  }

  CATCH_SECTION("eof-between-header-and-body") {
    CodecPair pair;
    BufferType buffer;
    CATCH_REQUIRE(!BinaryCodec::encode(buffer, Header{1, "A.B", ""}));
    pair.send(buffer);
    CATCH_REQUIRE(!pair.raw->close());
    Header header;
    CATCH_REQUIRE(!pair.codec->read_header(header));
    CATCH_REQUIRE(pair.codec->read_body(nullptr) == ecode::premature_eof);
  }

  CATCH_SECTION("malformed-header") {
    CodecPair pair;
    pair.send(bytes({0x06, 0, 0, 0, 1, 'x'})); // a string, not an array
    Header header;
    CATCH_REQUIRE(pair.codec->read_header(header) == ecode::invalid_data);
  }

  CATCH_SECTION("unknown-tag") {
    CodecPair pair;
    pair.send(bytes({0x7f}));
    CATCH_REQUIRE(pair.codec->read_body(nullptr) == ecode::invalid_data);
  }

  CATCH_SECTION("oversized-length") {
    CodecPair pair;
    pair.send(bytes({0x07, 0x04, 0x00, 0x00, 0x01})); // 64 MiB + 1
    CATCH_REQUIRE(pair.codec->read_body(nullptr) == ecode::object_too_large);
  }

  CATCH_SECTION("object-keys-must-be-strings") {
    CodecPair pair;
    pair.send(bytes({0x09, 0, 0, 0, 1, 0x02, 0x00}));
    CATCH_REQUIRE(pair.codec->read_body(nullptr) == ecode::invalid_data);
  }

  CATCH_SECTION("nesting-depth") {
    BufferType buffer;
    CATCH_REQUIRE(!BinaryCodec::encode(buffer, nested_arrays(BinaryCodec::k_max_depth)));
    buffer.clear();
    CATCH_REQUIRE(BinaryCodec::encode(buffer, nested_arrays(BinaryCodec::k_max_depth + 2))
                  == ecode::invalid_data);

    // A hostile peer sends deeply nested arrays
    CodecPair pair;
    BufferType hostile;
    for (int i = 0; i < BinaryCodec::k_max_depth + 2; ++i) {
      hostile.push_back(std::byte{0x08});
      net::append_integer(hostile, uint32_t(1));
    }
    hostile.push_back(std::byte{0x00});
    pair.send(hostile);
    CATCH_REQUIRE(pair.codec->read_body(nullptr) == ecode::invalid_data);
  }

  CATCH_SECTION("failed-write-closes-the-connection") {
    CodecPair pair;
    const auto ec = pair.codec->write(Header{1, "A.B", ""},
                                      nested_arrays(BinaryCodec::k_max_depth + 2));
    CATCH_REQUIRE(ec == ecode::invalid_data);

    // Nothing was written; the peer just sees the stream end
    std::array<std::byte, 1> buffer;
    CATCH_REQUIRE(net::read_exact(*pair.raw, buffer) == ecode::end_of_stream);
  }
}

CATCH_TEST_CASE("Handshake", "[handshake]") {
  CATCH_SECTION("preamble-layout") {
    const auto preamble = encode_preamble(k_binary_codec);
    CATCH_REQUIRE(preamble[0] == std::byte{0x5a});
    CATCH_REQUIRE(preamble[3] == std::byte{0xc3});
    CATCH_REQUIRE(preamble[7] == std::byte{0x00});

    uint32_t codec_type = 99;
    CATCH_REQUIRE(!decode_preamble(preamble, codec_type));
    CATCH_REQUIRE(codec_type == k_binary_codec);
  }

  CATCH_SECTION("bad-magic") {
    auto preamble = encode_preamble(k_json_codec);
    preamble[0] = std::byte{0};
    uint32_t codec_type = 0;
    CATCH_REQUIRE(decode_preamble(preamble, codec_type) == ecode::bad_magic);
  }

  CATCH_SECTION("registry") {
    auto& registry = CodecRegistry::instance();
    CATCH_REQUIRE(registry.has(k_binary_codec));
    CATCH_REQUIRE(!registry.has(k_json_codec));
    CATCH_REQUIRE(registry.find(k_json_codec) == nullptr);
    CATCH_REQUIRE(registry.register_codec(k_binary_codec, registry.find(k_binary_codec))
                  == ecode::argument_error);
    CATCH_REQUIRE(registry.register_codec(77, CodecFactory{}) == ecode::argument_error);
  }
}

} // namespace tether::rpc::tests
