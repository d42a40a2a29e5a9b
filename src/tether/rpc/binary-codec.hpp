
#pragma once

#include "codec.hpp"

#include "tether/net/buffer.hpp"
#include "tether/net/buffered-reader.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace tether::rpc {

/**
 * @brief The built-in codec (type tag 0).
 *
 * Every value is a one byte tag followed by its payload in network byte order:
 *
 * | tag    | value      | payload                                      |
 * |--------|------------|----------------------------------------------|
 * | `0x00` | nil        |                                              |
 * | `0x01` | false      |                                              |
 * | `0x02` | true       |                                              |
 * | `0x03` | int64      | 8 bytes                                      |
 * | `0x04` | uint64     | 8 bytes                                      |
 * | `0x05` | double     | 8 bytes, IEEE-754                            |
 * | `0x06` | string     | u32 length, then the bytes                   |
 * | `0x07` | bytes      | u32 length, then the bytes                   |
 * | `0x08` | array      | u32 count, then the values                   |
 * | `0x09` | object     | u32 count, then (string key, value) pairs    |
 *
 * A header is the array `[uint64 sequence, string name, string error]`.
 */
class BinaryCodec final : public Codec {
public:
  static constexpr std::size_t k_max_object_size = 64 * 1024 * 1024;
  static constexpr int k_max_depth = 64;

  enum class Tag : uint8_t {
    NIL = 0x00,
    FALSE = 0x01,
    TRUE = 0x02,
    INT = 0x03,
    UINT = 0x04,
    DOUBLE = 0x05,
    STRING = 0x06,
    BYTES = 0x07,
    ARRAY = 0x08,
    OBJECT = 0x09
  };

private:
  std::unique_ptr<net::Connection> connection_;
  net::BufferedReader reader_;

public:
  explicit BinaryCodec(std::unique_ptr<net::Connection> connection);

  std::error_code read_header(Header& header) override;
  std::error_code read_body(Value* target) override;
  std::error_code write(const Header& header, const Value& body) override;
  std::error_code close() override;
  uint32_t type_tag() const override { return k_binary_codec; }

  /**
   * @brief Append the encoding of `value` to `buffer`.
   */
  static std::error_code encode(net::BufferType& buffer, const Value& value);

  /**
   * @brief Append the encoding of `header` to `buffer`.
   */
  static std::error_code encode(net::BufferType& buffer, const Header& header);

private:
  std::error_code read_value_(Value& out, int depth);
  std::error_code read_tagged_(uint8_t tag, Value& out, int depth);
  std::error_code read_length_(uint32_t& length);
};

} // namespace tether::rpc
