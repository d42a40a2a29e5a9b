
#pragma once

#include "buffer.hpp"
#include "connection.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <system_error>

namespace tether::net {

/**
 * @brief Buffers reads from a `Connection`, so that a decoder can pull a few bytes
 *        at a time without a system call for each.
 *
 * Not thread safe: a connection has exactly one reader.
 */
class BufferedReader {
private:
  Connection& connection_;
  BufferType buffer_;
  std::size_t begin_{0}; // First unread byte
  std::size_t end_{0};   // One past the last buffered byte

  std::error_code fill_();

public:
  explicit BufferedReader(Connection& connection, std::size_t capacity = 16 * 1024);

  /**
   * @brief true iff there is no buffered data; i.e., the next read will hit the connection.
   */
  bool is_empty() const noexcept { return begin_ == end_; }

  /**
   * @brief Fill `out` exactly. Fails with `ecode::end_of_stream` only when the stream
   *        ends before the first byte; after that it is `ecode::premature_eof`.
   */
  std::error_code read(std::span<std::byte> out);

  /**
   * @brief Read `size` bytes and append them to `out`.
   */
  std::error_code read_string(std::size_t size, std::string& out);

  /**
   * @brief Read `size` bytes and drop them.
   */
  std::error_code skip(std::size_t size);

  template <typename T> std::error_code read_integer(T& value) {
    std::byte bytes[sizeof(T)];
    if (auto ec = read(bytes))
      return ec;
    value = load_integer<T>(bytes);
    return {};
  }
};

} // namespace tether::net
