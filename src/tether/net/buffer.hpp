
#pragma once

#include <boost/endian/conversion.hpp>

#include <cstddef>
#include <cstring>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tether::net {

using BufferType = std::vector<std::byte>;

inline std::span<const std::byte> to_span_bytes(const BufferType& buffer) {
  return {buffer.data(), buffer.data() + buffer.size()};
}

inline BufferType make_send_buffer(std::string_view ss) {
  const std::byte* data = reinterpret_cast<const std::byte*>(ss.data());
  return BufferType{data, data + ss.size()};
}

inline BufferType& operator<<(BufferType& buffer, std::string_view ss) {
  const auto offset = buffer.size();
  buffer.resize(offset + ss.size());
  if (!ss.empty())
    std::memcpy(&buffer[offset], ss.data(), ss.size());
  return buffer;
}

inline BufferType& operator<<(BufferType& buffer, std::span<const std::byte> bytes) {
  buffer.insert(end(buffer), begin(bytes), end(bytes));
  return buffer;
}

/**
 * @brief Append `value` to `buffer` in network byte order.
 */
template <typename T> void append_integer(BufferType& buffer, T value) {
  static_assert(std::is_integral_v<T>);
  boost::endian::native_to_big_inplace(value);
  const auto offset = buffer.size();
  buffer.resize(offset + sizeof(T));
  std::memcpy(&buffer[offset], &value, sizeof(T));
}

/**
 * @brief Read a network byte order integer from the front of `bytes`.
 * @pre `bytes.size() >= sizeof(T)`
 */
template <typename T> T load_integer(std::span<const std::byte> bytes) {
  static_assert(std::is_integral_v<T>);
  T value;
  std::memcpy(&value, bytes.data(), sizeof(T));
  boost::endian::big_to_native_inplace(value);
  return value;
}

} // namespace tether::net
