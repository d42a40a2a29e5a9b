
#pragma once

#include "header.hpp"
#include "value.hpp"

#include "tether/net/connection.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <system_error>
#include <unordered_map>

namespace tether::rpc {

/**
 * @brief Encodes and decodes (header, body) pairs over a connection that it owns.
 *
 * Reads happen on one thread. `write` is NOT thread safe: callers serialize writers
 * with a send lock. A failed `write` closes the connection, since a half written
 * stream cannot be recovered.
 */
class Codec {
public:
  virtual ~Codec() = default;

  /**
   * @brief Read the next header.
   * A peer that closes the stream between messages results in `ecode::end_of_stream`.
   */
  virtual std::error_code read_header(Header& header) = 0;

  /**
   * @brief Read the body that follows a header.
   * @param target Receives the body; when `nullptr` the body is read and discarded.
   */
  virtual std::error_code read_body(Value* target) = 0;

  /**
   * @brief Write `header` followed by `body`, and flush both.
   */
  virtual std::error_code write(const Header& header, const Value& body) = 0;

  /**
   * @brief Close the underlying connection; idempotent.
   */
  virtual std::error_code close() = 0;

  /**
   * @brief The codec type tag sent in the connection preamble.
   */
  virtual uint32_t type_tag() const = 0;
};

using CodecFactory = std::function<std::shared_ptr<Codec>(std::unique_ptr<net::Connection>)>;

constexpr uint32_t k_binary_codec = 0; //!< Always registered
constexpr uint32_t k_json_codec = 1;   //!< Reserved

/**
 * @brief The process-wide map from codec type tag to codec factory.
 *
 * Created on first use with the binary codec registered. Other codecs should be
 * registered before the first dial or accept.
 */
class CodecRegistry {
private:
  mutable std::mutex padlock_;
  std::unordered_map<uint32_t, CodecFactory> factories_;

  CodecRegistry();

public:
  CodecRegistry(const CodecRegistry&) = delete;
  CodecRegistry& operator=(const CodecRegistry&) = delete;

  static CodecRegistry& instance();

  /**
   * @return `ecode::argument_error` if `tag` is taken, or `factory` is empty.
   */
  std::error_code register_codec(uint32_t tag, CodecFactory factory);

  /**
   * @return The factory for `tag`, or an empty function.
   */
  CodecFactory find(uint32_t tag) const;

  bool has(uint32_t tag) const;
};

} // namespace tether::rpc
