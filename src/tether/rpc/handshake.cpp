
#include "stdinc.hpp"

#include "handshake.hpp"

#include "tether/net/buffer.hpp"
#include "tether/utils/error-codes.hpp"

namespace tether::rpc {

Preamble encode_preamble(uint32_t codec_type) {
  net::BufferType buffer;
  buffer.reserve(k_preamble_size);
  net::append_integer(buffer, k_magic_number);
  net::append_integer(buffer, codec_type);
  Expects(buffer.size() == k_preamble_size);

  Preamble preamble;
  std::copy(cbegin(buffer), cend(buffer), begin(preamble));
  return preamble;
}

std::error_code decode_preamble(std::span<const std::byte, k_preamble_size> bytes,
                                uint32_t& codec_type) {
  if (net::load_integer<uint32_t>(bytes.first(4)) != k_magic_number)
    return make_error_code(ecode::bad_magic);
  codec_type = net::load_integer<uint32_t>(bytes.subspan(4));
  return {};
}

} // namespace tether::rpc
