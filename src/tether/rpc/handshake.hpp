
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>

namespace tether::rpc {

constexpr uint32_t k_magic_number = 0x5a2b71c3;
constexpr std::size_t k_preamble_size = 8;

using Preamble = std::array<std::byte, k_preamble_size>;

/**
 * @brief The bytes a client sends first: the magic number, then the codec type tag.
 */
Preamble encode_preamble(uint32_t codec_type);

/**
 * @return `ecode::bad_magic` unless `bytes` starts with the magic number.
 */
std::error_code decode_preamble(std::span<const std::byte, k_preamble_size> bytes,
                                uint32_t& codec_type);

} // namespace tether::rpc
