
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * @defgroup cli Command Line Utils
 * @ingroup tether-utils
 *
 * The `tether` method for parsing command-line arguments: walk `argv` by hand,
 * and use the `safe_arg_*` functions to pull out the value that follows a switch.
 * All functions throw `std::runtime_error` on malformed input.
 */

namespace tether::cli
{
std::string safe_arg_str(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i);
unsigned safe_arg_uint(int argc, char** argv, int& i);

/**
 * @ingroup cli
 * @brief Parse `s` as a (possibly negative) base-10 64-bit integer.
 */
int64_t parse_i64(std::string_view s);

} // namespace tether::cli
