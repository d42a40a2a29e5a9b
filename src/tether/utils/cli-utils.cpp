
#include "stdinc.hpp"

#include "cli-utils.hpp"

#include <cerrno>
#include <stdexcept>

namespace tether::cli
{
namespace
{
   /**
    * @private
    * @brief Advance `i` to the value after the switch `argv[i]`, or throw.
    */
   const char* next_arg_(int argc, char** argv, int& i, std::string_view what)
   {
      Expects(argc >= 0);
      Expects(i >= 0 && i < argc);
      const char* arg = argv[i];
      ++i;
      if(i >= argc) throw std::runtime_error(format("expected {} after argument '{}'", what, arg));
      return argv[i];
   }
} // namespace

// ---------------------------------------------------------------- safe-arg-str
/**
 * @ingroup cli
 * @brief Get the argument after `i` from command line arguments `argc` and
 *        `argv`. `i` must be in the range `[0..argc)`.
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`.
 */
std::string safe_arg_str(int argc, char** argv, int& i)
{
   return std::string{next_arg_(argc, argv, i, "string")};
}

// ---------------------------------------------------------------- safe-arg-int
/**
 * @ingroup cli
 * @brief Parse the argument (as an integer) after `i`.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc` or if `argv[i+1]` cannot be
 *   parsed as an `int`.
 */
int safe_arg_int(int argc, char** argv, int& i)
{
   const auto arg   = argv[i];
   const auto value = parse_i64(next_arg_(argc, argv, i, "integer"));
   if(value > std::numeric_limits<int>::max() || value < std::numeric_limits<int>::lowest())
      throw std::runtime_error(format("integer out of range after argument '{}'", arg));
   return static_cast<int>(value);
}

// --------------------------------------------------------------- safe-arg-uint
/**
 * @ingroup cli
 * @brief Parse the argument (as a non-negative integer) after `i`.
 */
unsigned safe_arg_uint(int argc, char** argv, int& i)
{
   const auto arg   = argv[i];
   const auto value = parse_i64(next_arg_(argc, argv, i, "unsigned integer"));
   if(value < 0 || value > std::numeric_limits<unsigned>::max())
      throw std::runtime_error(format("expected unsigned integer after argument '{}'", arg));
   return static_cast<unsigned>(value);
}

// ------------------------------------------------------------------- parse-i64

int64_t parse_i64(std::string_view s)
{
   const std::string text{s};
   char* end = nullptr;
   errno     = 0;
   const auto value = std::strtoll(text.c_str(), &end, 10);
   if(text.empty() || *end != '\0' || errno == ERANGE)
      throw std::runtime_error(format("failed to parse integer '{}'", text));
   return static_cast<int64_t>(value);
}

} // namespace tether::cli
