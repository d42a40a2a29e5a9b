
#include "stdinc.hpp"

#include "tether/utils/cli-utils.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

namespace tether::cli::tests {

namespace {
struct Argv {
  std::vector<std::string> args;
  std::vector<char*> pointers;

  explicit Argv(std::initializer_list<std::string> list) : args{list} {
    for (auto& arg : args)
      pointers.push_back(arg.data());
  }
  int argc() const { return int(args.size()); }
  char** argv() { return pointers.data(); }
};
} // namespace

CATCH_TEST_CASE("CliUtils", "[cli-utils]") {
  CATCH_SECTION("safe-args") {
    Argv cmd{"exec-name", "1", "two", "three"};
    int i = 0;
    CATCH_REQUIRE(safe_arg_int(cmd.argc(), cmd.argv(), i) == 1);
    CATCH_REQUIRE(i == 1);
    CATCH_REQUIRE(safe_arg_str(cmd.argc(), cmd.argv(), i) == "two");
    CATCH_REQUIRE(i == 2);
    CATCH_REQUIRE(safe_arg_str(cmd.argc(), cmd.argv(), i) == "three");
    CATCH_REQUIRE(i == 3);
  }

  CATCH_SECTION("missing-value") {
    Argv cmd{"exec-name", "-t"};
    int i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_uint(cmd.argc(), cmd.argv(), i), std::runtime_error);
  }

  CATCH_SECTION("unsigned") {
    Argv cmd{"exec-name", "-t", "8", "-t", "-3"};
    int i = 1;
    CATCH_REQUIRE(safe_arg_uint(cmd.argc(), cmd.argv(), i) == 8u);
    i = 3;
    CATCH_REQUIRE_THROWS_AS(safe_arg_uint(cmd.argc(), cmd.argv(), i), std::runtime_error);
  }

  CATCH_SECTION("parse-i64") {
    CATCH_REQUIRE(parse_i64("42") == 42);
    CATCH_REQUIRE(parse_i64("-17") == -17);
    CATCH_REQUIRE_THROWS_AS(parse_i64(""), std::runtime_error);
    CATCH_REQUIRE_THROWS_AS(parse_i64("4x"), std::runtime_error);
    CATCH_REQUIRE_THROWS_AS(parse_i64("99999999999999999999"), std::runtime_error);
  }
}

} // namespace tether::cli::tests
