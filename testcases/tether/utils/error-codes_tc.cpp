
#include "stdinc.hpp"

#include "tether/utils/error-codes.hpp"

#include <catch2/catch.hpp>

namespace tether::tests {

CATCH_TEST_CASE("ErrorCodes", "[error-codes]") {
  CATCH_SECTION("category") {
    const std::error_code ec = ecode::shutdown;
    CATCH_REQUIRE(ec);
    CATCH_REQUIRE(&ec.category() == &ecode_category());
    CATCH_REQUIRE(std::string{ec.category().name()} == "tether");
    CATCH_REQUIRE(ec.message() == "connection shut down");
  }

  CATCH_SECTION("okay-is-not-an-error") {
    CATCH_REQUIRE(!make_error_code(ecode::okay));
  }

  CATCH_SECTION("comparison") {
    const auto ec = make_error_code(ecode::method_not_found);
    CATCH_REQUIRE(ec == ecode::method_not_found);
    CATCH_REQUIRE(ec != ecode::service_not_found);
    CATCH_REQUIRE(ec != std::make_error_code(std::errc::io_error));
  }
}

} // namespace tether::tests
