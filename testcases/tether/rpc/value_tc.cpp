
#include "stdinc.hpp"

#include "tether/rpc/payload.hpp"
#include "tether/rpc/value.hpp"

#include <catch2/catch.hpp>

namespace tether::rpc::tests {

namespace {
struct Point {
  int32_t x = 0;
  int32_t y = 0;
  std::optional<std::string> label;
};

Value to_value(const Point& o) {
  return Object{{"x", o.x}, {"y", o.y}, {"label", rpc::to_value(o.label)}};
}

std::error_code from_value(const Value& value, Point& o) {
  if (auto ec = get_field(value, "x", o.x))
    return ec;
  if (auto ec = get_field(value, "y", o.y))
    return ec;
  return get_field(value, "label", o.label);
}
} // namespace

CATCH_TEST_CASE("Value", "[value]") {
  CATCH_SECTION("kinds") {
    CATCH_REQUIRE(Value{}.is_nil());
    CATCH_REQUIRE(Value{true}.is_bool());
    CATCH_REQUIRE(Value{-3}.is_int());
    CATCH_REQUIRE(Value{3u}.is_uint());
    CATCH_REQUIRE(Value{1.5}.is_double());
    CATCH_REQUIRE(Value{"text"}.is_string());
    CATCH_REQUIRE(Value{Bytes{std::byte{1}}}.is_bytes());
    CATCH_REQUIRE(Value{Array{}}.is_array());
    CATCH_REQUIRE(Value{Object{}}.is_object());
    CATCH_REQUIRE(str(Value{Object{}}.kind()) == "OBJECT");
  }

  CATCH_SECTION("integers-are-range-checked") {
    int8_t small = 0;
    CATCH_REQUIRE(!from_value(Value{127}, small));
    CATCH_REQUIRE(small == 127);
    CATCH_REQUIRE(from_value(Value{128}, small) == ecode::type_error);
    CATCH_REQUIRE(from_value(Value{-129}, small) == ecode::type_error);

    uint16_t u = 0;
    CATCH_REQUIRE(from_value(Value{-1}, u) == ecode::type_error);
    CATCH_REQUIRE(!from_value(Value{65535}, u));
    CATCH_REQUIRE(u == 65535);

    int64_t i = 0;
    CATCH_REQUIRE(!from_value(Value{uint64_t(42)}, i));
    CATCH_REQUIRE(i == 42);
    CATCH_REQUIRE(from_value(Value{std::numeric_limits<uint64_t>::max()}, i) == ecode::type_error);
    CATCH_REQUIRE(from_value(Value{"42"}, i) == ecode::type_error);
  }

  CATCH_SECTION("doubles-accept-integers") {
    double d = 0.0;
    CATCH_REQUIRE(!from_value(Value{3}, d));
    CATCH_REQUIRE(d == 3.0);
    CATCH_REQUIRE(from_value(Value{true}, d) == ecode::type_error);
  }

  CATCH_SECTION("containers") {
    const std::vector<std::string> words{"a", "b"};
    const auto value = rpc::to_value(words);
    CATCH_REQUIRE(value.is_array());
    CATCH_REQUIRE(value.get<Array>().size() == 2);

    std::vector<std::string> decoded;
    CATCH_REQUIRE(!from_value(value, decoded));
    CATCH_REQUIRE(decoded == words);

    std::map<std::string, int> counts;
    CATCH_REQUIRE(!from_value(Value{Object{{"a", 1}, {"b", 2}}}, counts));
    CATCH_REQUIRE(counts.at("b") == 2);
    CATCH_REQUIRE(from_value(Value{Object{{"a", "x"}}}, counts) == ecode::type_error);
    CATCH_REQUIRE(counts.size() == 2); // untouched on failure
  }

  CATCH_SECTION("records") {
    const Point p{3, -4, std::string{"corner"}};
    const auto value = to_value(p);
    CATCH_REQUIRE(value.find("x") != nullptr);
    CATCH_REQUIRE(value.find("z") == nullptr);
    CATCH_REQUIRE(to_string(value) == R"({label: "corner", x: 3, y: -4})");

    Point q;
    CATCH_REQUIRE(!from_value(value, q));
    CATCH_REQUIRE(q.x == 3);
    CATCH_REQUIRE(q.y == -4);
    CATCH_REQUIRE(q.label == "corner");

    // Missing fields keep their defaults; a nil optional resets
    Point r{1, 2, std::string{"old"}};
    CATCH_REQUIRE(!from_value(Value{Object{{"y", 9}, {"label", nullptr}}}, r));
    CATCH_REQUIRE(r.x == 1);
    CATCH_REQUIRE(r.y == 9);
    CATCH_REQUIRE(!r.label.has_value());

    CATCH_REQUIRE(from_value(Value{Array{}}, r) == ecode::type_error);
  }
}

CATCH_TEST_CASE("PayloadShape", "[payload]") {
  CATCH_SECTION("kinds") {
    CATCH_REQUIRE(shape_of<int>().kind == PayloadKind::SCALAR);
    CATCH_REQUIRE(shape_of<std::string>().kind == PayloadKind::SCALAR);
    CATCH_REQUIRE(shape_of<std::vector<int>>().kind == PayloadKind::SEQUENCE);
    CATCH_REQUIRE(shape_of<std::map<std::string, int>>().kind == PayloadKind::MAPPING);
    CATCH_REQUIRE(shape_of<Point>().kind == PayloadKind::RECORD);
    CATCH_REQUIRE(&shape_of<Point>() == &shape_of<Point>());
  }

  CATCH_SECTION("fresh-collections-encode-empty-not-nil") {
    auto sequence = shape_of<std::vector<int>>().allocate();
    CATCH_REQUIRE(sequence->encode() == Value{Array{}});
    auto mapping = shape_of<std::map<std::string, int>>().allocate();
    CATCH_REQUIRE(mapping->encode() == Value{Object{}});
    auto scalar = shape_of<int64_t>().allocate();
    CATCH_REQUIRE(scalar->encode() == Value{0});
  }

  CATCH_SECTION("decode-into-payload") {
    auto payload = shape_of<Point>().allocate();
    CATCH_REQUIRE(&payload->shape() == &shape_of<Point>());
    CATCH_REQUIRE(!payload->decode(Value{Object{{"x", 5}}}));
    CATCH_REQUIRE(payload_cast<Point>(*payload).x == 5);
  }
}

} // namespace tether::rpc::tests
