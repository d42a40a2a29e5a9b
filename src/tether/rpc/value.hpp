
#pragma once

#include "tether/utils/error-codes.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace tether::rpc {

class Value;

using Array = std::vector<Value>;
using Object = std::map<std::string, Value, std::less<>>;
using Bytes = std::vector<std::byte>;

enum class ValueKind : int8_t { NIL = 0, BOOL, INT, UINT, DOUBLE, STRING, BYTES, ARRAY, OBJECT };

constexpr std::string_view str(ValueKind kind) {
#define CASE(x)                                                                                    \
  case ValueKind::x:                                                                               \
    return #x
  switch (kind) {
    CASE(NIL);
    CASE(BOOL);
    CASE(INT);
    CASE(UINT);
    CASE(DOUBLE);
    CASE(STRING);
    CASE(BYTES);
    CASE(ARRAY);
    CASE(OBJECT);
  }
#undef CASE
  return "<unknown case>";
}

// ------------------------------------------------------------------------------------------- Value

/**
 * @brief A self-describing value: the codec-neutral form of every request argument
 *        and every reply.
 *
 * Typed payloads are converted to and from `Value` with the `to_value`/`from_value`
 * overloads below. A user type takes part by declaring the same pair of functions in
 * its own namespace:
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * struct Args { int num1 = 0; int num2 = 0; };
 * rpc::Value to_value(const Args& o) { return rpc::Object{{"num1", o.num1}, {"num2", o.num2}}; }
 * std::error_code from_value(const rpc::Value& v, Args& o) {
 *   if (auto ec = rpc::get_field(v, "num1", o.num1)) return ec;
 *   return rpc::get_field(v, "num2", o.num2);
 * }
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
class Value {
public:
  using variant_type =
      std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string, Bytes, Array,
                   Object>;

private:
  variant_type data_;

public:
  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool x) : data_{x} {}
  Value(int x) : data_{int64_t(x)} {}
  Value(long x) : data_{int64_t(x)} {}
  Value(long long x) : data_{int64_t(x)} {}
  Value(unsigned x) : data_{uint64_t(x)} {}
  Value(unsigned long x) : data_{uint64_t(x)} {}
  Value(unsigned long long x) : data_{uint64_t(x)} {}
  Value(double x) : data_{x} {}
  Value(const char* x) : data_{std::string{x}} {}
  Value(std::string_view x) : data_{std::string{x}} {}
  Value(std::string x) : data_{std::move(x)} {}
  Value(Bytes x) : data_{std::move(x)} {}
  Value(Array x) : data_{std::move(x)} {}
  Value(Object x) : data_{std::move(x)} {}

  ValueKind kind() const noexcept { return static_cast<ValueKind>(data_.index()); }

  bool is_nil() const noexcept { return kind() == ValueKind::NIL; }
  bool is_bool() const noexcept { return kind() == ValueKind::BOOL; }
  bool is_int() const noexcept { return kind() == ValueKind::INT; }
  bool is_uint() const noexcept { return kind() == ValueKind::UINT; }
  bool is_integer() const noexcept { return is_int() || is_uint(); }
  bool is_double() const noexcept { return kind() == ValueKind::DOUBLE; }
  bool is_string() const noexcept { return kind() == ValueKind::STRING; }
  bool is_bytes() const noexcept { return kind() == ValueKind::BYTES; }
  bool is_array() const noexcept { return kind() == ValueKind::ARRAY; }
  bool is_object() const noexcept { return kind() == ValueKind::OBJECT; }

  /** @pre the value holds a `T` */
  template <typename T> const T& get() const { return std::get<T>(data_); }
  template <typename T> T& get() { return std::get<T>(data_); }

  /** @return nullptr unless the value holds a `T` */
  template <typename T> const T* get_if() const noexcept { return std::get_if<T>(&data_); }
  template <typename T> T* get_if() noexcept { return std::get_if<T>(&data_); }

  const variant_type& data() const noexcept { return data_; }

  /**
   * @return The member `key` of an object, or nullptr if this is not an object, or the
   *         member is absent.
   */
  const Value* find(std::string_view key) const;

  bool operator==(const Value& o) const { return data_ == o.data_; }
  bool operator!=(const Value& o) const { return !(*this == o); }
};

/**
 * @brief A short printable rendering of `value`, for logging and tests.
 */
std::string to_string(const Value& value);

// ---------------------------------------------------------------------------------------- to_value

inline Value to_value(const Value& x) { return x; }
inline Value to_value(bool x) { return Value{x}; }
inline Value to_value(double x) { return Value{x}; }
inline Value to_value(float x) { return Value{double(x)}; }
inline Value to_value(std::string_view x) { return Value{x}; }
inline Value to_value(const std::string& x) { return Value{x}; }
inline Value to_value(const char* x) { return Value{x}; }
inline Value to_value(const Bytes& x) { return Value{x}; }

template <typename T>
requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
Value to_value(T x) {
  if constexpr (std::is_signed_v<T>)
    return Value{int64_t(x)};
  else
    return Value{uint64_t(x)};
}

template <typename T> Value to_value(const std::optional<T>& x);
template <typename T> Value to_value(const std::vector<T>& x);
template <typename T, typename C> Value to_value(const std::map<std::string, T, C>& x);

template <typename T> Value to_value(const std::optional<T>& x) {
  if (!x.has_value())
    return Value{};
  return to_value(*x);
}

template <typename T> Value to_value(const std::vector<T>& x) {
  Array out;
  out.reserve(x.size());
  for (const auto& item : x)
    out.push_back(to_value(item));
  return Value{std::move(out)};
}

template <typename T, typename C> Value to_value(const std::map<std::string, T, C>& x) {
  Object out;
  for (const auto& [key, item] : x)
    out.emplace(key, to_value(item));
  return Value{std::move(out)};
}

// -------------------------------------------------------------------------------------- from_value

std::error_code from_value(const Value& value, Value& out);
std::error_code from_value(const Value& value, bool& out);
std::error_code from_value(const Value& value, double& out);
std::error_code from_value(const Value& value, float& out);
std::error_code from_value(const Value& value, std::string& out);
std::error_code from_value(const Value& value, Bytes& out);

namespace detail {
std::error_code integer_from_value(const Value& value, int64_t min, uint64_t max, int64_t& out_i,
                                   uint64_t& out_u, bool is_signed);
} // namespace detail

template <typename T>
requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
std::error_code from_value(const Value& value, T& out) {
  int64_t i = 0;
  uint64_t u = 0;
  constexpr bool is_signed = std::is_signed_v<T>;
  const auto ec = detail::integer_from_value(value, int64_t(std::numeric_limits<T>::lowest()),
                                             uint64_t(std::numeric_limits<T>::max()), i, u,
                                             is_signed);
  if (ec)
    return ec;
  out = is_signed ? T(i) : T(u);
  return {};
}

template <typename T> std::error_code from_value(const Value& value, std::optional<T>& out);
template <typename T> std::error_code from_value(const Value& value, std::vector<T>& out);
template <typename T, typename C>
std::error_code from_value(const Value& value, std::map<std::string, T, C>& out);

template <typename T> std::error_code from_value(const Value& value, std::optional<T>& out) {
  if (value.is_nil()) {
    out.reset();
    return {};
  }
  T item{};
  if (auto ec = from_value(value, item))
    return ec;
  out = std::move(item);
  return {};
}

template <typename T> std::error_code from_value(const Value& value, std::vector<T>& out) {
  const auto* array = value.get_if<Array>();
  if (array == nullptr)
    return make_error_code(ecode::type_error);
  std::vector<T> items;
  items.reserve(array->size());
  for (const auto& element : *array) {
    T item{};
    if (auto ec = from_value(element, item))
      return ec;
    items.push_back(std::move(item));
  }
  out = std::move(items);
  return {};
}

template <typename T, typename C>
std::error_code from_value(const Value& value, std::map<std::string, T, C>& out) {
  const auto* object = value.get_if<Object>();
  if (object == nullptr)
    return make_error_code(ecode::type_error);
  std::map<std::string, T, C> items;
  for (const auto& [key, element] : *object) {
    T item{};
    if (auto ec = from_value(element, item))
      return ec;
    items.emplace(key, std::move(item));
  }
  out = std::move(items);
  return {};
}

// ---------------------------------------------------------------------------------- record helpers

/**
 * @brief Decode the member `key` of the object `value` into `out`.
 * A missing member leaves `out` untouched, like a missing field in a gob or json struct.
 */
template <typename T>
std::error_code get_field(const Value& value, std::string_view key, T& out) {
  if (!value.is_object())
    return make_error_code(ecode::type_error);
  const auto* member = value.find(key);
  if (member == nullptr)
    return {};
  return from_value(*member, out);
}

} // namespace tether::rpc
