
#pragma once

#include "value.hpp"

#include <boost/core/demangle.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace tether::rpc {

class Payload;

enum class PayloadKind : int8_t { SCALAR = 0, RECORD, SEQUENCE, MAPPING };

/**
 * @brief Describes the argument or reply type of a bound method, independent of the codec.
 */
struct PayloadShape {
  std::string type_name;                            //!< Demangled C++ type
  PayloadKind kind{PayloadKind::SCALAR};            //!< What the value encodes as
  std::function<std::unique_ptr<Payload>()> allocate; //!< A fresh, default-initialized payload
};

/**
 * @brief A type-erased, mutable argument or reply.
 */
class Payload {
public:
  virtual ~Payload() = default;

  /** @brief Convert the held object into a codec-neutral value */
  virtual Value encode() const = 0;

  /** @brief Overwrite the held object from `value` */
  virtual std::error_code decode(const Value& value) = 0;

  virtual const PayloadShape& shape() const = 0;
};

namespace detail {
template <typename T> struct is_sequence : std::false_type {};
template <typename T, typename A> struct is_sequence<std::vector<T, A>> : std::true_type {};
template <> struct is_sequence<Bytes> : std::false_type {};

template <typename T> struct is_mapping : std::false_type {};
template <typename T, typename C, typename A>
struct is_mapping<std::map<std::string, T, C, A>> : std::true_type {};

template <typename T> constexpr PayloadKind payload_kind() {
  if constexpr (is_sequence<T>::value)
    return PayloadKind::SEQUENCE;
  else if constexpr (is_mapping<T>::value)
    return PayloadKind::MAPPING;
  else if constexpr (std::is_arithmetic_v<T> || std::is_same_v<T, std::string> ||
                     std::is_same_v<T, Bytes> || std::is_same_v<T, Value>)
    return PayloadKind::SCALAR;
  else
    return PayloadKind::RECORD;
}
} // namespace detail

template <typename T> const PayloadShape& shape_of();

/**
 * @brief Holds a `T`, converting with the `to_value`/`from_value` overloads for `T`.
 */
template <typename T> class TypedPayload final : public Payload {
private:
  T value_{};

public:
  TypedPayload() = default;

  T& get() { return value_; }
  const T& get() const { return value_; }

  Value encode() const override { return to_value(value_); }
  std::error_code decode(const Value& value) override { return from_value(value, value_); }
  const PayloadShape& shape() const override { return shape_of<T>(); }
};

/**
 * @brief The shape of `T`; one instance per type.
 */
template <typename T> const PayloadShape& shape_of() {
  static_assert(std::is_default_constructible_v<T>, "payloads must be default constructible");
  static const PayloadShape shape{
      boost::core::demangle(typeid(T).name()), detail::payload_kind<T>(),
      []() -> std::unique_ptr<Payload> { return std::make_unique<TypedPayload<T>>(); }};
  return shape;
}

/**
 * @pre `payload.shape()` is `shape_of<T>()`
 */
template <typename T> T& payload_cast(Payload& payload) {
  return static_cast<TypedPayload<T>&>(payload).get();
}

} // namespace tether::rpc
