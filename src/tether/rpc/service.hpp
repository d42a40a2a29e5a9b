
#pragma once

#include "payload.hpp"
#include "status.hpp"

#include <boost/core/demangle.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <vector>

namespace tether::rpc {

/**
 * @brief One invocable method of a service: the dispatch binding for "Service.Method".
 */
class MethodType {
public:
  using InvokerType = std::function<Status(Payload& argv, Payload& replyv)>;

private:
  std::string name_;
  InvokerType invoker_;
  const PayloadShape* arg_shape_{nullptr};
  const PayloadShape* reply_shape_{nullptr};
  std::atomic<uint64_t> num_calls_{0};

public:
  MethodType(std::string name, InvokerType invoker, const PayloadShape& arg_shape,
             const PayloadShape& reply_shape)
      : name_{std::move(name)}, invoker_{std::move(invoker)}, arg_shape_{&arg_shape},
        reply_shape_{&reply_shape} {}

  MethodType(const MethodType&) = delete;
  MethodType& operator=(const MethodType&) = delete;

  const std::string& name() const { return name_; }
  const PayloadShape& arg_shape() const { return *arg_shape_; }
  const PayloadShape& reply_shape() const { return *reply_shape_; }

  /** @brief A fresh argument to decode a request body into */
  std::unique_ptr<Payload> new_argv() const { return arg_shape_->allocate(); }

  /**
   * @brief A fresh reply for the method to fill in.
   * Sequence and mapping replies start out empty (not nil).
   */
  std::unique_ptr<Payload> new_replyv() const { return reply_shape_->allocate(); }

  /**
   * @brief Invoke the method. An exception thrown by the method becomes an error status.
   */
  Status call(Payload& argv, Payload& replyv);

  /** @brief The number of times `call` has been invoked */
  uint64_t num_calls() const { return num_calls_.load(std::memory_order_relaxed); }
};

/**
 * @brief A named set of methods. Immutable once built, and so safe to share between threads.
 */
class Service {
public:
  using MethodTable = std::map<std::string, std::unique_ptr<MethodType>, std::less<>>;

private:
  std::string name_;
  MethodTable methods_;

public:
  Service(std::string name, MethodTable methods)
      : name_{std::move(name)}, methods_{std::move(methods)} {}

  const std::string& name() const { return name_; }

  /** @return nullptr if there is no such method */
  MethodType* find_method(std::string_view name) const;

  std::vector<std::string> method_names() const;
};

/**
 * @brief true iff `name` starts with an upper-case ASCII letter, and continues with
 *        letters, digits and underscores.
 */
bool is_exported_name(std::string_view name);

/**
 * @brief The unqualified name of a demangled C++ type: namespaces and template arguments
 *        are removed, so "ns::Arith<int>" becomes "Arith".
 */
std::string unqualified_type_name(std::string_view demangled);

/**
 * @brief Binds member functions of a `T` as the methods of a service.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * std::shared_ptr<rpc::Service> service;
 * auto ec = rpc::ServiceBuilder{std::make_shared<Arith>()}
 *               .method("Add", &Arith::Add)
 *               .method("Multiply", &Arith::Multiply)
 *               .build(service);
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * A method has the shape `Status T::M(const Args&, Reply&)`. `Args` and `Reply` must be
 * default constructible, and convertible with `to_value`/`from_value`.
 */
template <typename T> class ServiceBuilder {
private:
  std::shared_ptr<T> receiver_;
  std::string name_;
  Service::MethodTable methods_;
  std::error_code ec_{};

public:
  /** @brief The service is named after `T` */
  explicit ServiceBuilder(std::shared_ptr<T> receiver)
      : ServiceBuilder{receiver, unqualified_type_name(boost::core::demangle(typeid(T).name()))} {}

  ServiceBuilder(std::shared_ptr<T> receiver, std::string name)
      : receiver_{std::move(receiver)}, name_{std::move(name)} {
    if (receiver_ == nullptr)
      ec_ = make_error_code(ecode::argument_error);
    else if (!is_exported_name(name_))
      ec_ = make_error_code(ecode::invalid_service_name);
  }

  template <typename A, typename R>
  ServiceBuilder& method(std::string_view name, Status (T::*fn)(const A&, R&)) {
    return bind_<A, R>(name, [receiver = receiver_, fn](Payload& argv, Payload& replyv) {
      return ((*receiver).*fn)(payload_cast<A>(argv), payload_cast<R>(replyv));
    });
  }

  template <typename A, typename R>
  ServiceBuilder& method(std::string_view name, Status (T::*fn)(const A&, R&) const) {
    return bind_<A, R>(name, [receiver = receiver_, fn](Payload& argv, Payload& replyv) {
      return ((*receiver).*fn)(payload_cast<A>(argv), payload_cast<R>(replyv));
    });
  }

  const std::string& name() const { return name_; }

  /**
   * @return The first error met while binding methods, or okay, in which case `out`
   *         is set to the new service.
   */
  std::error_code build(std::shared_ptr<Service>& out) {
    if (ec_)
      return ec_;
    out = std::make_shared<Service>(name_, std::move(methods_));
    methods_.clear();
    return {};
  }

private:
  template <typename A, typename R>
  ServiceBuilder& bind_(std::string_view name, MethodType::InvokerType invoker) {
    if (ec_)
      return *this;
    if (!is_exported_name(name)) {
      ec_ = make_error_code(ecode::invalid_method_name);
    } else if (methods_.find(name) != methods_.end()) {
      ec_ = make_error_code(ecode::duplicate_method);
    } else {
      methods_.emplace(std::string{name},
                       std::make_unique<MethodType>(std::string{name}, std::move(invoker),
                                                    shape_of<A>(), shape_of<R>()));
    }
    return *this;
  }
};

} // namespace tether::rpc
