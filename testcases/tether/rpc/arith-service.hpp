
#pragma once

#include "tether/rpc/service.hpp"
#include "tether/rpc/status.hpp"
#include "tether/rpc/value.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

namespace tether::rpc::tests {

struct Args {
  int64_t num1 = 0;
  int64_t num2 = 0;
};

inline Value to_value(const Args& o) { return Object{{"num1", o.num1}, {"num2", o.num2}}; }

inline std::error_code from_value(const Value& value, Args& o) {
  if (auto ec = get_field(value, "num1", o.num1))
    return ec;
  return get_field(value, "num2", o.num2);
}

struct Quotient {
  int64_t quo = 0;
  int64_t rem = 0;
};

inline Value to_value(const Quotient& o) { return Object{{"quo", o.quo}, {"rem", o.rem}}; }

inline std::error_code from_value(const Value& value, Quotient& o) {
  if (auto ec = get_field(value, "quo", o.quo))
    return ec;
  return get_field(value, "rem", o.rem);
}

/**
 * @brief The service used throughout the rpc tests.
 */
class Arith {
public:
  Status add(const Args& args, int64_t& reply) const {
    reply = args.num1 + args.num2;
    return {};
  }

  Status multiply(const Args& args, int64_t& reply) const {
    reply = args.num1 * args.num2;
    return {};
  }

  Status divide(const Args& args, Quotient& reply) const {
    if (args.num2 == 0)
      return Status{ecode::argument_error, "divide by zero"};
    reply.quo = args.num1 / args.num2;
    reply.rem = args.num1 % args.num2;
    return {};
  }

  Status error(const Args&, int64_t&) const { throw std::runtime_error{"ERROR"}; }

  // Sleeps for `num1` milliseconds, then echoes `num2`
  Status sleep(const Args& args, int64_t& reply) const {
    std::this_thread::sleep_for(std::chrono::milliseconds{args.num1});
    reply = args.num2;
    return {};
  }

  Status range(const Args& args, std::vector<int64_t>& reply) const {
    for (auto i = args.num1; i < args.num2; ++i)
      reply.push_back(i);
    return {};
  }

  Status echo(const std::string& text, std::string& reply) const {
    reply = text;
    return {};
  }
};

inline std::error_code build_arith(std::shared_ptr<Service>& out) {
  return ServiceBuilder{std::make_shared<Arith>()}
      .method("Add", &Arith::add)
      .method("Multiply", &Arith::multiply)
      .method("Divide", &Arith::divide)
      .method("Error", &Arith::error)
      .method("Sleep", &Arith::sleep)
      .method("Range", &Arith::range)
      .method("Echo", &Arith::echo)
      .build(out);
}

} // namespace tether::rpc::tests
