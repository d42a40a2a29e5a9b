
#include "stdinc.hpp"

#include "arith-service.hpp"

#include "tether/rpc/server.hpp"

#include <catch2/catch.hpp>

namespace tether::rpc::tests {

namespace {
class Counter {
public:
  Status inc(const int64_t& delta, int64_t& reply) {
    total_ += delta;
    reply = total_;
    return {};
  }

private:
  int64_t total_ = 0;
};

template <typename T> class Box {
public:
  Status get(const int64_t&, int64_t& reply) const {
    reply = 1;
    return {};
  }
};

class lowercase {
public:
  Status Get(const int64_t&, int64_t& reply) const {
    reply = 1;
    return {};
  }
};
} // namespace

CATCH_TEST_CASE("ServiceNames", "[service]") {
  CATCH_SECTION("exported") {
    CATCH_REQUIRE(is_exported_name("Arith"));
    CATCH_REQUIRE(is_exported_name("A_1"));
    CATCH_REQUIRE(!is_exported_name(""));
    CATCH_REQUIRE(!is_exported_name("arith"));
    CATCH_REQUIRE(!is_exported_name("_Arith"));
    CATCH_REQUIRE(!is_exported_name("Ari.th"));
  }

  CATCH_SECTION("unqualified-type-name") {
    CATCH_REQUIRE(unqualified_type_name("Arith") == "Arith");
    CATCH_REQUIRE(unqualified_type_name("a::b::Arith") == "Arith");
    CATCH_REQUIRE(unqualified_type_name("a::Box<b::Item>") == "Box");
    CATCH_REQUIRE(unqualified_type_name("(anonymous namespace)::Counter") == "Counter");
  }

  CATCH_SECTION("derived-from-the-type") {
    CATCH_REQUIRE(ServiceBuilder{std::make_shared<Arith>()}.name() == "Arith");
    CATCH_REQUIRE(ServiceBuilder{std::make_shared<Box<int>>()}.name() == "Box");
    CATCH_REQUIRE(ServiceBuilder{std::make_shared<Counter>(), "Tally"}.name() == "Tally");
  }
}

CATCH_TEST_CASE("ServiceBuilder", "[service]") {
  CATCH_SECTION("arith") {
    std::shared_ptr<Service> service;
    CATCH_REQUIRE(!build_arith(service));
    CATCH_REQUIRE(service->name() == "Arith");
    CATCH_REQUIRE(service->method_names().size() == 7);
    CATCH_REQUIRE(service->find_method("Add") != nullptr);
    CATCH_REQUIRE(service->find_method("add") == nullptr);
  }

  CATCH_SECTION("unexported-service-name") {
    std::shared_ptr<Service> service;
    CATCH_REQUIRE(ServiceBuilder{std::make_shared<lowercase>()}
                      .method("Get", &lowercase::Get)
                      .build(service)
                  == ecode::invalid_service_name);
    CATCH_REQUIRE(service == nullptr);
  }

  CATCH_SECTION("unexported-method-name") {
    std::shared_ptr<Service> service;
    CATCH_REQUIRE(ServiceBuilder{std::make_shared<Counter>()}
                      .method("inc", &Counter::inc)
                      .build(service)
                  == ecode::invalid_method_name);
  }

  CATCH_SECTION("duplicate-method") {
    std::shared_ptr<Service> service;
    CATCH_REQUIRE(ServiceBuilder{std::make_shared<Arith>()}
                      .method("Add", &Arith::add)
                      .method("Add", &Arith::multiply)
                      .build(service)
                  == ecode::duplicate_method);
  }

  CATCH_SECTION("null-receiver") {
    std::shared_ptr<Service> service;
    CATCH_REQUIRE(ServiceBuilder<Arith>{nullptr, "Arith"}.build(service) == ecode::argument_error);
  }
}

CATCH_TEST_CASE("MethodType", "[service]") {
  std::shared_ptr<Service> service;
  CATCH_REQUIRE(!build_arith(service));

  CATCH_SECTION("call-and-count") {
    auto* method = service->find_method("Add");
    CATCH_REQUIRE(method->num_calls() == 0);
    CATCH_REQUIRE(method->arg_shape().kind == PayloadKind::RECORD);
    CATCH_REQUIRE(method->reply_shape().kind == PayloadKind::SCALAR);

    auto argv = method->new_argv();
    CATCH_REQUIRE(!argv->decode(to_value(Args{1, 2})));
    auto replyv = method->new_replyv();
    CATCH_REQUIRE(method->call(*argv, *replyv).ok());
    CATCH_REQUIRE(payload_cast<int64_t>(*replyv) == 3);
    CATCH_REQUIRE(replyv->encode() == Value{3});
    CATCH_REQUIRE(method->num_calls() == 1);
  }

  CATCH_SECTION("sequence-reply-starts-empty") {
    auto* method = service->find_method("Range");
    auto replyv = method->new_replyv();
    CATCH_REQUIRE(replyv->encode() == Value{Array{}});
  }

  CATCH_SECTION("status-errors") {
    auto* method = service->find_method("Divide");
    auto argv = method->new_argv();
    CATCH_REQUIRE(!argv->decode(to_value(Args{1, 0})));
    auto replyv = method->new_replyv();
    const auto status = method->call(*argv, *replyv);
    CATCH_REQUIRE(status.error_code() == ecode::argument_error);
    CATCH_REQUIRE(status.error_message() == "divide by zero");
  }

  CATCH_SECTION("exceptions-become-errors") {
    auto* method = service->find_method("Error");
    auto argv = method->new_argv();
    auto replyv = method->new_replyv();
    const auto status = method->call(*argv, *replyv);
    CATCH_REQUIRE(status.error_code() == ecode::exception_occurred);
    CATCH_REQUIRE(status.error_message() == "ERROR");
    CATCH_REQUIRE(method->num_calls() == 1);
  }

  CATCH_SECTION("receiver-state") {
    std::shared_ptr<Service> counter;
    ServiceBuilder builder{std::make_shared<Counter>()};
    builder.method("Inc", &Counter::inc);
    CATCH_REQUIRE(!builder.build(counter));
    auto* method = counter->find_method("Inc");
    for (int i = 0; i < 3; ++i) {
      auto argv = method->new_argv();
      CATCH_REQUIRE(!argv->decode(Value{10}));
      auto replyv = method->new_replyv();
      CATCH_REQUIRE(method->call(*argv, *replyv).ok());
      CATCH_REQUIRE(payload_cast<int64_t>(*replyv) == 10 * (i + 1));
    }
    CATCH_REQUIRE(method->num_calls() == 3);
  }
}

CATCH_TEST_CASE("ServerRegistry", "[service]") {
  Server server{Server::Config{1}};
  std::shared_ptr<Service> arith;
  CATCH_REQUIRE(!build_arith(arith));
  CATCH_REQUIRE(!server.register_service(arith));

  CATCH_SECTION("duplicate-service") {
    std::shared_ptr<Service> again;
    CATCH_REQUIRE(!build_arith(again));
    CATCH_REQUIRE(server.register_service(again) == ecode::duplicate_service);
  }

  CATCH_SECTION("find") {
    std::shared_ptr<Service> service;
    MethodType* method = nullptr;
    CATCH_REQUIRE(!server.find("Arith.Add", service, method));
    CATCH_REQUIRE(service == arith);
    CATCH_REQUIRE(method == arith->find_method("Add"));
    CATCH_REQUIRE(server.find("ArithAdd", service, method) == ecode::ill_formed_name);
    CATCH_REQUIRE(server.find("Nope.Add", service, method) == ecode::service_not_found);
    CATCH_REQUIRE(server.find("Arith.Missing", service, method) == ecode::method_not_found);
  }

  CATCH_SECTION("register-a-builder") {
    auto builder = ServiceBuilder{std::make_shared<Counter>()};
    builder.method("Inc", &Counter::inc);
    CATCH_REQUIRE(!server.register_service(builder));

    std::shared_ptr<Service> service;
    MethodType* method = nullptr;
    CATCH_REQUIRE(!server.find("Counter.Inc", service, method));
  }
}

} // namespace tether::rpc::tests
