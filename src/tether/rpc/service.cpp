
#include "stdinc.hpp"

#include "service.hpp"

#include <exception>

namespace tether::rpc {

// -------------------------------------------------------------------------------------- MethodType

Status MethodType::call(Payload& argv, Payload& replyv) {
  Expects(&argv.shape() == arg_shape_);
  Expects(&replyv.shape() == reply_shape_);
  num_calls_.fetch_add(1, std::memory_order_relaxed);
  try {
    return invoker_(argv, replyv);
  } catch (const std::exception& e) {
    return Status{ecode::exception_occurred, e.what()};
  }
}

// ----------------------------------------------------------------------------------------- Service

MethodType* Service::find_method(std::string_view name) const {
  auto ii = methods_.find(name);
  return (ii == methods_.end()) ? nullptr : ii->second.get();
}

std::vector<std::string> Service::method_names() const {
  std::vector<std::string> names;
  names.reserve(methods_.size());
  for (const auto& [name, method] : methods_)
    names.push_back(name);
  return names;
}

// ------------------------------------------------------------------------------------------- names

bool is_exported_name(std::string_view name) {
  if (name.empty() || name[0] < 'A' || name[0] > 'Z')
    return false;
  return std::all_of(cbegin(name), cend(name), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
  });
}

std::string unqualified_type_name(std::string_view demangled) {
  // Drop template arguments: "ns::Box<ns::Item>" => "ns::Box"
  auto pos = demangled.find('<');
  if (pos != std::string_view::npos)
    demangled = demangled.substr(0, pos);

  // Drop namespaces and enclosing classes: "ns::Box" => "Box"
  pos = demangled.rfind("::");
  if (pos != std::string_view::npos)
    demangled = demangled.substr(pos + 2);

  return std::string{demangled};
}

} // namespace tether::rpc
