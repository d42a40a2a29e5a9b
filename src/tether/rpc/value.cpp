
#include "stdinc.hpp"

#include "value.hpp"

#include <cmath>

namespace tether::rpc {

const Value* Value::find(std::string_view key) const {
  const auto* object = get_if<Object>();
  if (object == nullptr)
    return nullptr;
  auto ii = object->find(key);
  return (ii == object->end()) ? nullptr : &ii->second;
}

// ---------------------------------------------------------------------------------------- to_string

namespace {
void append_value(std::string& out, const Value& value) {
  switch (value.kind()) {
  case ValueKind::NIL:
    out += "nil";
    break;
  case ValueKind::BOOL:
    out += value.get<bool>() ? "true" : "false";
    break;
  case ValueKind::INT:
    out += std::to_string(value.get<int64_t>());
    break;
  case ValueKind::UINT:
    out += std::to_string(value.get<uint64_t>());
    break;
  case ValueKind::DOUBLE:
    out += format("{}", value.get<double>());
    break;
  case ValueKind::STRING:
    out += format("\"{}\"", value.get<std::string>());
    break;
  case ValueKind::BYTES:
    out += format("<{} bytes>", value.get<Bytes>().size());
    break;
  case ValueKind::ARRAY: {
    out += '[';
    bool first = true;
    for (const auto& item : value.get<Array>()) {
      if (!first)
        out += ", ";
      first = false;
      append_value(out, item);
    }
    out += ']';
  } break;
  case ValueKind::OBJECT: {
    out += '{';
    bool first = true;
    for (const auto& [key, item] : value.get<Object>()) {
      if (!first)
        out += ", ";
      first = false;
      out += key;
      out += ": ";
      append_value(out, item);
    }
    out += '}';
  } break;
  }
}
} // namespace

std::string to_string(const Value& value) {
  std::string out;
  append_value(out, value);
  return out;
}

// --------------------------------------------------------------------------------------- from_value

std::error_code from_value(const Value& value, Value& out) {
  out = value;
  return {};
}

std::error_code from_value(const Value& value, bool& out) {
  const auto* x = value.get_if<bool>();
  if (x == nullptr)
    return make_error_code(ecode::type_error);
  out = *x;
  return {};
}

std::error_code from_value(const Value& value, double& out) {
  if (const auto* x = value.get_if<double>()) {
    out = *x;
  } else if (const auto* i = value.get_if<int64_t>()) {
    out = double(*i);
  } else if (const auto* u = value.get_if<uint64_t>()) {
    out = double(*u);
  } else {
    return make_error_code(ecode::type_error);
  }
  return {};
}

std::error_code from_value(const Value& value, float& out) {
  double x = 0.0;
  if (auto ec = from_value(value, x))
    return ec;
  if (std::isfinite(x) && std::fabs(x) > double(std::numeric_limits<float>::max()))
    return make_error_code(ecode::type_error);
  out = float(x);
  return {};
}

std::error_code from_value(const Value& value, std::string& out) {
  if (const auto* x = value.get_if<std::string>()) {
    out = *x;
  } else if (const auto* b = value.get_if<Bytes>()) {
    out.assign(reinterpret_cast<const char*>(b->data()), b->size());
  } else {
    return make_error_code(ecode::type_error);
  }
  return {};
}

std::error_code from_value(const Value& value, Bytes& out) {
  if (const auto* x = value.get_if<Bytes>()) {
    out = *x;
  } else if (const auto* s = value.get_if<std::string>()) {
    const auto* data = reinterpret_cast<const std::byte*>(s->data());
    out.assign(data, data + s->size());
  } else {
    return make_error_code(ecode::type_error);
  }
  return {};
}

namespace detail {
std::error_code integer_from_value(const Value& value, int64_t min, uint64_t max, int64_t& out_i,
                                   uint64_t& out_u, bool is_signed) {
  // Integers convert between signed and unsigned when the value fits the target
  if (const auto* i = value.get_if<int64_t>()) {
    if (*i < 0 && (!is_signed || *i < min))
      return make_error_code(ecode::type_error);
    if (*i >= 0 && uint64_t(*i) > max)
      return make_error_code(ecode::type_error);
    out_i = *i;
    out_u = uint64_t(*i);
    return {};
  }
  if (const auto* u = value.get_if<uint64_t>()) {
    if (*u > max)
      return make_error_code(ecode::type_error);
    out_i = int64_t(*u);
    out_u = *u;
    return {};
  }
  return make_error_code(ecode::type_error);
}
} // namespace detail

} // namespace tether::rpc
