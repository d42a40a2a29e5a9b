
#include "stdinc.hpp"

#include "binary-codec.hpp"

#include <bit>

namespace tether::rpc {

using net::append_integer;
using net::BufferType;
using net::operator<<;

namespace {

inline void append_tag(BufferType& buffer, BinaryCodec::Tag tag) {
  append_integer(buffer, static_cast<uint8_t>(tag));
}

std::error_code append_sized(BufferType& buffer, BinaryCodec::Tag tag,
                             std::span<const std::byte> bytes) {
  if (bytes.size() > BinaryCodec::k_max_object_size)
    return make_error_code(ecode::object_too_large);
  append_tag(buffer, tag);
  append_integer(buffer, uint32_t(bytes.size()));
  buffer << bytes;
  return {};
}

std::span<const std::byte> as_bytes(std::string_view ss) {
  return std::as_bytes(std::span<const char>{ss.data(), ss.size()});
}

std::error_code encode_value(BufferType& buffer, const Value& value, int depth) {
  using Tag = BinaryCodec::Tag;

  if (depth > BinaryCodec::k_max_depth)
    return make_error_code(ecode::invalid_data);

  switch (value.kind()) {
  case ValueKind::NIL:
    append_tag(buffer, Tag::NIL);
    return {};
  case ValueKind::BOOL:
    append_tag(buffer, value.get<bool>() ? Tag::TRUE : Tag::FALSE);
    return {};
  case ValueKind::INT:
    append_tag(buffer, Tag::INT);
    append_integer(buffer, value.get<int64_t>());
    return {};
  case ValueKind::UINT:
    append_tag(buffer, Tag::UINT);
    append_integer(buffer, value.get<uint64_t>());
    return {};
  case ValueKind::DOUBLE:
    append_tag(buffer, Tag::DOUBLE);
    append_integer(buffer, std::bit_cast<uint64_t>(value.get<double>()));
    return {};
  case ValueKind::STRING:
    return append_sized(buffer, Tag::STRING, as_bytes(value.get<std::string>()));
  case ValueKind::BYTES: {
    const auto& bytes = value.get<Bytes>();
    return append_sized(buffer, Tag::BYTES, {bytes.data(), bytes.size()});
  }
  case ValueKind::ARRAY: {
    const auto& array = value.get<Array>();
    if (array.size() > BinaryCodec::k_max_object_size)
      return make_error_code(ecode::object_too_large);
    append_tag(buffer, Tag::ARRAY);
    append_integer(buffer, uint32_t(array.size()));
    for (const auto& item : array)
      if (auto ec = encode_value(buffer, item, depth + 1))
        return ec;
    return {};
  }
  case ValueKind::OBJECT: {
    const auto& object = value.get<Object>();
    if (object.size() > BinaryCodec::k_max_object_size)
      return make_error_code(ecode::object_too_large);
    append_tag(buffer, Tag::OBJECT);
    append_integer(buffer, uint32_t(object.size()));
    for (const auto& [key, item] : object) {
      if (auto ec = append_sized(buffer, Tag::STRING, as_bytes(key)))
        return ec;
      if (auto ec = encode_value(buffer, item, depth + 1))
        return ec;
    }
    return {};
  }
  }
  return make_error_code(ecode::logic_error);
}

// The first byte of a message may legitimately hit the end of the stream; after that,
// the message has been cut short.
inline std::error_code mid_message(std::error_code ec) {
  return (ec == ecode::end_of_stream) ? make_error_code(ecode::premature_eof) : ec;
}

} // namespace

// ------------------------------------------------------------------------------------- BinaryCodec

BinaryCodec::BinaryCodec(std::unique_ptr<net::Connection> connection)
    : connection_{std::move(connection)}, reader_{*connection_} {}

std::error_code BinaryCodec::encode(BufferType& buffer, const Value& value) {
  return encode_value(buffer, value, 0);
}

std::error_code BinaryCodec::encode(BufferType& buffer, const Header& header) {
  append_tag(buffer, Tag::ARRAY);
  append_integer(buffer, uint32_t(3));
  append_tag(buffer, Tag::UINT);
  append_integer(buffer, header.sequence);
  if (auto ec = append_sized(buffer, Tag::STRING, as_bytes(header.procedure_name)))
    return ec;
  return append_sized(buffer, Tag::STRING, as_bytes(header.error_text));
}

std::error_code BinaryCodec::write(const Header& header, const Value& body) {
  BufferType buffer;
  auto ec = encode(buffer, header);
  if (!ec)
    ec = encode(buffer, body);
  if (!ec)
    ec = connection_->write_all(net::to_span_bytes(buffer));
  if (ec) {
    WARN("rpc: failed to write {} (seq={}) to {}: {}", header.procedure_name, header.sequence,
         connection_->remote_address(), ec.message());
    if (auto close_ec = connection_->close()) {
      TRACE("rpc: close after failed write: {}", close_ec.message());
    }
  }
  return ec;
}

std::error_code BinaryCodec::read_header(Header& header) {
  uint8_t tag = 0;
  if (auto ec = reader_.read_integer(tag))
    return ec;

  Value value;
  if (auto ec = mid_message(read_tagged_(tag, value, 0)))
    return ec;

  const auto* fields = value.get_if<Array>();
  if (fields == nullptr || fields->size() != 3)
    return make_error_code(ecode::invalid_data);

  Header out;
  if (from_value((*fields)[0], out.sequence) || from_value((*fields)[1], out.procedure_name) ||
      from_value((*fields)[2], out.error_text))
    return make_error_code(ecode::invalid_data);

  header = std::move(out);
  return {};
}

std::error_code BinaryCodec::read_body(Value* target) {
  Value value;
  if (auto ec = mid_message(read_value_(value, 0)))
    return ec;
  if (target != nullptr)
    *target = std::move(value);
  return {};
}

std::error_code BinaryCodec::close() { return connection_->close(); }

// ------------------------------------------------------------------------------------------ decode

std::error_code BinaryCodec::read_value_(Value& out, int depth) {
  uint8_t tag = 0;
  if (auto ec = reader_.read_integer(tag))
    return ec;
  return read_tagged_(tag, out, depth);
}

std::error_code BinaryCodec::read_length_(uint32_t& length) {
  if (auto ec = reader_.read_integer(length))
    return ec;
  if (length > k_max_object_size)
    return make_error_code(ecode::object_too_large);
  return {};
}

std::error_code BinaryCodec::read_tagged_(uint8_t tag, Value& out, int depth) {
  if (depth > k_max_depth)
    return make_error_code(ecode::invalid_data);

  std::error_code ec;
  uint32_t length = 0;

  switch (static_cast<Tag>(tag)) {
  case Tag::NIL:
    out = Value{};
    return {};
  case Tag::FALSE:
    out = Value{false};
    return {};
  case Tag::TRUE:
    out = Value{true};
    return {};
  case Tag::INT: {
    int64_t x = 0;
    if (!(ec = reader_.read_integer(x)))
      out = Value{x};
    return ec;
  }
  case Tag::UINT: {
    uint64_t x = 0;
    if (!(ec = reader_.read_integer(x)))
      out = Value{x};
    return ec;
  }
  case Tag::DOUBLE: {
    uint64_t x = 0;
    if (!(ec = reader_.read_integer(x)))
      out = Value{std::bit_cast<double>(x)};
    return ec;
  }
  case Tag::STRING: {
    std::string ss;
    if (!(ec = read_length_(length)) && !(ec = reader_.read_string(length, ss)))
      out = Value{std::move(ss)};
    return ec;
  }
  case Tag::BYTES: {
    if ((ec = read_length_(length)))
      return ec;
    Bytes bytes(length);
    if (!(ec = reader_.read(bytes)))
      out = Value{std::move(bytes)};
    return ec;
  }
  case Tag::ARRAY: {
    if ((ec = read_length_(length)))
      return ec;
    Array array;
    array.reserve(std::min<std::size_t>(length, 1024)); // The count is untrusted
    for (uint32_t i = 0; i < length; ++i) {
      Value item;
      if ((ec = read_value_(item, depth + 1)))
        return ec;
      array.push_back(std::move(item));
    }
    out = Value{std::move(array)};
    return {};
  }
  case Tag::OBJECT: {
    if ((ec = read_length_(length)))
      return ec;
    Object object;
    for (uint32_t i = 0; i < length; ++i) {
      Value key;
      Value item;
      if ((ec = read_value_(key, depth + 1)))
        return ec;
      if (!key.is_string())
        return make_error_code(ecode::invalid_data);
      if ((ec = read_value_(item, depth + 1)))
        return ec;
      object.insert_or_assign(std::move(key.get<std::string>()), std::move(item));
    }
    out = Value{std::move(object)};
    return {};
  }
  }

  return make_error_code(ecode::invalid_data);
}

} // namespace tether::rpc
