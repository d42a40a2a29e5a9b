
#include "stdinc.hpp"

#include "codec.hpp"

#include "binary-codec.hpp"

namespace tether::rpc {

CodecRegistry::CodecRegistry() {
  factories_.emplace(k_binary_codec, [](std::unique_ptr<net::Connection> connection) {
    return std::make_shared<BinaryCodec>(std::move(connection));
  });
}

CodecRegistry& CodecRegistry::instance() {
  static CodecRegistry registry;
  return registry;
}

std::error_code CodecRegistry::register_codec(uint32_t tag, CodecFactory factory) {
  if (!factory)
    return make_error_code(ecode::argument_error);
  std::lock_guard lock{padlock_};
  if (!factories_.emplace(tag, std::move(factory)).second) {
    LOG_ERR("codec type {} is already registered", tag);
    return make_error_code(ecode::argument_error);
  }
  return {};
}

CodecFactory CodecRegistry::find(uint32_t tag) const {
  std::lock_guard lock{padlock_};
  auto ii = factories_.find(tag);
  return (ii == cend(factories_)) ? CodecFactory{} : ii->second;
}

bool CodecRegistry::has(uint32_t tag) const {
  std::lock_guard lock{padlock_};
  return factories_.count(tag) > 0;
}

} // namespace tether::rpc
