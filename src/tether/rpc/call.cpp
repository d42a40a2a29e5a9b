
#include "stdinc.hpp"

#include "call.hpp"

namespace tether::rpc {

Status Call::status() const {
  std::lock_guard lock{padlock_};
  return status_;
}

bool Call::is_settled() const {
  std::lock_guard lock{padlock_};
  return is_settled_;
}

Status Call::wait() {
  [[maybe_unused]] auto call = done_->pop();
  Expects(call.get() == this);
  return status();
}

void Call::finish_(const Value& body) {
  std::error_code ec;
  if (decode_reply_)
    ec = decode_reply_(body);
  if (ec)
    settle_(Status{ec, format("reading body: {}", ec.message())});
  else
    settle_(Status{});
}

bool Call::settle_(Status status) {
  {
    std::lock_guard lock{padlock_};
    if (is_settled_) {
      TRACE("rpc: call {} (seq={}) settled twice", procedure_name_, sequence_);
      return false;
    }
    status_ = std::move(status);
    is_settled_ = true;
  }
  done_->push(shared_from_this());
  return true;
}

} // namespace tether::rpc
