
#pragma once

#include "tether/utils/error-codes.hpp"

#include <string>
#include <string_view>
#include <system_error>

namespace tether::rpc {

/**
 * @brief The outcome of a call: an error code, and a human readable message.
 *
 * A call that failed on the server carries `ecode::remote_error`, and the server's
 * error text as the message.
 */
class Status {
private:
  std::error_code error_code_{};
  std::string error_message_{};

public:
  Status() = default;
  Status(std::error_code ec, std::string error_message = "")
      : error_code_{ec}, error_message_{std::move(error_message)} {
    if (error_code_ && error_message_.empty())
      error_message_ = error_code_.message();
  }
  Status(ecode code, std::string error_message = "")
      : Status{make_error_code(code), std::move(error_message)} {}

  /** @brief A call-level failure reported by the server, with its text verbatim */
  static Status remote(std::string error_text) {
    return Status{ecode::remote_error, std::move(error_text)};
  }

  std::error_code error_code() const { return error_code_; }
  std::string_view error_message() const { return error_message_; }
  bool ok() const { return !error_code_; }

  bool operator==(const Status& o) const {
    return (error_code_ == o.error_code_) && (error_message_ == o.error_message_);
  }
  bool operator!=(const Status& o) const { return !(*this == o); }
};

} // namespace tether::rpc
