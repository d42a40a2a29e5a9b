
#pragma once

#include "status.hpp"
#include "value.hpp"

#include "tether/async/completion-queue.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace tether::rpc {

class Call;

using CallQueue = async::CompletionQueue<std::shared_ptr<Call>>;

/**
 * @brief One client-side invocation, from the moment it is issued until it is settled.
 *
 * A call is settled exactly once: by its response, by an error response, or by the
 * connection going down. Settling pushes the call onto its completion queue.
 */
class Call : public std::enable_shared_from_this<Call> {
public:
  /** @brief Decodes the response body into the caller's reply object */
  using ReplyDecoder = std::function<std::error_code(const Value&)>;

private:
  std::string procedure_name_;
  Value args_;
  ReplyDecoder decode_reply_;
  std::shared_ptr<CallQueue> done_;
  uint64_t sequence_{0};

  mutable std::mutex padlock_;
  Status status_;
  bool is_settled_{false};

public:
  Call(std::string procedure_name, Value args, ReplyDecoder decode_reply,
       std::shared_ptr<CallQueue> done)
      : procedure_name_{std::move(procedure_name)}, args_{std::move(args)},
        decode_reply_{std::move(decode_reply)}, done_{std::move(done)} {}

  Call(const Call&) = delete;
  Call& operator=(const Call&) = delete;

  const std::string& procedure_name() const { return procedure_name_; }
  const Value& args() const { return args_; }

  /** @brief Zero until the call is sent */
  uint64_t sequence() const { return sequence_; }

  /** @brief The queue that receives this call when it settles */
  const std::shared_ptr<CallQueue>& done() const { return done_; }

  Status status() const;
  bool is_settled() const;

  /**
   * @brief Block until the call settles.
   * Only valid when the call's completion queue is not shared with other calls.
   */
  Status wait();

private:
  friend class Client;

  void set_sequence_(uint64_t sequence) { sequence_ = sequence; }

  /** @brief Decode `body` into the reply, and settle */
  void finish_(const Value& body);

  /**
   * @brief Record `status` and signal completion, unless already settled.
   * @return true iff this was the settlement.
   */
  bool settle_(Status status);
};

} // namespace tether::rpc
