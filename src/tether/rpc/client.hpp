
#pragma once

#include "call.hpp"
#include "codec.hpp"
#include "status.hpp"
#include "value.hpp"

#include "tether/net/connection.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace tether::rpc {

/**
 * @brief Multiplexes concurrent calls over a single connection.
 *
 * Calls may be issued from any number of threads. Responses are matched to their calls
 * by sequence number, in whatever order they arrive. When the connection fails, every
 * outstanding call is settled with `ecode::shutdown`, and the client stays unavailable.
 */
class Client {
private:
  std::shared_ptr<Codec> codec_;

  std::mutex sending_; // Orders writes; always taken before `padlock_`

  mutable std::mutex padlock_; // Guards everything below
  uint64_t next_sequence_{1};
  std::unordered_map<uint64_t, std::shared_ptr<Call>> pending_;
  bool closing_{false};  // The user called close
  bool shutdown_{false}; // The receive loop has stopped

  std::thread receiver_;

  explicit Client(std::shared_ptr<Codec> codec);

public:
  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  /**
   * @brief Closes the connection, and joins the receive thread.
   */
  ~Client();

  /**
   * @brief Connect to a server.
   * @param network "tcp" or "unix"
   * @param address "host:port" for tcp, or a filesystem path for unix
   * @param out Set to the new client on success
   * @param codec_type The codec type tag to request
   */
  static std::error_code dial(std::string_view network, std::string_view address,
                              std::unique_ptr<Client>& out, uint32_t codec_type = k_binary_codec);

  /**
   * @brief Perform the client side of the handshake on an open connection, and start
   *        the receive loop.
   * The connection is closed if the handshake fails.
   */
  static std::error_code make(std::unique_ptr<net::Connection> connection, uint32_t codec_type,
                              std::unique_ptr<Client>& out);

  /**
   * @brief Issue a call, without waiting for it to complete.
   * @param reply Receives the response; must outlive the call's settlement.
   * @param done The queue to push the settled call onto; a fresh queue is created if
   *             `nullptr`. One queue may be shared by any number of calls.
   */
  template <typename A, typename R>
  std::shared_ptr<Call> go_call(std::string_view procedure_name, const A& args, R& reply,
                                std::shared_ptr<CallQueue> done = nullptr) {
    return go_call_(procedure_name, to_value(args),
                    [&reply](const Value& body) { return from_value(body, reply); },
                    std::move(done));
  }

  /**
   * @brief Issue a call, and block until it completes.
   */
  template <typename A, typename R>
  Status call(std::string_view procedure_name, const A& args, R& reply) {
    return go_call(procedure_name, args, reply)->wait();
  }

  /**
   * @brief Like `call`, but gives up after `timeout`, with `ecode::deadline_exceeded`.
   * A response that arrives after the deadline is discarded.
   */
  template <typename A, typename R, typename Rep, typename Period>
  Status call_for(std::string_view procedure_name, const A& args, R& reply,
                  const std::chrono::duration<Rep, Period>& timeout) {
    auto call = go_call(procedure_name, args, reply);
    std::shared_ptr<Call> settled;
    if (call->done()->pop_for(timeout, settled))
      return settled->status();
    return abandon_(*call);
  }

  /**
   * @brief Close the connection; outstanding calls settle with `ecode::shutdown`.
   * @return `ecode::already_closed` if the client is already closed or shut down.
   */
  std::error_code close();

  /**
   * @brief false once the client is closed, or its connection has gone down.
   */
  bool is_available() const;

  /** @brief The number of calls sent and waiting for a response */
  std::size_t pending_count() const;

private:
  std::shared_ptr<Call> go_call_(std::string_view procedure_name, Value args,
                                 Call::ReplyDecoder decode_reply,
                                 std::shared_ptr<CallQueue> done);
  void send_(const std::shared_ptr<Call>& call);
  std::shared_ptr<Call> remove_pending_(uint64_t sequence);
  Status abandon_(Call& call);
  void receive_loop_();
  void terminate_calls_(std::error_code ec);
};

} // namespace tether::rpc
