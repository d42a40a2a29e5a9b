
#include "stdinc.hpp"

#include "client.hpp"

#include "handshake.hpp"

namespace tether::rpc {

// ------------------------------------------------------------------------------------ construction

Client::Client(std::shared_ptr<Codec> codec) : codec_{std::move(codec)} {}

Client::~Client() {
  {
    std::lock_guard lock{padlock_};
    closing_ = true;
  }
  if (auto ec = codec_->close()) {
    TRACE("rpc client: close: {}", ec.message());
  }
  if (receiver_.joinable())
    receiver_.join();
}

std::error_code Client::dial(std::string_view network, std::string_view address,
                             std::unique_ptr<Client>& out, uint32_t codec_type) {
  std::unique_ptr<net::Connection> connection;
  if (auto ec = net::dial(network, address, connection)) {
    WARN("rpc client: failed to dial {}:{}: {}", network, address, ec.message());
    return ec;
  }
  return make(std::move(connection), codec_type, out);
}

std::error_code Client::make(std::unique_ptr<net::Connection> connection, uint32_t codec_type,
                             std::unique_ptr<Client>& out) {
  Expects(connection != nullptr);

  auto close_connection = [&connection]() {
    if (auto ec = connection->close()) {
      TRACE("rpc client: close: {}", ec.message());
    }
  };

  auto factory = CodecRegistry::instance().find(codec_type);
  if (!factory) {
    WARN("rpc client: codec type {} is not registered", codec_type);
    close_connection();
    return make_error_code(ecode::invalid_codec);
  }

  const auto preamble = encode_preamble(codec_type);
  if (auto ec = connection->write_all(preamble)) {
    WARN("rpc client: failed to send preamble to {}: {}", connection->remote_address(),
         ec.message());
    close_connection();
    return ec;
  }

  auto client = std::unique_ptr<Client>{new Client{factory(std::move(connection))}};
  client->receiver_ = std::thread{[ptr = client.get()]() { ptr->receive_loop_(); }};
  out = std::move(client);
  return {};
}

// ------------------------------------------------------------------------------------------- state

std::error_code Client::close() {
  {
    std::lock_guard lock{padlock_};
    if (closing_ || shutdown_)
      return make_error_code(ecode::already_closed);
    closing_ = true;
  }
  return codec_->close();
}

bool Client::is_available() const {
  std::lock_guard lock{padlock_};
  return !closing_ && !shutdown_;
}

std::size_t Client::pending_count() const {
  std::lock_guard lock{padlock_};
  return pending_.size();
}

// -------------------------------------------------------------------------------------------- send

std::shared_ptr<Call> Client::go_call_(std::string_view procedure_name, Value args,
                                       Call::ReplyDecoder decode_reply,
                                       std::shared_ptr<CallQueue> done) {
  if (done == nullptr)
    done = std::make_shared<CallQueue>();
  auto call = std::make_shared<Call>(std::string{procedure_name}, std::move(args),
                                     std::move(decode_reply), std::move(done));
  send_(call);
  return call;
}

void Client::send_(const std::shared_ptr<Call>& call) {
  std::lock_guard send_lock{sending_};

  uint64_t sequence = 0;
  bool is_down = false;
  {
    std::lock_guard lock{padlock_};
    is_down = closing_ || shutdown_;
    if (!is_down) {
      sequence = next_sequence_++;
      call->set_sequence_(sequence);
      pending_.emplace(sequence, call);
    }
  }

  if (is_down) {
    call->settle_(Status{ecode::shutdown});
    return;
  }

  const Header header{sequence, call->procedure_name(), ""};
  if (auto ec = codec_->write(header, call->args())) {
    // The receive loop sees the broken connection, and settles everything else
    auto removed = remove_pending_(sequence);
    if (removed != nullptr)
      removed->settle_(Status{ec});
  }
}

std::shared_ptr<Call> Client::remove_pending_(uint64_t sequence) {
  std::lock_guard lock{padlock_};
  auto ii = pending_.find(sequence);
  if (ii == cend(pending_))
    return nullptr;
  auto call = std::move(ii->second);
  pending_.erase(ii);
  return call;
}

Status Client::abandon_(Call& call) {
  auto removed = remove_pending_(call.sequence());
  if (removed != nullptr) {
    removed->settle_(Status{ecode::deadline_exceeded});
    return removed->status();
  }
  // The receive loop owns the call, and is about to settle it
  return call.wait();
}

// ----------------------------------------------------------------------------------------- receive

void Client::receive_loop_() {
  std::error_code ec;
  while (!ec) {
    Header header;
    if ((ec = codec_->read_header(header)))
      break;

    auto call = remove_pending_(header.sequence);
    if (call == nullptr) {
      // Removed after a failed send, or abandoned; keep the stream aligned
      TRACE("rpc client: discarding response to {} (seq={})", header.procedure_name,
            header.sequence);
      ec = codec_->read_body(nullptr);
    } else if (!header.error_text.empty()) {
      ec = codec_->read_body(nullptr);
      call->settle_(Status::remote(std::move(header.error_text)));
    } else {
      Value body;
      ec = codec_->read_body(&body);
      if (ec)
        call->settle_(Status{ec, format("reading body: {}", ec.message())});
      else
        call->finish_(body);
    }
  }

  terminate_calls_(ec);
}

void Client::terminate_calls_(std::error_code ec) {
  // Unblocks a sender that is stuck writing to a peer that stopped reading
  if (auto close_ec = codec_->close()) {
    TRACE("rpc client: close: {}", close_ec.message());
  }

  std::unordered_map<uint64_t, std::shared_ptr<Call>> pending;
  bool closing = false;
  {
    std::lock_guard send_lock{sending_};
    std::lock_guard lock{padlock_};
    shutdown_ = true;
    closing = closing_;
    pending.swap(pending_);
  }

  if (!closing && ec != ecode::end_of_stream) {
    WARN("rpc client: connection failed: {}", ec.message());
  }

  const auto message = closing ? std::string{"connection shut down"}
                               : format("connection shut down: {}", ec.message());
  for (auto& [sequence, call] : pending)
    call->settle_(Status{ecode::shutdown, message});
}

} // namespace tether::rpc
