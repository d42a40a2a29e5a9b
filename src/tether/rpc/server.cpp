
#include "stdinc.hpp"

#include "server.hpp"

#include "handshake.hpp"

#include "tether/async/completion-queue.hpp"
#include "tether/async/execution-context.hpp"
#include "tether/async/wait-group.hpp"

#include <exception>
#include <mutex>
#include <optional>
#include <thread>

namespace tether::rpc
{

namespace
{
   constexpr auto k_accept_retry_delay = std::chrono::milliseconds{5};

   void close_codec(Codec& codec)
   {
      if(auto ec = codec.close()) { TRACE("rpc server: close: {}", ec.message()); }
   }

   struct Response
   {
      Header header;
      Value body;
   };

   // Everything shared by the request loop of one connection, its dispatch tasks, and its
   // writer. Only the writer touches the codec's write side, so a peer that stops reading
   // stalls its own connection and nothing else.
   struct ConnectionState
   {
      std::shared_ptr<Codec> codec;
      async::WaitGroup pending; // Dispatch tasks that have not queued their response
      async::CompletionQueue<std::optional<Response>> outbox; // `nullopt` stops the writer
      std::thread writer;

      void respond(uint64_t sequence,
                   std::string procedure_name,
                   std::string error_text,
                   Value reply)
      {
         // On error there is exactly one body: the nil placeholder
         if(!error_text.empty()) reply = Value{};
         outbox.push(Response{Header{sequence, std::move(procedure_name), std::move(error_text)},
                              std::move(reply)});
      }

      void write_responses()
      {
         bool is_broken = false;
         while(true) {
            auto response = outbox.pop();
            if(!response) return;
            const auto ec = codec->write(response->header, response->body);
            if(ec && !is_broken) {
               WARN("rpc server: writing response to {} (seq={}): {}",
                    response->header.procedure_name,
                    response->header.sequence,
                    ec.message());
            }
            is_broken = is_broken || bool(ec);
         }
      }
   };
} // namespace

// ------------------------------------------------------------------------------------------- Pimpl

struct Server::Pimpl
{
   async::ExecutionContext executor;

   mutable std::mutex padlock;
   std::map<std::string, std::shared_ptr<Service>, std::less<>> services;

   mutable std::mutex connections_padlock;
   bool is_shut_down = false;
   uint64_t next_thread_id = 1;
   std::unordered_map<uint64_t, std::thread> threads; // Serving connections from `accept`
   std::vector<uint64_t> finished_threads;
   uint64_t next_closer_id = 1;
   std::unordered_map<uint64_t, std::function<void()>> closers; // Closes each live connection

   explicit Pimpl(const Config& config)
       : executor{config.thread_pool_size}
   {}

   ~Pimpl() { shutdown(); }

   // ---------------------------------------------------------------------------------- services

   std::error_code register_service(std::shared_ptr<Service> service)
   {
      if(service == nullptr) return make_error_code(ecode::argument_error);
      if(!is_exported_name(service->name())) return make_error_code(ecode::invalid_service_name);

      std::lock_guard lock{padlock};
      if(services.count(service->name()) > 0) {
         LOG_ERR("rpc server: service already defined: {}", service->name());
         return make_error_code(ecode::duplicate_service);
      }
      for(const auto& method_name : service->method_names())
         INFO("rpc server: registered {}.{}", service->name(), method_name);
      services.emplace(service->name(), std::move(service));
      return {};
   }

   Status resolve(std::string_view procedure_name,
                  std::shared_ptr<Service>& out_service,
                  MethodType*& out_method) const
   {
      const auto pos = procedure_name.rfind('.');
      if(pos == std::string_view::npos)
         return Status{ecode::ill_formed_name,
                       format("rpc server: service/method request ill-formed: {}", procedure_name)};

      const auto service_name = procedure_name.substr(0, pos);
      const auto method_name  = procedure_name.substr(pos + 1);

      std::shared_ptr<Service> service;
      {
         std::lock_guard lock{padlock};
         auto ii = services.find(service_name);
         if(ii != cend(services)) service = ii->second;
      }
      if(service == nullptr)
         return Status{ecode::service_not_found,
                       format("rpc server: cannot find service {}", service_name)};

      auto method = service->find_method(method_name);
      if(method == nullptr)
         return Status{ecode::method_not_found,
                       format("rpc server: cannot find method {} on service {}",
                              method_name,
                              service_name)};

      out_service = std::move(service);
      out_method  = method;
      return Status{};
   }

   // ------------------------------------------------------------------------------- connections

   /**
    * @return An id for `untrack`, or 0 if the server is shut down.
    */
   uint64_t track(std::function<void()> closer)
   {
      std::lock_guard lock{connections_padlock};
      if(is_shut_down) return 0;
      const auto id = next_closer_id++;
      closers.emplace(id, std::move(closer));
      return id;
   }

   void untrack(uint64_t id)
   {
      std::lock_guard lock{connections_padlock};
      closers.erase(id);
   }

   // Must hold `connections_padlock`
   void reap_finished_threads()
   {
      for(const auto id : finished_threads) {
         auto ii = threads.find(id);
         if(ii == end(threads)) continue;
         if(ii->second.joinable()) ii->second.join();
         threads.erase(ii);
      }
      finished_threads.clear();
   }

   template<typename F> bool spawn(F&& work)
   {
      std::lock_guard lock{connections_padlock};
      if(is_shut_down) return false;
      reap_finished_threads();
      const auto id = next_thread_id++;
      threads.emplace(id, std::thread{[this, id, work = std::forward<F>(work)]() mutable {
                          work();
                          std::lock_guard lock{connections_padlock};
                          finished_threads.push_back(id);
                       }});
      return true;
   }

   void shutdown()
   {
      std::unordered_map<uint64_t, std::thread> joining;
      {
         std::lock_guard lock{connections_padlock};
         is_shut_down = true;
         for(const auto& [id, closer] : closers) closer();
         joining.swap(threads);
         finished_threads.clear();
      }
      for(auto& [id, thread] : joining)
         if(thread.joinable()) thread.join();
   }

   bool is_shutdown() const
   {
      std::lock_guard lock{connections_padlock};
      return is_shut_down;
   }
};

// ------------------------------------------------------------------------------------------ Server

Server::Server()
    : Server(Config{})
{}

Server::Server(const Config& config)
    : pimpl_{std::make_unique<Pimpl>(config)}
{}

Server::~Server() = default;

std::error_code Server::register_service(std::shared_ptr<Service> service)
{
   return pimpl_->register_service(std::move(service));
}

std::error_code Server::find(std::string_view procedure_name,
                             std::shared_ptr<Service>& out_service,
                             MethodType*& out_method) const
{
   return pimpl_->resolve(procedure_name, out_service, out_method).error_code();
}

void Server::shutdown() { pimpl_->shutdown(); }

// ------------------------------------------------------------------------------------------ accept

void Server::accept(net::Listener& listener)
{
   while(!pimpl_->is_shutdown()) {
      std::unique_ptr<net::Connection> connection;
      const auto ec = listener.accept(connection);
      if(ec) {
         if(listener.is_closed() || ec == std::errc::operation_canceled) return;
         WARN("rpc server: accept error: {}", ec.message());
         std::this_thread::sleep_for(k_accept_retry_delay);
         continue;
      }

      TRACE("rpc server: accepted connection from {}", connection->remote_address());
      const bool is_spawned = pimpl_->spawn([this, connection = std::move(connection)]() mutable {
         serve_connection(std::move(connection));
      });
      if(!is_spawned) return; // Shut down; the connection was dropped with the task
   }
}

// ---------------------------------------------------------------------------------------- serving

void Server::serve_connection(std::unique_ptr<net::Connection> connection)
{
   Expects(connection != nullptr);

   const auto id = pimpl_->track([ptr = connection.get()]() {
      if(auto ec = ptr->close()) { TRACE("rpc server: close: {}", ec.message()); }
   });
   if(id == 0) return;
   auto untrack = [this, id]() { pimpl_->untrack(id); };

   auto reject = [&connection, &untrack](std::string_view reason) {
      untrack();
      WARN("rpc server: rejecting {}: {}", connection->remote_address(), reason);
      if(auto ec = connection->close()) { TRACE("rpc server: close: {}", ec.message()); }
   };

   Preamble preamble;
   if(auto ec = net::read_exact(*connection, preamble)) {
      reject(format("reading preamble: {}", ec.message()));
      return;
   }

   uint32_t codec_type = 0;
   if(auto ec = decode_preamble(preamble, codec_type)) {
      reject(ec.message());
      return;
   }

   auto factory = CodecRegistry::instance().find(codec_type);
   if(!factory) {
      reject(format("unknown codec type {}", codec_type));
      return;
   }

   untrack();
   serve_codec(factory(std::move(connection)));
}

void Server::serve_codec(std::shared_ptr<Codec> codec)
{
   Expects(codec != nullptr);

   const auto id = pimpl_->track([ptr = codec.get()]() { close_codec(*ptr); });
   if(id == 0) {
      close_codec(*codec);
      return;
   }

   ConnectionState state;
   state.codec  = codec;
   state.writer = std::thread{[&state]() { state.write_responses(); }};

   while(true) {
      Header header;
      if(auto ec = codec->read_header(header)) {
         if(ec != ecode::end_of_stream) WARN("rpc server: reading header: {}", ec.message());
         break;
      }

      std::shared_ptr<Service> service;
      MethodType* method = nullptr;
      const auto resolved = pimpl_->resolve(header.procedure_name, service, method);
      if(!resolved.ok()) {
         // Discard the body to keep the stream aligned
         if(auto ec = codec->read_body(nullptr)) {
            WARN("rpc server: reading body: {}", ec.message());
            break;
         }
         state.respond(header.sequence,
                       std::move(header.procedure_name),
                       std::string{resolved.error_message()},
                       Value{});
         continue;
      }

      Value body;
      if(auto ec = codec->read_body(&body)) {
         WARN("rpc server: reading body: {}", ec.message());
         break;
      }

      std::shared_ptr<Payload> argv = method->new_argv();
      if(auto ec = argv->decode(body)) {
         state.respond(header.sequence,
                       std::move(header.procedure_name),
                       format("rpc server: read argument error: {}", ec.message()),
                       Value{});
         continue;
      }

      state.pending.add();
      pimpl_->executor.post([&state, service, method, argv, header = std::move(header)]() mutable {
         Status status;
         Value reply;
         try {
            auto replyv = method->new_replyv();
            status      = method->call(*argv, *replyv);
            if(status.ok()) reply = replyv->encode();
         } catch(const std::exception& e) {
            status = Status{ecode::exception_occurred, e.what()};
         } catch(...) {
            status = Status{ecode::exception_occurred, "unknown exception"};
         }
         state.respond(header.sequence,
                       std::move(header.procedure_name),
                       status.ok() ? std::string{} : std::string{status.error_message()},
                       std::move(reply));
         state.pending.done();
      });
   }

   // Every response still owed is queued before the writer is told to stop
   state.pending.wait();
   state.outbox.push(std::nullopt);
   state.writer.join();
   pimpl_->untrack(id);
   close_codec(*codec);
}

} // namespace tether::rpc
