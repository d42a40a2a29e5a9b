
#pragma once

#include "codec.hpp"
#include "service.hpp"

#include "tether/net/connection.hpp"
#include "tether/net/listener.hpp"

#include <cstddef>
#include <memory>
#include <string_view>
#include <system_error>

namespace tether::rpc
{

// ------------------------------------------------------------------------------------------ Server

/**
 * @brief Serves registered services to any number of connections.
 *
 * Each connection is served on its own thread, which reads requests in order and hands
 * them to a shared pool of dispatch threads. Each connection also has a writer thread,
 * the only one that writes to it: responses go out one at a time, in whatever order the
 * methods finish, and a peer that stops reading never holds up a dispatch thread.
 */
class Server
{
 private:
   struct Pimpl;
   std::unique_ptr<Pimpl> pimpl_;

 public:
   struct Config
   {
      std::size_t thread_pool_size = 0; //! Dispatch threads; 0 means one per core
   };

   Server();
   explicit Server(const Config& config);
   Server(const Server&) = delete;
   Server& operator=(const Server&) = delete;

   /**
    * @brief Runs `shutdown`.
    */
   ~Server();

   /**
    * @brief Make the methods of `service` callable as "Service.Method".
    * @return `ecode::duplicate_service` if a service of the same name is registered.
    */
   std::error_code register_service(std::shared_ptr<Service> service);

   /**
    * @brief Build the service, then register it.
    */
   template<typename T> std::error_code register_service(ServiceBuilder<T>& builder)
   {
      std::shared_ptr<Service> service;
      if(auto ec = builder.build(service)) return ec;
      return register_service(std::move(service));
   }

   /**
    * @brief Resolve "Service.Method".
    * @return `ecode::ill_formed_name`, `ecode::service_not_found` or `ecode::method_not_found`
    *         on failure.
    */
   std::error_code find(std::string_view procedure_name,
                        std::shared_ptr<Service>& out_service,
                        MethodType*& out_method) const;

   /**
    * @brief Accept connections from `listener`, serving each on a new thread.
    * Returns once `listener` is closed, or the server is shut down.
    */
   void accept(net::Listener& listener);

   /**
    * @brief Perform the server side of the handshake, then serve requests until the
    *        peer hangs up. Blocks the calling thread.
    * A connection with a bad preamble, or an unknown codec, is closed without a response.
    */
   void serve_connection(std::unique_ptr<net::Connection> connection);

   /**
    * @brief Serve requests on an already negotiated codec until the peer hangs up, then
    *        wait for outstanding responses to be written, and close the codec.
    */
   void serve_codec(std::shared_ptr<Codec> codec);

   /**
    * @brief Close every live connection and wait for the threads serving them. Connections
    *        served by `accept` are joined; `serve_connection` callers return on their own.
    *        The listener passed to `accept` must be closed by its owner.
    */
   void shutdown();
};

} // namespace tether::rpc
