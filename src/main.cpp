// We know that `main.cpp` is going to be first in unity builds.
// Therefore, we include our precompiled header here, so that it
// is first in the unity (testcases) build.
#include "stdinc.hpp"

#include "tether/net.hpp"
#include "tether/rpc.hpp"
#include "tether/utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <stdexcept>
#include <thread>

namespace tether::demo
{
// ------------------------------------------------------------------------------------------- Arith

struct Args
{
   int64_t num1 = 0;
   int64_t num2 = 0;
};

rpc::Value to_value(const Args& o) { return rpc::Object{{"num1", o.num1}, {"num2", o.num2}}; }

std::error_code from_value(const rpc::Value& value, Args& o)
{
   if(auto ec = rpc::get_field(value, "num1", o.num1)) return ec;
   return rpc::get_field(value, "num2", o.num2);
}

class Arith
{
 public:
   rpc::Status add(const Args& args, int64_t& reply) const
   {
      reply = args.num1 + args.num2;
      return {};
   }

   rpc::Status multiply(const Args& args, int64_t& reply) const
   {
      reply = args.num1 * args.num2;
      return {};
   }

   rpc::Status divide(const Args& args, int64_t& reply) const
   {
      if(args.num2 == 0) return rpc::Status{ecode::argument_error, "divide by zero"};
      reply = args.num1 / args.num2;
      return {};
   }
};

// ------------------------------------------------------------------------------------------ Config

struct Config
{
   bool show_help          = false;
   string command          = {};
   string network          = "tcp";
   string address          = "127.0.0.1:7070";
   unsigned thread_pool    = 0;
   std::vector<int64_t> operands;
};

void show_help(const char* exec)
{
   cout << format(R"V0G0N(

   Usage: {0} serve [-n <network>] [-a <address>] [-t <threads>]
          {0} call  [-n <network>] [-a <address>] <a> <b>

      -n <network>   Either "tcp" or "unix"; default is "tcp"
      -a <address>   "host:port" for tcp, or a socket path for unix; default is "127.0.0.1:7070"
      -t <threads>   Number of dispatch threads; default is one per core

   The server exposes Arith.Add, Arith.Multiply and Arith.Divide.

)V0G0N",
                  exec);
}

Config parse_command_line(int argc, char** argv, bool& has_error)
{
   Config config;

   for(int i = 1; i < argc; ++i) {
      string arg = argv[i];
      try {
         if(arg == "-h" || arg == "--help") {
            config.show_help = true;
         } else if(arg == "-n") {
            config.network = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-a") {
            config.address = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-t") {
            config.thread_pool = cli::safe_arg_uint(argc, argv, i);
         } else if(config.command.empty()) {
            config.command = arg;
         } else if(config.command == "call") {
            config.operands.push_back(cli::parse_i64(arg));
         } else {
            cout << format("unexpected argument: '{}'", arg) << endl;
            has_error = true;
         }
      } catch(std::runtime_error& e) {
         cout << format("Error on command-line: {}", e.what()) << endl;
         has_error = true;
      }
   }

   if(!config.show_help) {
      if(config.command != "serve" && config.command != "call") {
         cout << format("expected a command: 'serve' or 'call'") << endl;
         has_error = true;
      } else if(config.command == "call" && config.operands.size() != 2) {
         cout << format("'call' expects exactly two integers") << endl;
         has_error = true;
      }
   }

   return config;
}

// ------------------------------------------------------------------------------------------- serve

int run_serve(const Config& config)
{
   rpc::Server server{rpc::Server::Config{config.thread_pool}};

   auto builder = rpc::ServiceBuilder{std::make_shared<Arith>()};
   builder.method("Add", &Arith::add)
       .method("Multiply", &Arith::multiply)
       .method("Divide", &Arith::divide);
   if(auto ec = server.register_service(builder)) {
      LOG_ERR("registering service {}: {}", builder.name(), ec.message());
      return EXIT_FAILURE;
   }

   std::unique_ptr<net::Listener> listener;
   if(auto ec = net::listen(config.network, config.address, listener)) {
      LOG_ERR("listening on {}:{}: {}", config.network, config.address, ec.message());
      return EXIT_FAILURE;
   }

   // Ctrl-C closes the listener, which ends `accept`
   boost::asio::io_context signal_context;
   boost::asio::signal_set signals{signal_context, SIGINT, SIGTERM};
   signals.async_wait([&listener](const boost::system::error_code& ec, int signal_number) {
      if(!ec) {
         INFO("caught signal {}, shutting down", signal_number);
         listener->close();
      }
   });
   std::thread signal_thread{[&signal_context]() { signal_context.run(); }};

   cout << format("serving on {}:{}", config.network, listener->local_address()) << endl;
   server.accept(*listener);

   signal_context.stop();
   signal_thread.join();
   server.shutdown();
   return EXIT_SUCCESS;
}

// -------------------------------------------------------------------------------------------- call

int run_call(const Config& config)
{
   std::unique_ptr<rpc::Client> client;
   if(auto ec = rpc::Client::dial(config.network, config.address, client)) {
      cout << format("failed to connect to {}:{}: {}", config.network, config.address, ec.message())
           << endl;
      return EXIT_FAILURE;
   }

   const Args args{config.operands[0], config.operands[1]};
   auto has_error = false;

   // Issue every call before waiting on any of them
   auto done = std::make_shared<rpc::CallQueue>();
   const std::array<std::string_view, 3> methods{"Add", "Multiply", "Divide"};
   std::array<int64_t, 3> replies{};
   std::array<std::shared_ptr<rpc::Call>, 3> calls;
   for(std::size_t i = 0; i < methods.size(); ++i)
      calls[i] = client->go_call(format("Arith.{}", methods[i]), args, replies[i], done);

   for(std::size_t n = 0; n < calls.size(); ++n) {
      auto call    = done->pop();
      const auto i = std::size_t(
          std::distance(cbegin(calls), std::find(cbegin(calls), cend(calls), call)));
      const auto status = call->status();
      if(status.ok()) {
         cout << format("{}({}, {}) = {}", call->procedure_name(), args.num1, args.num2, replies[i])
              << endl;
      } else {
         cout << format("{}({}, {}) failed: {}",
                        call->procedure_name(),
                        args.num1,
                        args.num2,
                        status.error_message())
              << endl;
         has_error = true;
      }
   }

   if(auto ec = client->close()) {
      LOG_ERR("closing client: {}", ec.message());
      has_error = true;
   }
   return has_error ? EXIT_FAILURE : EXIT_SUCCESS;
}

// -------------------------------------------------------------------------------------------- main

int main(int argc, char** argv)
{
   auto has_error = false;
   const auto config = parse_command_line(argc, argv, has_error);

   if(config.show_help) {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(has_error) {
      cout << format("aborting...") << endl;
      return EXIT_FAILURE;
   }

   return (config.command == "serve") ? run_serve(config) : run_call(config);
}

} // namespace tether::demo

// Don't compile in main(...) if we're doing a testcase build
#ifndef CATCH_BUILD

int main(int argc, char** argv) { return tether::demo::main(argc, argv); }

#endif
