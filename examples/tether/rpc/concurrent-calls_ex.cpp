
#include "stdinc.hpp"

#include "tether/async.hpp"
#include "tether/net.hpp"
#include "tether/rpc.hpp"

#include <thread>

namespace tether::example
{

// A service whose replies are collections: a histogram of words, and the words sorted
class Words
{
 public:
   rpc::Status count(const std::vector<string>& words, std::map<string, int64_t>& reply) const
   {
      for(const auto& word : words) ++reply[word];
      return {};
   }

   rpc::Status sort(const std::vector<string>& words, std::vector<string>& reply) const
   {
      reply = words;
      std::sort(begin(reply), end(reply));
      return {};
   }
};

static int concurrent_calls_example()
{
   rpc::Server server{rpc::Server::Config{4}};
   auto builder = rpc::ServiceBuilder{std::make_shared<Words>()};
   builder.method("Count", &Words::count).method("Sort", &Words::sort);
   if(auto ec = server.register_service(builder)) {
      LOG_ERR("register: {}", ec.message());
      return EXIT_FAILURE;
   }

   // An in-process transport: one end for the server, one for the client
   std::unique_ptr<net::Connection> server_end, client_end;
   if(auto ec = net::make_connection_pair(server_end, client_end)) {
      LOG_ERR("socket pair: {}", ec.message());
      return EXIT_FAILURE;
   }
   std::thread serving{[&server, connection = std::move(server_end)]() mutable {
      server.serve_connection(std::move(connection));
   }};

   std::unique_ptr<rpc::Client> client;
   if(auto ec = rpc::Client::make(std::move(client_end), rpc::k_binary_codec, client)) {
      LOG_ERR("handshake: {}", ec.message());
      serving.join();
      return EXIT_FAILURE;
   }

   const std::vector<string> words{"pear", "fig", "apple", "fig", "pear", "fig"};

   // Four threads issue calls; one queue collects every completion
   constexpr std::size_t k_threads          = 4;
   constexpr std::size_t k_calls_per_thread = 25;
   auto done = std::make_shared<rpc::CallQueue>();
   std::vector<std::map<string, int64_t>> counts(k_threads * k_calls_per_thread);
   std::vector<std::vector<string>> sorted(k_threads * k_calls_per_thread);

   std::vector<std::thread> callers;
   for(std::size_t t = 0; t < k_threads; ++t) {
      callers.emplace_back([&, t]() {
         for(std::size_t i = 0; i < k_calls_per_thread; ++i) {
            const auto slot = t * k_calls_per_thread + i;
            if(slot % 2 == 0)
               client->go_call("Words.Count", words, counts[slot], done);
            else
               client->go_call("Words.Sort", words, sorted[slot], done);
         }
      });
   }
   for(auto& thread : callers) thread.join();

   std::size_t failures = 0;
   for(std::size_t n = 0; n < k_threads * k_calls_per_thread; ++n) {
      auto call = done->pop();
      if(!call->status().ok()) {
         ++failures;
         WARN("{} (seq={}) failed: {}",
              call->procedure_name(),
              call->sequence(),
              call->status().error_message());
      }
   }

   cout << format("{} calls, {} failures; fig appears {} times, first word is '{}'",
                  k_threads * k_calls_per_thread,
                  failures,
                  counts[0]["fig"],
                  sorted[1].empty() ? string{} : sorted[1].front())
        << endl;

   if(auto ec = client->close()) LOG_ERR("close: {}", ec.message());
   serving.join();

   return (failures == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace tether::example

int main(int, char**) { return tether::example::concurrent_calls_example(); }
