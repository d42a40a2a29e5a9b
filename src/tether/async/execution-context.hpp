
#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <cstddef>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace tether::async {

/**
 * @ingroup async
 * @brief A fixed pool of threads running a `boost::asio::io_context`.
 *
 * Work posted to the context runs on one of the pool threads. The pool keeps
 * running (even when idle) until `stop_and_join` is called, or the context is
 * destroyed. Queued work is finished before the threads exit.
 */
class ExecutionContext {
private:
  using WorkGuardType = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  boost::asio::io_context io_context_;
  std::optional<WorkGuardType> work_guard_;
  std::vector<std::thread> pool_;

public:
  using ExecutorType = boost::asio::io_context::executor_type;

  /**
   * @param thread_pool_size Number of threads; `0` means `std::thread::hardware_concurrency()`.
   */
  explicit ExecutionContext(std::size_t thread_pool_size = 0)
      : work_guard_{boost::asio::make_work_guard(io_context_)} {
    auto size = (thread_pool_size == 0) ? std::size_t(std::thread::hardware_concurrency())
                                        : thread_pool_size;
    if (size == 0)
      size = 1;
    pool_.reserve(size);
    for (std::size_t i = 0; i < size; ++i)
      pool_.emplace_back([this]() { io_context_.run(); });
  }

  ExecutionContext(const ExecutionContext&) = delete;
  ExecutionContext& operator=(const ExecutionContext&) = delete;

  ~ExecutionContext() { stop_and_join(); }

  /** @brief Number of threads executing work in parallel */
  std::size_t size() const noexcept { return pool_.size(); }

  /** @brief Return the executor for running jobs on the pool */
  ExecutorType get_executor() { return io_context_.get_executor(); }

  /** @brief Run `work` on one of the pool threads */
  template <typename F> void post(F&& work) {
    boost::asio::post(io_context_, std::forward<F>(work));
  }

  /**
   * @brief Let the pool run out of work, then join all threads.
   * Must not be called from a pool thread.
   */
  void stop_and_join() {
    work_guard_.reset();
    for (auto& thread : pool_)
      if (thread.joinable())
        thread.join();
  }
};

} // namespace tether::async
