
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace tether::async
{

/**
 * @ingroup async
 * @brief Multi-producer queue of completed items.
 *
 * `push` never blocks, so a producer (for example, the thread that reads responses
 * off a connection) is never held up by a consumer that is slow, or that never reads
 * at all. Consumers block in `pop`, or poll with `try_pop` and `pop_for`.
 */
template<typename T> class CompletionQueue
{
 private:
   std::deque<T> items_;
   mutable std::mutex padlock_;
   std::condition_variable cv_;

 public:
   CompletionQueue()                                  = default;
   CompletionQueue(const CompletionQueue&)            = delete;
   CompletionQueue& operator=(const CompletionQueue&) = delete;

   void push(T item)
   {
      {
         std::lock_guard lock{padlock_};
         items_.push_back(std::move(item));
      }
      cv_.notify_one();
   }

   /**
    * @brief Blocks until an item is available, and returns it.
    */
   T pop()
   {
      std::unique_lock lock{padlock_};
      cv_.wait(lock, [this]() { return !items_.empty(); });
      return pop_locked_();
   }

   /**
    * @return true iff an item was available; it is moved into `out`.
    */
   bool try_pop(T& out)
   {
      std::lock_guard lock{padlock_};
      if(items_.empty()) return false;
      out = pop_locked_();
      return true;
   }

   /**
    * @brief Waits at most `timeout` for an item.
    * @return true iff an item was moved into `out`.
    */
   template<typename Rep, typename Period>
   bool pop_for(const std::chrono::duration<Rep, Period>& timeout, T& out)
   {
      std::unique_lock lock{padlock_};
      if(!cv_.wait_for(lock, timeout, [this]() { return !items_.empty(); })) return false;
      out = pop_locked_();
      return true;
   }

   std::size_t size() const
   {
      std::lock_guard lock{padlock_};
      return items_.size();
   }

 private:
   T pop_locked_()
   {
      T item = std::move(items_.front());
      items_.pop_front();
      return item;
   }
};

} // namespace tether::async
