
#pragma once

#include <cassert>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace tether::async
{

/**
 * @ingroup async
 * @brief Waits for a collection of tasks to finish.
 *
 * The owner calls `add` before handing work to another thread, each task calls
 * `done` exactly once when it is finished, and `wait` blocks until the count
 * returns to zero.
 */
class WaitGroup
{
 private:
   int64_t count_{0};
   mutable std::mutex padlock_;
   std::condition_variable cv_;

 public:
   WaitGroup()                            = default;
   WaitGroup(const WaitGroup&)            = delete;
   WaitGroup& operator=(const WaitGroup&) = delete;

   /**
    * @brief Adds `n` outstanding tasks.
    */
   void add(int64_t n = 1)
   {
      std::lock_guard lock{padlock_};
      count_ += n;
      assert(count_ >= 0);
   }

   /**
    * @brief Marks one task as finished, waking waiters when none remain.
    */
   void done()
   {
      bool is_zero = false;
      {
         std::lock_guard lock{padlock_};
         assert(count_ > 0);
         is_zero = (--count_ == 0);
      }
      if(is_zero) cv_.notify_all();
   }

   /**
    * @brief Blocks until every added task has called `done`.
    */
   void wait()
   {
      std::unique_lock lock{padlock_};
      cv_.wait(lock, [this]() { return count_ == 0; });
   }

   int64_t count() const
   {
      std::lock_guard lock{padlock_};
      return count_;
   }
};

} // namespace tether::async
