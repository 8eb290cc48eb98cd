#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "nl/error.h"
#include "nl/errors.h"

namespace nl::storage {

// Worker threads owned by one session. The urgent lane serves loads a caller
// is blocked on; the background lane serves speculative work and can be
// dropped wholesale. Shutdown discards queued tasks and joins every worker.
class TaskPool {
 public:
  TaskPool(size_t urgent_workers, size_t background_workers);
  ~TaskPool();

  TaskPool(const TaskPool&) = delete;
  TaskPool& operator=(const TaskPool&) = delete;

  // Queues |fn| on the urgent lane. The future carries its result or
  // exception; if the pool shuts down first the promise is broken.
  // Throws Error{State, kReaderClosed} after Shutdown.
  template <typename Fn>
  auto SubmitUrgent(Fn&& fn) -> std::future<std::invoke_result_t<Fn&>> {
    using Result = std::invoke_result_t<Fn&>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    auto future = task->get_future();
    Enqueue(urgent_, [task]() { (*task)(); });
    return future;
  }

  // Returns false when the pool is shut down.
  bool SubmitBackground(std::function<void()> fn);

  // Removes queued background work; running tasks are not interrupted.
  size_t DropBackground();

  // Idempotent.
  void Shutdown();

  bool stopped() const noexcept { return stopped_.load(std::memory_order_acquire); }

 private:
  struct Lane {
    std::deque<std::function<void()>> queue;
    std::condition_variable cv;
    std::vector<std::thread> workers;
  };

  void Enqueue(Lane& lane, std::function<void()> fn);
  void WorkerLoop(Lane& lane);

  std::mutex mutex_;
  Lane urgent_;
  Lane background_;
  std::atomic<bool> stopped_{false};
};

}  // namespace nl::storage
