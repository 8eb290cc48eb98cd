#include "nl/storage/task_pool.h"

#include <algorithm>
#include <exception>
#include <string>

#include "nl/orchestrator/event_bus.h"

namespace nl::storage {

TaskPool::TaskPool(size_t urgent_workers, size_t background_workers) {
  try {
    for (size_t i = 0; i < std::max<size_t>(1, urgent_workers); ++i) {
      urgent_.workers.emplace_back([this]() { WorkerLoop(urgent_); });
    }
    for (size_t i = 0; i < background_workers; ++i) {
      background_.workers.emplace_back([this]() { WorkerLoop(background_); });
    }
  } catch (...) {
    Shutdown();
    throw;
  }
}

TaskPool::~TaskPool() {
  Shutdown();
}

void TaskPool::Enqueue(Lane& lane, std::function<void()> fn) {
  {
    std::lock_guard lock(mutex_);
    if (stopped_.load(std::memory_order_acquire)) {
      throw Error{ErrorDomain::State, errors::state::kReaderClosed,
                  std::string(errors::msg::kReaderClosed)};
    }
    lane.queue.push_back(std::move(fn));
  }
  lane.cv.notify_one();
}

bool TaskPool::SubmitBackground(std::function<void()> fn) {
  if (background_.workers.empty()) {
    return false;
  }
  try {
    Enqueue(background_, std::move(fn));
  } catch (const Error&) {
    return false;
  }
  return true;
}

size_t TaskPool::DropBackground() {
  std::deque<std::function<void()>> dropped;
  {
    std::lock_guard lock(mutex_);
    dropped.swap(background_.queue);
  }
  return dropped.size();
}

void TaskPool::Shutdown() {
  std::deque<std::function<void()>> dropped_urgent;
  std::deque<std::function<void()>> dropped_background;
  {
    std::lock_guard lock(mutex_);
    stopped_.store(true, std::memory_order_release);
    dropped_urgent.swap(urgent_.queue);
    dropped_background.swap(background_.queue);
  }
  urgent_.cv.notify_all();
  background_.cv.notify_all();
  for (auto* lane : {&urgent_, &background_}) {
    for (auto& worker : lane->workers) {
      if (!worker.joinable()) {
        continue;
      }
      if (worker.get_id() == std::this_thread::get_id()) {
        worker.detach();  // shut down from one of our own tasks
      } else {
        worker.join();
      }
    }
  }
  // Dropped packaged tasks are destroyed here, breaking their promises.
}

void TaskPool::WorkerLoop(Lane& lane) {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock lock(mutex_);
      lane.cv.wait(lock, [this, &lane]() {
        return !lane.queue.empty() || stopped_.load(std::memory_order_acquire);
      });
      if (stopped_.load(std::memory_order_acquire)) {
        return;
      }
      task = std::move(lane.queue.front());
      lane.queue.pop_front();
    }
    try {
      task();
    } catch (const std::exception& ex) {
      nl::orchestrator::Event event;
      event.category = nl::orchestrator::EventCategory::kDiagnostics;
      event.severity = nl::orchestrator::EventSeverity::kError;
      event.event_id = "task_failed";
      event.message = ex.what();
      nl::orchestrator::EventBus::Instance().Publish(event);
    }
  }
}

}  // namespace nl::storage
