#pragma once

/**
 * @file sweeper.hpp
 * @brief Recurring background task with an explicit stop handle.
 *
 * Runs `task` every `interval` on a dedicated thread until stop() is called
 * or the Sweeper is destroyed. stop() wakes the thread immediately instead
 * of waiting out the current interval, then joins it.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace causeway {

class Sweeper {
public:
  Sweeper(std::chrono::milliseconds interval, std::function<void()> task);
  ~Sweeper();

  // Non-copyable, non-movable (owns a thread that captures `this`)
  Sweeper(const Sweeper &) = delete;
  Sweeper &operator=(const Sweeper &) = delete;

  /// Stop and join the worker. Idempotent; safe from any thread but the
  /// worker itself.
  void stop();

  bool running() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  /// Number of completed task runs.
  uint64_t ticks() const noexcept {
    return ticks_.load(std::memory_order_relaxed);
  }

private:
  void run();

  std::chrono::milliseconds interval_;
  std::function<void()> task_;

  std::mutex mtx_;
  std::condition_variable cv_;
  std::atomic<bool> running_{true};
  std::atomic<uint64_t> ticks_{0};

  std::thread worker_;
};

} // namespace causeway
