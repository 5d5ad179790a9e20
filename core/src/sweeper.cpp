#include "causeway/sweeper.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace causeway {

Sweeper::Sweeper(std::chrono::milliseconds interval, std::function<void()> task)
    : interval_(interval), task_(std::move(task)) {
  worker_ = std::thread([this]() { run(); });
}

Sweeper::~Sweeper() { stop(); }

void Sweeper::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    running_.store(false, std::memory_order_release);
  }
  cv_.notify_all();

  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
    worker_.join();
}

void Sweeper::run() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait_for(lock, interval_, [this]() {
        return !running_.load(std::memory_order_acquire);
      });
      if (!running_.load(std::memory_order_acquire))
        break;
    }

    // Logged and retried on the next tick.
    try {
      task_();
    } catch (const std::exception &e) {
      spdlog::error("causeway: cleanup sweep failed: {}", e.what());
    }
    ticks_.fetch_add(1, std::memory_order_relaxed);
  }
}

} // namespace causeway
