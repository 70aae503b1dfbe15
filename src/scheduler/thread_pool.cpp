#include "scheduler/thread_pool.hpp"
#include "common/logger.hpp"
#include <stdexcept>

ThreadPool::ThreadPool(size_t threads) {
  if (threads == 0) throw std::invalid_argument("ThreadPool needs at least one worker");
  for (size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this]{
      for (;;) {
        std::function<void()> task;
        {
          std::unique_lock<std::mutex> lock(mutex_);
          cv_.wait(lock, [this]{ return stopping_ || !tasks_.empty(); });
          if (stopping_ && tasks_.empty()) return;
          task = std::move(tasks_.front());
          tasks_.pop();
        }
        try {
          task();
        } catch (const std::exception& e) {
          METAROUTE_LOG_ERROR(std::string("Worker task threw: ") + e.what());
        }
      }
    });
  }
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& w : workers_) if (w.joinable()) w.join();
}

void ThreadPool::Enqueue(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) throw std::runtime_error("ThreadPool is shutting down");
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
}
