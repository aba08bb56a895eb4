#include "scheduler/thread_pool.hpp"
#include "common/logger.hpp"
#include <exception>

ThreadPool::ThreadPool(size_t threads) {
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
          ++active_;
        }
        try {
          task();
        } catch (const std::exception& e) {
          Logger::Error(std::string("Worker task threw: ") + e.what());
        }
        {
          std::lock_guard<std::mutex> lock(mutex_);
          --active_;
          if (active_ == 0 && tasks_.empty()) idle_cv_.notify_all();
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
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
}

void ThreadPool::WaitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this]{ return tasks_.empty() && active_ == 0; });
}

size_t ThreadPool::Pending() {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size() + active_;
}
