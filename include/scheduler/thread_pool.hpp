#pragma once
#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>

class ThreadPool {
public:
  explicit ThreadPool(size_t threads);
  ~ThreadPool();
  void Enqueue(std::function<void()> task);
  // Blocks until the queue is empty and no task is running
  void WaitIdle();
  size_t Size() const { return workers_.size(); }
private:
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  size_t active_ = 0;
  bool stopping_ = false;
};
