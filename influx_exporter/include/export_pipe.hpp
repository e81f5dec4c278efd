#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <utility>

// Неограниченная FIFO-очередь: много писателей, один читатель.
// close() отбрасывает всё, что осталось в очереди: после него запись
// игнорируется, а read() сразу возвращает false.
template <typename T> class ExportPipe {
public:
  bool write(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return false;
      }
      queue_.push(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  bool read(T &out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (closed_) {
      return false;
    }
    out = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      std::queue<T>().swap(queue_);
    }
    cv_.notify_all();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<T> queue_;
  bool closed_{false};
};
