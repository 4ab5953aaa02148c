#pragma once
#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <vector>
#include <functional>
#include <exception>

namespace mahito {

// Fixed set of worker threads fed from a bounded in-memory queue.
// enqueue() blocks while the queue is full so a lazy producer is never drained ahead.
class WorkerPool {
public:
  using Task = std::function<void(unsigned workerId)>;

  inline WorkerPool(unsigned workers, size_t maxInMem)
    : workers_(workers ? workers : 1), maxInMem_(maxInMem ? maxInMem : 1) {}
  inline ~WorkerPool(){ finish(); }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  inline void start(){
    if (!th_.empty()) return;
    stop_ = false;
    for (unsigned i = 0; i < workers_; ++i) th_.emplace_back(&WorkerPool::loop_, this, i);
  }

  inline void enqueue(Task t){
    std::unique_lock<std::mutex> lk(mu_);
    space_.wait(lk, [&]{ return q_.size() < maxInMem_; });
    q_.push_back(std::move(t));
    lk.unlock(); cv_.notify_one();
  }

  // No more tasks; drain the queue and join.
  inline void finish(){
    {
      std::lock_guard<std::mutex> lk(mu_);
      stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : th_) if (t.joinable()) t.join();
    th_.clear();
  }

  unsigned size() const { return workers_; }

  // First exception thrown by a task, if any (rethrown by the caller after finish()).
  inline std::exception_ptr firstError() const {
    std::lock_guard<std::mutex> lk(mu_);
    return error_;
  }

private:
  unsigned workers_;
  size_t maxInMem_;
  std::deque<Task> q_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable space_;
  std::vector<std::thread> th_;
  bool stop_ = false;
  std::exception_ptr error_;

  inline void loop_(unsigned id){
    while (true){
      Task cur;
      {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&]{ return stop_ || !q_.empty(); });
        if (q_.empty()) break;          // stop_ and drained
        cur = std::move(q_.front()); q_.pop_front();
      }
      space_.notify_one();

      try {
        cur(id);
      } catch (...) {
        std::lock_guard<std::mutex> lk(mu_);
        if (!error_) error_ = std::current_exception();
      }
    }
  }
};

} // namespace mahito
