#pragma once
#include <vector>
#include <thread>
#include <functional>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <deque>

namespace iim {

class ThreadPool {
public:
  explicit ThreadPool(int threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  int size() const;

  // Splits [begin, end) into one chunk per worker and blocks until all are
  // done. The first exception thrown by fn is rethrown here.
  void parallel_for(int begin, int end, const std::function<void(int,int,int)>& fn);

private:
  // One parallel_for call; lives on the caller's stack until pending hits 0.
  struct Batch {
    int pending = 0;
    std::exception_ptr error;
    std::condition_variable done;
  };

  struct Task {
    Batch* batch;
    std::function<void()> body;
  };

  void worker_loop();
  void finish(Batch& batch, std::exception_ptr err);

  int nthreads;
  std::vector<std::thread> workers;

  std::mutex mtx;
  std::condition_variable has_work;
  std::deque<Task> tasks;
  bool stopping = false;
};

}
