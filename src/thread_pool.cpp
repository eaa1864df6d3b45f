#include "iim/thread_pool.hpp"
#include <algorithm>

namespace iim {

ThreadPool::ThreadPool(int threads) : nthreads(std::max(threads, 1)) {
  workers.reserve((std::size_t)nthreads);
  for (int t = 0; t < nthreads; ++t) workers.emplace_back([this] { worker_loop(); });
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lk(mtx);
    stopping = true;
  }
  has_work.notify_all();
  for (auto& w : workers) w.join();
}

int ThreadPool::size() const {
  return nthreads;
}

void ThreadPool::finish(Batch& batch, std::exception_ptr err) {
  std::lock_guard<std::mutex> lk(mtx);
  if (err && !batch.error) batch.error = err;
  if (--batch.pending == 0) batch.done.notify_all();
}

void ThreadPool::worker_loop() {
  std::unique_lock<std::mutex> lk(mtx);
  for (;;) {
    has_work.wait(lk, [this] { return stopping || !tasks.empty(); });
    if (tasks.empty()) return;

    Task task = std::move(tasks.front());
    tasks.pop_front();
    lk.unlock();

    std::exception_ptr err;
    try {
      task.body();
    } catch (...) {
      err = std::current_exception();
    }
    finish(*task.batch, err);

    lk.lock();
  }
}

void ThreadPool::parallel_for(int begin, int end, const std::function<void(int,int,int)>& fn) {
  if (end <= begin) return;

  const int chunk = (end - begin + nthreads - 1) / nthreads;
  Batch batch;

  {
    std::lock_guard<std::mutex> lk(mtx);
    int tid = 0;
    for (int b = begin; b < end; b += chunk, ++tid) {
      const int e = std::min(end, b + chunk);
      tasks.push_back(Task{&batch, [&fn, b, e, tid] { fn(b, e, tid); }});
      ++batch.pending;
    }
  }
  has_work.notify_all();

  std::unique_lock<std::mutex> lk(mtx);
  batch.done.wait(lk, [&batch] { return batch.pending == 0; });
  if (batch.error) std::rethrow_exception(batch.error);
}

}
