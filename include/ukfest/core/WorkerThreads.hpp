#pragma once

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace ukfest {

// Owns a set of worker threads and joins every started one on destruction, including
// while unwinding after a failed spawn.
class WorkerThreads {
public:
  WorkerThreads() = default;
  ~WorkerThreads() { joinAll(); }
  WorkerThreads(const WorkerThreads&) = delete;
  WorkerThreads& operator=(const WorkerThreads&) = delete;

  void reserve(std::size_t count) { threads.reserve(count); }

  template <typename Fn, typename... Args>
  void spawn(Fn&& fn, Args&&... args) {
    threads.emplace_back(std::forward<Fn>(fn), std::forward<Args>(args)...);
  }

  void joinAll() {
    for (auto& thread : threads) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }

  std::size_t size() const { return threads.size(); }

private:
  std::vector<std::thread> threads;
};

} // namespace ukfest
