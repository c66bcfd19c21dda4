#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace tempo_cache {

// Runs fn on its own thread every `interval`, measured from the end of the
// previous run, so a slow run never overlaps the next one. Exceptions thrown
// by fn are logged and the schedule continues.
class PeriodicTask {
public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval,
               std::function<void()> fn);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask &) = delete;
  PeriodicTask &operator=(const PeriodicTask &) = delete;

  void start();  // spawn the worker thread
  void stop();   // signal & join

  bool running() const { return running_.load(); }
  std::uint64_t runs() const { return runs_.load(); }
  std::uint64_t failures() const { return failures_.load(); }

private:
  void loop();
  void run_guarded();

  std::string name_;
  std::chrono::milliseconds interval_;
  std::function<void()> fn_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> runs_{0};
  std::atomic<std::uint64_t> failures_{0};
  std::mutex mu_;
  std::condition_variable cv_;
  std::thread th_;
};

} // namespace tempo_cache
