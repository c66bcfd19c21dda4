#include "tempo_cache/periodic_task.hpp"

#include "tempo_cache/log.hpp"

#include <exception>

namespace tempo_cache {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true))
    return;
  th_ = std::thread([this] { loop(); });
}

void PeriodicTask::stop() {
  if (!running_.exchange(false))
    return;
  {
    // Taking the lock orders the flag change before the worker's predicate
    // check.
    std::lock_guard<std::mutex> lk(mu_);
  }
  cv_.notify_all();
  if (th_.joinable())
    th_.join();
}

void PeriodicTask::loop() {
  while (running_.load()) {
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait_for(lk, interval_, [&] { return !running_.load(); });
    }
    if (!running_.load())
      break;
    run_guarded();
  }
}

void PeriodicTask::run_guarded() {
  try {
    fn_();
    ++runs_;
  } catch (const std::exception &e) {
    ++failures_;
    log::error("task ", name_, " failed: ", e.what());
  }
}

} // namespace tempo_cache
