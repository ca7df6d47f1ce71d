#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace fieldgate::runtime {

/*
  Runs a callback on its own thread at a fixed interval until stopped.

  Stop() wakes the thread, waits for an in-flight run to finish and joins,
  so once it returns the callback will not run again. An exception thrown
  by the callback is logged and the next tick still happens.
*/
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn, bool fire_immediately = false);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();

  bool Running() const {
    return running_;
  }

  uint64_t Runs() const {
    return runs_;
  }

  const std::string& Name() const {
    return name_;
  }

 private:
  void Loop();
  void RunOnce();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     fn_;
  bool                      fire_immediately_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_requested_ = false;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> runs_{0};
};

} // namespace fieldgate::runtime
