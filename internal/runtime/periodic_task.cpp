#include "periodic_task.hpp"

#include "internal/observability/logging.hpp"

namespace fieldgate::runtime {

using observability::StringField;

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn, bool fire_immediately)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)), fire_immediately_(fire_immediately) {
  if (interval_.count() <= 0) interval_ = std::chrono::milliseconds(1);
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  if (running_.exchange(true)) return;

  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&PeriodicTask::Loop, this);
}

void PeriodicTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void PeriodicTask::RunOnce() {
  try {
    fn_();
  } catch (const std::exception& e) {
    FIELDGATE_LOG_ERROR("periodic task failed", {StringField("task", name_), StringField("error", e.what())});
  }
  ++runs_;
}

void PeriodicTask::Loop() {
  if (fire_immediately_) RunOnce();

  for (;;) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) return;
    }
    RunOnce();
  }
}

} // namespace fieldgate::runtime
