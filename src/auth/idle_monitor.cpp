#include "sg/auth/idle_monitor.h"

#include <iostream>

#include "sg/error.h"

namespace sg::auth {

IdleMonitor::IdleMonitor(TimeSource now) : now_(std::move(now)) {
  if (!now_) {
    now_ = [] { return Clock::now(); };
  }
  last_activity_ = now_();
}

void IdleMonitor::Configure(bool enabled, Duration timeout) {
  if (timeout <= Duration::zero()) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                "Auto-lock timeout must be positive");
  }
  std::lock_guard<std::mutex> guard(mutex_);
  enabled_ = enabled;
  timeout_ = timeout;
}

void IdleMonitor::Arm() {
  std::lock_guard<std::mutex> guard(mutex_);
  last_activity_ = now_();
  armed_ = true;
}

void IdleMonitor::Disarm() noexcept {
  std::lock_guard<std::mutex> guard(mutex_);
  armed_ = false;
}

void IdleMonitor::NotifyActivity() noexcept {
  std::lock_guard<std::mutex> guard(mutex_);
  last_activity_ = now_();
}

bool IdleMonitor::Check() {
  std::function<void()> expire;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!armed_ || !enabled_) {
      return false;
    }
    if (now_() - last_activity_ < timeout_) {
      return false;
    }
    armed_ = false;
    expire = on_expire;
  }
  if (expire) {
    expire();
  }
  return true;
}

IdleMonitor::Clock::time_point IdleMonitor::last_activity() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return last_activity_;
}

bool IdleMonitor::armed() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return armed_;
}

bool IdleMonitor::enabled() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return enabled_;
}

IdleMonitor::Duration IdleMonitor::timeout() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return timeout_;
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start(std::chrono::milliseconds interval, std::function<void()> fn) {
  if (interval <= std::chrono::milliseconds::zero()) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                "Periodic task interval must be positive");
  }
  Stop();
  std::lock_guard<std::mutex> guard(mutex_);
  stop_requested_ = false;
  running_ = true;
  worker_ = std::thread([this, interval, fn = std::move(fn)]() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
      if (cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
        break;
      }
      lock.unlock();
      try {
        fn();
      } catch (const std::exception& ex) {
        std::clog << "{\"event\":\"periodic_task_error\",\"message\":\"" << ex.what() << "\"}\n";
      }
      lock.lock();
    }
  });
}

void PeriodicTask::Stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!running_) {
      return;
    }
    stop_requested_ = true;
    running_ = false;
    worker = std::move(worker_);
  }
  cv_.notify_all();
  if (worker.joinable()) {
    worker.join();
  }
}

bool PeriodicTask::running() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return running_;
}

}  // namespace sg::auth
