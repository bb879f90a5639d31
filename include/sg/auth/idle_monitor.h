#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace sg::auth {

// Tracks user activity and fires on_expire once after the configured idle
// period. Firing disarms the monitor until the next Arm().
class IdleMonitor {
 public:
  using Clock = std::chrono::steady_clock;
  using Duration = Clock::duration;
  using TimeSource = std::function<Clock::time_point()>;

  explicit IdleMonitor(TimeSource now = [] { return Clock::now(); });

  void Configure(bool enabled, Duration timeout);
  // Starts an idle period at the current time.
  void Arm();
  void Disarm() noexcept;
  void NotifyActivity() noexcept;
  // Returns true when this call fired on_expire.
  bool Check();

  [[nodiscard]] Clock::time_point last_activity() const;
  [[nodiscard]] bool armed() const;
  [[nodiscard]] bool enabled() const;
  [[nodiscard]] Duration timeout() const;

  std::function<void()> on_expire;

 private:
  TimeSource now_;
  mutable std::mutex mutex_;
  Duration timeout_{std::chrono::seconds(1800)};
  Clock::time_point last_activity_;
  bool enabled_{false};
  bool armed_{false};
};

// Runs a callback on its own thread at a fixed cadence until stopped.
class PeriodicTask {
 public:
  PeriodicTask() = default;
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start(std::chrono::milliseconds interval, std::function<void()> fn);
  void Stop();
  [[nodiscard]] bool running() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::thread worker_;
  bool stop_requested_{false};
  bool running_{false};
};

}  // namespace sg::auth
