#include "sg/auth/lock_channel.h"

namespace sg::auth {

std::string_view ToString(SessionEventKind kind) noexcept {
  switch (kind) {
  case SessionEventKind::kScreenLocked:
    return "screen_locked";
  case SessionEventKind::kSleepOrHibernate:
    return "sleep_or_hibernate";
  case SessionEventKind::kUserSwitched:
    return "user_switched";
  case SessionEventKind::kRemoteSessionDisconnected:
    return "remote_session_disconnected";
  case SessionEventKind::kLoggedOff:
    return "logged_off";
  }
  return "unknown";
}

std::string_view ToString(LockSource source) noexcept {
  switch (source) {
  case LockSource::kIdleTimeout:
    return "idle_timeout";
  case LockSource::kOsEvent:
    return "os_event";
  case LockSource::kManual:
    return "manual";
  }
  return "unknown";
}

uint64_t LockRequestChannel::Post(LockSource source, std::optional<SessionEventKind> os_event) {
  const TimePoint received_at = clock_ ? clock_() : std::chrono::system_clock::now();
  uint64_t sequence = 0;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (closed_) {
      return 0;
    }
    sequence = next_sequence_++;
    queue_.push_back(LockRequest{sequence, source, os_event, received_at});
  }
  cv_.notify_one();
  return sequence;
}

std::optional<LockRequest> LockRequestChannel::TryPop() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  LockRequest request = queue_.front();
  queue_.pop_front();
  return request;
}

bool LockRequestChannel::WaitForPending(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
  return !queue_.empty();
}

void LockRequestChannel::Close() {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool LockRequestChannel::closed() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return closed_;
}

uint64_t LockRequestChannel::LastIssuedSequence() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return next_sequence_ - 1;
}

}  // namespace sg::auth
