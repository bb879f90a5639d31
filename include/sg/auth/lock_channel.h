#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string_view>

#include "sg/auth/auth_settings.h"

namespace sg::auth {

enum class SessionEventKind {
  kScreenLocked,
  kSleepOrHibernate,
  kUserSwitched,
  kRemoteSessionDisconnected,
  kLoggedOff
};

std::string_view ToString(SessionEventKind kind) noexcept;

enum class LockSource { kIdleTimeout, kOsEvent, kManual };

std::string_view ToString(LockSource source) noexcept;

struct LockRequest {
  uint64_t sequence{0};
  LockSource source{LockSource::kManual};
  std::optional<SessionEventKind> os_event;
  TimePoint received_at{};
};

// Multi-producer queue of lock requests consumed by the state machine.
class LockRequestChannel {
 public:
  explicit LockRequestChannel(WallClock clock = SystemWallClock()) : clock_(std::move(clock)) {}

  // Returns the sequence number stamped on the request. Requests posted
  // after Close() are dropped and report sequence 0.
  uint64_t Post(LockSource source, std::optional<SessionEventKind> os_event = std::nullopt);

  std::optional<LockRequest> TryPop();
  // Blocks until a request is queued, the timeout elapses or the channel
  // closes. Returns whether a request is queued; nothing is removed.
  bool WaitForPending(std::chrono::milliseconds timeout);

  void Close();
  [[nodiscard]] bool closed() const;
  [[nodiscard]] uint64_t LastIssuedSequence() const;

 private:
  WallClock clock_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<LockRequest> queue_;
  uint64_t next_sequence_{1};
  bool closed_{false};
};

}  // namespace sg::auth
