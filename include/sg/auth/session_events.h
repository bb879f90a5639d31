#pragma once

#include <atomic>
#include <csignal>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "sg/auth/lock_channel.h"

namespace sg::auth {

// Host capability that reports desktop session changes.
class SessionEventSource {
 public:
  using Sink = std::function<void(SessionEventKind)>;

  virtual ~SessionEventSource() = default;
  virtual void Start(Sink sink) = 0;
  virtual void Stop() = 0;
};

// For hosts that receive session notifications in their own event loop.
// Events delivered before Start() are held and replayed to the sink.
class QueuedSessionEventSource : public SessionEventSource {
 public:
  void Start(Sink sink) override;
  void Stop() override;
  void Deliver(SessionEventKind kind);

 private:
  std::mutex mutex_;
  Sink sink_;
  std::deque<SessionEventKind> pending_;
};

#if !defined(_WIN32)
// SIGUSR1 screen locked, SIGUSR2 sleep, SIGHUP remote session disconnected.
// Only one instance may be started per process.
class PosixSignalSessionEventSource : public SessionEventSource {
 public:
  PosixSignalSessionEventSource() = default;
  ~PosixSignalSessionEventSource() override;

  PosixSignalSessionEventSource(const PosixSignalSessionEventSource&) = delete;
  PosixSignalSessionEventSource& operator=(const PosixSignalSessionEventSource&) = delete;

  void Start(Sink sink) override;
  void Stop() override;

 private:
  void ReadLoop(Sink sink);

  std::thread reader_;
  int read_fd_{-1};
  int write_fd_{-1};
  struct sigaction old_usr1_ {};
  struct sigaction old_usr2_ {};
  struct sigaction old_hup_ {};
  bool started_{false};
};
#endif

// Null where the host has no notification mechanism.
std::unique_ptr<SessionEventSource> CreatePlatformSessionEventSource();

// Translates session events into lock requests. Never evaluates credentials.
class SessionBridge {
 public:
  explicit SessionBridge(LockRequestChannel& channel) : channel_(channel) {}
  ~SessionBridge();

  SessionBridge(const SessionBridge&) = delete;
  SessionBridge& operator=(const SessionBridge&) = delete;

  void SetEnabled(bool enabled) noexcept { enabled_.store(enabled, std::memory_order_release); }
  [[nodiscard]] bool enabled() const noexcept { return enabled_.load(std::memory_order_acquire); }

  // Starts |source| with this bridge as its sink. The source must outlive
  // the attachment.
  void Attach(SessionEventSource& source);
  void Detach();
  void OnEvent(SessionEventKind kind);

 private:
  LockRequestChannel& channel_;
  std::atomic<bool> enabled_{true};
  std::mutex mutex_;
  SessionEventSource* source_{nullptr};
};

}  // namespace sg::auth
