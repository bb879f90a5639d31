#include "sg/auth/session_events.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <string>
#include <utility>

#if !defined(_WIN32)
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#endif

#include "sg/error.h"
#include "sg/orchestrator/event_bus.h"

namespace sg::auth {

void QueuedSessionEventSource::Start(Sink sink) {
  std::deque<SessionEventKind> pending;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    sink_ = sink;
    pending.swap(pending_);
  }
  for (auto kind : pending) {
    sink(kind);
  }
}

void QueuedSessionEventSource::Stop() {
  std::lock_guard<std::mutex> guard(mutex_);
  sink_ = nullptr;
}

void QueuedSessionEventSource::Deliver(SessionEventKind kind) {
  Sink sink;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!sink_) {
      pending_.push_back(kind);
      return;
    }
    sink = sink_;
  }
  sink(kind);
}

#if !defined(_WIN32)
namespace {

std::atomic<int> g_signal_write_fd{-1};
constexpr unsigned char kStopByte = 0xFF;

void SessionSignalHandler(int sig) {
  const int fd = g_signal_write_fd.load(std::memory_order_acquire);
  if (fd < 0) {
    return;
  }
  const int saved_errno = errno;
  const unsigned char byte = static_cast<unsigned char>(sig);
  [[maybe_unused]] const ssize_t written = ::write(fd, &byte, 1);
  errno = saved_errno;
}

std::optional<SessionEventKind> KindForSignal(int sig) {
  switch (sig) {
  case SIGUSR1:
    return SessionEventKind::kScreenLocked;
  case SIGUSR2:
    return SessionEventKind::kSleepOrHibernate;
  case SIGHUP:
    return SessionEventKind::kRemoteSessionDisconnected;
  default:
    return std::nullopt;
  }
}

}  // namespace

PosixSignalSessionEventSource::~PosixSignalSessionEventSource() {
  Stop();
}

void PosixSignalSessionEventSource::Start(Sink sink) {
  if (started_) {
    return;
  }
  int fds[2];
  if (::pipe(fds) != 0) {
    const int err = errno;
    throw Error(ErrorDomain::IO, errors::io::kSignalPipeFailed,
                "Failed to create session signal pipe: " + std::string(std::strerror(err)), err);
  }
  // A full pipe drops signals instead of blocking the handler.
  const int write_flags = ::fcntl(fds[1], F_GETFL);
  if (::fcntl(fds[0], F_SETFD, FD_CLOEXEC) != 0 || ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) != 0 ||
      write_flags < 0 || ::fcntl(fds[1], F_SETFL, write_flags | O_NONBLOCK) != 0) {
    const int err = errno;
    ::close(fds[0]);
    ::close(fds[1]);
    throw Error(ErrorDomain::IO, errors::io::kSignalPipeFailed,
                "Failed to configure session signal pipe: " + std::string(std::strerror(err)), err);
  }

  int expected = -1;
  if (!g_signal_write_fd.compare_exchange_strong(expected, fds[1], std::memory_order_acq_rel)) {
    ::close(fds[0]);
    ::close(fds[1]);
    throw Error(ErrorDomain::State, 0, "A signal session event source is already running");
  }
  read_fd_ = fds[0];
  write_fd_ = fds[1];

  struct sigaction sa {};
  sa.sa_handler = SessionSignalHandler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;
  const std::array<std::pair<int, struct sigaction*>, 3> handlers{{
      {SIGUSR1, &old_usr1_}, {SIGUSR2, &old_usr2_}, {SIGHUP, &old_hup_}}};
  for (size_t idx = 0; idx < handlers.size(); ++idx) {
    if (::sigaction(handlers[idx].first, &sa, handlers[idx].second) == 0) {
      continue;
    }
    const int err = errno;
    // Put back whatever was replaced before the failing signal.
    while (idx-- > 0) {
      ::sigaction(handlers[idx].first, handlers[idx].second, nullptr);
    }
    g_signal_write_fd.store(-1, std::memory_order_release);
    ::close(read_fd_);
    ::close(write_fd_);
    read_fd_ = -1;
    write_fd_ = -1;
    throw Error(ErrorDomain::IO, errors::io::kSignalPipeFailed,
                "Failed to install session signal handlers: " + std::string(std::strerror(err)),
                err);
  }

  started_ = true;
  reader_ = std::thread([this, sink = std::move(sink)]() { ReadLoop(sink); });
}

void PosixSignalSessionEventSource::ReadLoop(Sink sink) {
  for (;;) {
    unsigned char byte = 0;
    const ssize_t got = ::read(read_fd_, &byte, 1);
    if (got < 0 && errno == EINTR) {
      continue;
    }
    if (got <= 0 || byte == kStopByte) {
      return;
    }
    if (auto kind = KindForSignal(byte)) {
      try {
        sink(*kind);
      } catch (const std::exception& ex) {
        orchestrator::Event event;
        event.category = orchestrator::EventCategory::kDiagnostics;
        event.severity = orchestrator::EventSeverity::kError;
        event.event_id = "session_event_dispatch_failed";
        event.message = ex.what();
        orchestrator::EventBus::Instance().Publish(event);
      }
    }
  }
}

void PosixSignalSessionEventSource::Stop() {
  if (!started_) {
    return;
  }
  sigaction(SIGUSR1, &old_usr1_, nullptr);
  sigaction(SIGUSR2, &old_usr2_, nullptr);
  sigaction(SIGHUP, &old_hup_, nullptr);
  g_signal_write_fd.store(-1, std::memory_order_release);

  const unsigned char stop = kStopByte;
  while (::write(write_fd_, &stop, 1) < 0 && errno == EINTR) {
  }
  if (reader_.joinable()) {
    reader_.join();
  }
  ::close(read_fd_);
  ::close(write_fd_);
  read_fd_ = -1;
  write_fd_ = -1;
  started_ = false;
}
#endif

std::unique_ptr<SessionEventSource> CreatePlatformSessionEventSource() {
#if !defined(_WIN32)
  return std::make_unique<PosixSignalSessionEventSource>();
#else
  return nullptr;
#endif
}

SessionBridge::~SessionBridge() {
  Detach();
}

void SessionBridge::Attach(SessionEventSource& source) {
  Detach();
  {
    std::lock_guard<std::mutex> guard(mutex_);
    source_ = &source;
  }
  source.Start([this](SessionEventKind kind) { OnEvent(kind); });
}

void SessionBridge::Detach() {
  SessionEventSource* source = nullptr;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    source = source_;
    source_ = nullptr;
  }
  if (source) {
    source->Stop();
  }
}

void SessionBridge::OnEvent(SessionEventKind kind) {
  if (!enabled()) {
    return;
  }
  channel_.Post(LockSource::kOsEvent, kind);
}

}  // namespace sg::auth
