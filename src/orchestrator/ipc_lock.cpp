#include "sg/orchestrator/ipc_lock.h"

#include <cerrno>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sg::orchestrator {
namespace {

constexpr std::chrono::milliseconds kPollInterval{10};

int OpenLockFile(const std::filesystem::path& lock_path) {
  for (;;) {
    const int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd >= 0 || errno != EINTR) {
      return fd;
    }
  }
}

}  // namespace

ScopedIpcLock::ScopedIpcLock(int fd) noexcept : fd_(fd) {}

ScopedIpcLock::ScopedIpcLock(ScopedIpcLock&& other) noexcept { *this = std::move(other); }

ScopedIpcLock& ScopedIpcLock::operator=(ScopedIpcLock&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  Release();
  fd_ = std::exchange(other.fd_, -1);
  return *this;
}

ScopedIpcLock::~ScopedIpcLock() { Release(); }

ScopedIpcLock ScopedIpcLock::Acquire(const std::filesystem::path& lock_path,
                                     std::chrono::milliseconds timeout) {
  const int fd = OpenLockFile(lock_path);
  if (fd < 0) {
    return {};
  }
  // flock has no timed wait; poll the non-blocking form until the deadline.
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
      return ScopedIpcLock(fd);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EWOULDBLOCK || std::chrono::steady_clock::now() >= deadline) {
      ::close(fd);
      return {};
    }
    std::this_thread::sleep_for(kPollInterval);
  }
}

ScopedIpcLock ScopedIpcLock::ForPath(const std::filesystem::path& path,
                                     std::chrono::milliseconds timeout) {
  return Acquire(LockPathFor(path), timeout);
}

std::filesystem::path ScopedIpcLock::LockPathFor(const std::filesystem::path& path) {
  std::filesystem::path lock_path = path;
  lock_path += ".lock";
  return lock_path;
}

void ScopedIpcLock::Release() noexcept {
  if (fd_ < 0) {
    return;
  }
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
}

}  // namespace sg::orchestrator
