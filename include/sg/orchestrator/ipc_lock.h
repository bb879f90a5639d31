#pragma once

#include <chrono>
#include <filesystem>

namespace sg::orchestrator {

// Cross-process gate around the settings file: an exclusive flock(2) on a
// sibling "<file>.lock". The kernel drops it when the holder exits, so a
// crashed writer never wedges later runs. An unlocked instance means the
// gate could not be acquired.
class ScopedIpcLock {
public:
  static constexpr std::chrono::seconds kDefaultTimeout{5};

  ScopedIpcLock() = default;
  ScopedIpcLock(const ScopedIpcLock&) = delete;
  ScopedIpcLock& operator=(const ScopedIpcLock&) = delete;
  ScopedIpcLock(ScopedIpcLock&& other) noexcept;
  ScopedIpcLock& operator=(ScopedIpcLock&& other) noexcept;
  ~ScopedIpcLock();

  // Locks `lock_path` itself, creating it with mode 0600 if needed.
  [[nodiscard]] static ScopedIpcLock Acquire(const std::filesystem::path& lock_path,
                                             std::chrono::milliseconds timeout = kDefaultTimeout);
  // Locks the sibling lock file that guards `path`.
  [[nodiscard]] static ScopedIpcLock ForPath(const std::filesystem::path& path,
                                             std::chrono::milliseconds timeout = kDefaultTimeout);

  [[nodiscard]] static std::filesystem::path LockPathFor(const std::filesystem::path& path);

  [[nodiscard]] bool locked() const noexcept { return fd_ >= 0; }
  explicit operator bool() const noexcept { return fd_ >= 0; }

private:
  explicit ScopedIpcLock(int fd) noexcept;

  void Release() noexcept;

  int fd_{-1};
};

}  // namespace sg::orchestrator
