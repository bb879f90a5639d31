#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

#include "sg/auth/auth_settings.h"

namespace sg::auth {

// Storage boundary for the single AuthSettings record. Both calls are durable
// before returning and report failures as sg::Error.
class AuthSettingsStore {
 public:
  virtual ~AuthSettingsStore() = default;
  virtual std::optional<AuthSettings> Load() = 0;
  virtual void Save(const AuthSettings& settings) = 0;
};

class MemoryAuthSettingsStore : public AuthSettingsStore {
 public:
  MemoryAuthSettingsStore() = default;
  explicit MemoryAuthSettingsStore(AuthSettings initial) : record_(std::move(initial)) {}

  std::optional<AuthSettings> Load() override;
  void Save(const AuthSettings& settings) override;

  [[nodiscard]] uint64_t save_count() const;
  // Makes the next Load() report a corrupt record.
  void MarkCorrupt();

 private:
  mutable std::mutex mutex_;
  std::optional<AuthSettings> record_;
  uint64_t save_count_{0};
  bool corrupt_{false};
};

// Single-file store: magic, version, TLV body and an integrity tag.
class FileAuthSettingsStore : public AuthSettingsStore {
 public:
  static constexpr uint32_t kFormatVersion = 1;

  explicit FileAuthSettingsStore(std::filesystem::path path);

  std::optional<AuthSettings> Load() override;
  void Save(const AuthSettings& settings) override;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  static std::vector<uint8_t> Encode(const AuthSettings& settings);
  // Throws sg::Error{State, errors::auth::kCorruptStore}.
  static AuthSettings Decode(std::span<const uint8_t> bytes);

 private:
  std::filesystem::path path_;
};

// Owns the in-memory copy of the record and is its only writer.
class CredentialStore {
 public:
  explicit CredentialStore(AuthSettingsStore& backend);

  // Loads the record. A corrupt record is remembered rather than thrown so
  // callers can refuse to unlock; other failures propagate.
  void Open();

  [[nodiscard]] bool corrupt() const;
  [[nodiscard]] AuthSettings Snapshot() const;

  // Validates, saves durably, then replaces the cached copy. Refuses to
  // overwrite a corrupt record.
  void Commit(const AuthSettings& settings);

 private:
  AuthSettingsStore& backend_;
  mutable std::mutex mutex_;
  AuthSettings cached_{};
  bool corrupt_{false};
  bool opened_{false};
};

}  // namespace sg::auth
