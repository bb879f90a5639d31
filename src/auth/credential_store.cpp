#include "sg/auth/credential_store.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <string>
#include <string_view>

#include "sg/common.h"
#include "sg/crypto/ct.h"
#include "sg/crypto/hmac_sha256.h"
#include "sg/error.h"
#include "sg/errors.h"
#include "sg/orchestrator/io_util.h"
#include "sg/orchestrator/ipc_lock.h"
#include "sg/tlv/parser.h"

namespace sg::auth {
namespace {

constexpr std::array<uint8_t, 8> kMagic{'S', 'G', 'A', 'U', 'T', 'H', 0, 0};
constexpr std::string_view kIntegrityLabel = "SessionGate/auth-settings/v1";
constexpr size_t kTagSize = crypto::HMAC_SHA256::TAG_SIZE;
constexpr size_t kHeaderSize = kMagic.size() + sizeof(uint32_t);

enum RecordType : uint16_t {
  kPasswordHash = 1,
  kRecoveryKeyHash = 2,
  kFailedAttempts = 3,
  kLockoutUntil = 4,
  kAutoLockEnabled = 5,
  kAutoLockTimeout = 6,
  kOsLockIntegration = 7,
  kLastSuccessAt = 8,
};

constexpr uint16_t kHighestKnownType = kLastSuccessAt;

[[noreturn]] void ThrowCorrupt(std::string_view detail) {
  throw Error(ErrorDomain::State, errors::auth::kCorruptStore,
              std::string(errors::msg::kCorruptStore) + ": " + std::string(detail));
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

// Rejects values the clock's native duration cannot represent.
bool FromUnixMillis(int64_t ms, TimePoint& out) {
  using Millis = std::chrono::milliseconds;
  constexpr auto kMax = std::chrono::duration_cast<Millis>(TimePoint::duration::max()).count();
  constexpr auto kMin = std::chrono::duration_cast<Millis>(TimePoint::duration::min()).count();
  if (ms > kMax || ms < kMin) {
    return false;
  }
  out = TimePoint(std::chrono::duration_cast<TimePoint::duration>(Millis(ms)));
  return true;
}

bool ReadTimePoint(const tlv::Record& record, std::optional<TimePoint>& out) {
  int64_t ms = 0;
  TimePoint tp{};
  if (!tlv::ReadI64(record, ms) || !FromUnixMillis(ms, tp)) {
    return false;
  }
  out = tp;
  return true;
}

std::array<uint8_t, kTagSize> ComputeTag(std::span<const uint8_t> body) {
  return crypto::HMAC_SHA256::Compute(sg::AsBytes(kIntegrityLabel), body);
}

bool ReadBool(const tlv::Record& record, bool& out) {
  uint8_t raw = 0;
  if (!tlv::ReadU8(record, raw) || raw > 1) {
    return false;
  }
  out = raw == 1;
  return true;
}

}  // namespace

std::optional<AuthSettings> MemoryAuthSettingsStore::Load() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (corrupt_) {
    ThrowCorrupt("in-memory record marked corrupt");
  }
  return record_;
}

void MemoryAuthSettingsStore::Save(const AuthSettings& settings) {
  std::lock_guard<std::mutex> guard(mutex_);
  record_ = settings;
  corrupt_ = false;
  ++save_count_;
}

uint64_t MemoryAuthSettingsStore::save_count() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return save_count_;
}

void MemoryAuthSettingsStore::MarkCorrupt() {
  std::lock_guard<std::mutex> guard(mutex_);
  corrupt_ = true;
}

FileAuthSettingsStore::FileAuthSettingsStore(std::filesystem::path path) : path_(std::move(path)) {}

std::vector<uint8_t> FileAuthSettingsStore::Encode(const AuthSettings& settings) {
  std::vector<uint8_t> out(kMagic.begin(), kMagic.end());
  const uint32_t version_le = sg::ToLittleEndian32(kFormatVersion);
  const auto* version_bytes = reinterpret_cast<const uint8_t*>(&version_le);
  out.insert(out.end(), version_bytes, version_bytes + sizeof(version_le));

  tlv::Writer writer;
  if (settings.password_hash) {
    writer.AppendString(kPasswordHash, *settings.password_hash);
  }
  if (settings.recovery_key_hash) {
    writer.AppendString(kRecoveryKeyHash, *settings.recovery_key_hash);
  }
  writer.AppendU32(kFailedAttempts, settings.failed_attempts);
  if (settings.lockout_until) {
    writer.AppendI64(kLockoutUntil, ToUnixMillis(*settings.lockout_until));
  }
  writer.AppendU8(kAutoLockEnabled, settings.auto_lock_enabled ? 1 : 0);
  writer.AppendU32(kAutoLockTimeout, settings.auto_lock_timeout_seconds);
  writer.AppendU8(kOsLockIntegration, settings.os_lock_integration_enabled ? 1 : 0);
  if (settings.last_success_at) {
    writer.AppendI64(kLastSuccessAt, ToUnixMillis(*settings.last_success_at));
  }
  const auto& body = writer.bytes();
  out.insert(out.end(), body.begin(), body.end());

  const auto tag = ComputeTag(std::span<const uint8_t>(out.data(), out.size()));
  out.insert(out.end(), tag.begin(), tag.end());
  return out;
}

AuthSettings FileAuthSettingsStore::Decode(std::span<const uint8_t> bytes) {
  if (bytes.size() < kHeaderSize + kTagSize) {
    ThrowCorrupt(errors::msg::kSettingsTruncated);
  }
  if (!std::equal(kMagic.begin(), kMagic.end(), bytes.begin())) {
    ThrowCorrupt(errors::msg::kSettingsBadMagic);
  }
  uint32_t version_le = 0;
  std::memcpy(&version_le, bytes.data() + kMagic.size(), sizeof(version_le));
  if (sg::FromLittleEndian32(version_le) != kFormatVersion) {
    ThrowCorrupt(errors::msg::kSettingsVersion);
  }
  const auto covered = bytes.first(bytes.size() - kTagSize);
  const auto stored_tag = bytes.last(kTagSize);
  const auto expected_tag = ComputeTag(covered);
  if (!crypto::ct::CompareEqual(std::span<const uint8_t>(expected_tag.data(), expected_tag.size()),
                                stored_tag)) {
    ThrowCorrupt(errors::msg::kSettingsIntegrity);
  }

  tlv::Parser parser(covered.subspan(kHeaderSize));
  if (!parser.valid()) {
    ThrowCorrupt(errors::msg::kSettingsTlvMalformed);
  }

  AuthSettings settings;
  std::array<bool, kHighestKnownType + 1> seen{};
  for (const auto& record : parser) {
    if (record.type == 0 || record.type > kHighestKnownType) {
      continue;  // written by a newer release
    }
    if (seen[record.type]) {
      ThrowCorrupt(errors::msg::kSettingsTlvMalformed);
    }
    seen[record.type] = true;
    bool ok = true;
    switch (record.type) {
    case kPasswordHash:
      settings.password_hash.emplace(reinterpret_cast<const char*>(record.value.data()),
                                     record.value.size());
      break;
    case kRecoveryKeyHash:
      settings.recovery_key_hash.emplace(reinterpret_cast<const char*>(record.value.data()),
                                         record.value.size());
      break;
    case kFailedAttempts:
      ok = tlv::ReadU32(record, settings.failed_attempts);
      break;
    case kLockoutUntil:
      ok = ReadTimePoint(record, settings.lockout_until);
      break;
    case kAutoLockEnabled:
      ok = ReadBool(record, settings.auto_lock_enabled);
      break;
    case kAutoLockTimeout:
      ok = tlv::ReadU32(record, settings.auto_lock_timeout_seconds);
      break;
    case kOsLockIntegration:
      ok = ReadBool(record, settings.os_lock_integration_enabled);
      break;
    case kLastSuccessAt:
      ok = ReadTimePoint(record, settings.last_success_at);
      break;
    default:
      break;
    }
    if (!ok) {
      ThrowCorrupt(errors::msg::kSettingsTlvMalformed);
    }
  }
  if (!seen[kFailedAttempts] || !seen[kAutoLockEnabled] || !seen[kAutoLockTimeout] ||
      !seen[kOsLockIntegration]) {
    ThrowCorrupt(errors::msg::kSettingsTlvMalformed);
  }
  if (auto violation = FindInvariantViolation(settings)) {
    ThrowCorrupt(*violation);
  }
  return settings;
}

std::optional<AuthSettings> FileAuthSettingsStore::Load() {
  auto gate = orchestrator::ScopedIpcLock::ForPath(path_);
  if (!gate) {
    throw Error(ErrorDomain::IO, errors::io::kSettingsReadFailed,
                "Timed out waiting for the settings lock", std::nullopt, Retryability::kTransient);
  }
  auto bytes = orchestrator::ReadFileIfExists(path_);
  if (!bytes) {
    return std::nullopt;
  }
  return Decode(std::span<const uint8_t>(bytes->data(), bytes->size()));
}

void FileAuthSettingsStore::Save(const AuthSettings& settings) {
  const auto encoded = Encode(settings);
  auto gate = orchestrator::ScopedIpcLock::ForPath(path_);
  if (!gate) {
    throw Error(ErrorDomain::IO, errors::io::kSettingsWriteFailed,
                "Timed out waiting for the settings lock", std::nullopt, Retryability::kTransient);
  }
  try {
    orchestrator::AtomicReplace(path_, std::span<const uint8_t>(encoded.data(), encoded.size()));
  } catch (const Error& err) {
    std::vector<std::string> context = err.context;
    context.emplace_back("persisting authentication settings");
    throw Error(err.domain, err.code,
                std::string(errors::msg::kPersistSettingsFailed) + ": " + err.what(),
                err.native_code, err.retryability, std::move(context));
  }
}

CredentialStore::CredentialStore(AuthSettingsStore& backend) : backend_(backend) {}

void CredentialStore::Open() {
  std::lock_guard<std::mutex> guard(mutex_);
  try {
    auto loaded = backend_.Load();
    cached_ = loaded.value_or(AuthSettings{});
    corrupt_ = false;
  } catch (const Error& err) {
    if (err.domain != ErrorDomain::State || err.code != errors::auth::kCorruptStore) {
      throw;
    }
    cached_ = AuthSettings{};
    corrupt_ = true;
  }
  opened_ = true;
}

bool CredentialStore::corrupt() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return corrupt_;
}

AuthSettings CredentialStore::Snapshot() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return cached_;
}

void CredentialStore::Commit(const AuthSettings& settings) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!opened_) {
    throw Error(ErrorDomain::Internal, 0, "Credential store used before Open()");
  }
  if (corrupt_) {
    throw Error(ErrorDomain::State, errors::auth::kCorruptStore,
                std::string(errors::msg::kCorruptStore));
  }
  if (auto violation = FindInvariantViolation(settings)) {
    throw Error(ErrorDomain::Internal, 0,
                std::string(errors::msg::kSettingsInvariant) + ": " + std::string(*violation));
  }
  backend_.Save(settings);
  cached_ = settings;
}

}  // namespace sg::auth
