#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "sg/crypto/hmac_sha256.h"

namespace sg::orchestrator {

  // Structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  std::string HashForTelemetry(std::string_view input);

  // Serializes |event| as one JSON object, applying field privacy. Keys that
  // name secrets are always redacted regardless of the declared privacy.
  std::string RenderEventJson(const Event& event, std::string_view timestamp);

  // Append-only JSON line audit log. Each line carries a sequence number and
  // an HMAC-SHA256 chained over the previous line's tag; every rotated file
  // starts a fresh chain.
  class JsonLineLogger {
  public:
    static constexpr size_t kMaxFiles = 3;

    explicit JsonLineLogger(std::filesystem::path log_path);
    void Log(const Event& event);

    // Re-reads the current log file and checks the chain against the key.
    [[nodiscard]] bool VerifyLogFile();
    [[nodiscard]] bool healthy() const;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return log_path_; }

  private:
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    static size_t ResolveMaxBytes();
    void EnsureOpen();
    void EnsureKey();
    void RotateIfNeeded(size_t incoming_bytes);
    bool ParseLog(std::array<uint8_t, crypto::HMAC_SHA256::TAG_SIZE>& mac, uint64_t& sequence);

    mutable std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    std::filesystem::path key_path_;
    size_t max_bytes_;
    std::array<uint8_t, crypto::HMAC_SHA256::TAG_SIZE> hmac_key_{};
    std::array<uint8_t, crypto::HMAC_SHA256::TAG_SIZE> last_mac_{};
    uint64_t entry_counter_{0};
    bool key_loaded_{false};
    bool integrity_ok_{true};
  };

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;

    static EventBus& Instance();

    // Delivers synchronously, in subscription order, on the publishing thread.
    void Publish(const Event& event);
    SubscriptionId Subscribe(Subscriber fn);
    void Unsubscribe(SubscriptionId id);

    // Routes every subsequent event to an audit log at |path|. Replaces any
    // previously attached log.
    void AttachJsonLog(const std::filesystem::path& path);
    void DetachJsonLog();
    [[nodiscard]] std::shared_ptr<JsonLineLogger> json_log() const;

    EventBus() = default;

  private:
    struct Entry {
      SubscriptionId id;
      Subscriber fn;
    };
    using SubscriberList = std::vector<Entry>;

    mutable std::mutex mutex_;
    std::shared_ptr<const SubscriberList> subscribers_{std::make_shared<SubscriberList>()};
    std::shared_ptr<JsonLineLogger> json_log_;
    SubscriptionId next_id_{1};
  };

  void ResetEventBusForTesting();

} // namespace sg::orchestrator
