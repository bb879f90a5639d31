#include "sg/orchestrator/event_bus.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <span>
#include <sstream>
#include <string>
#include <system_error>

#include "sg/common.h"
#include "sg/crypto/random.h"
#include "sg/error.h"
#include "sg/orchestrator/io_util.h"
#include "sg/security/zeroizer.h"

namespace sg::orchestrator {
namespace {

constexpr size_t kHmacSize = crypto::HMAC_SHA256::TAG_SIZE;
constexpr size_t kMaxEventBytes = 16 * 1024;
constexpr size_t kDefaultMaxBytes = 10 * 1024 * 1024;

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unique_ptr<EventBus>& EventBusSingleton() {
  static std::unique_ptr<EventBus> instance;
  return instance;
}

struct PublishReentrancyGuard {  // suppresses recursive publish from subscribers
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

bool FieldKeyImpliesSecret(std::string_view key) {
  std::string lowered;
  lowered.reserve(key.size());
  for (char ch : key) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return lowered.find("password") != std::string::npos ||
         lowered.find("recovery") != std::string::npos ||
         lowered.find("secret") != std::string::npos || lowered.find("hash") != std::string::npos;
}

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        char buffer[7];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<int>(c));
        out += buffer;
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::string HexEncode(std::span<const uint8_t> bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t byte : bytes) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

bool HexDecode(std::string_view text, std::span<uint8_t> out) {
  if (text.size() != out.size() * 2) {
    return false;
  }
  auto nibble = [](char ch) -> int {
    if (ch >= '0' && ch <= '9') {
      return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
      return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
      return 10 + (ch - 'A');
    }
    return -1;
  };
  for (size_t i = 0; i < out.size(); ++i) {
    const int high = nibble(text[i * 2]);
    const int low = nibble(text[i * 2 + 1]);
    if (high < 0 || low < 0) {
      return false;
    }
    out[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return true;
}

std::array<uint8_t, kHmacSize>
ComputeChainedMac(const std::array<uint8_t, kHmacSize>& key,
                  const std::array<uint8_t, kHmacSize>& previous, uint64_t sequence,
                  std::string_view canonical) {
  std::vector<uint8_t> buffer;
  buffer.reserve(previous.size() + sizeof(sequence) + canonical.size());
  buffer.insert(buffer.end(), previous.begin(), previous.end());
  for (int shift = 56; shift >= 0; shift -= 8) {  // big-endian
    buffer.push_back(static_cast<uint8_t>(sequence >> shift));
  }
  buffer.insert(buffer.end(), canonical.begin(), canonical.end());
  return crypto::HMAC_SHA256::Compute(
      std::span<const uint8_t>(key.data(), key.size()),
      std::span<const uint8_t>(buffer.data(), buffer.size()));
}

bool ParseUnsigned(std::string_view line, std::string_view marker, uint64_t& out) {
  auto pos = line.find(marker);
  if (pos == std::string_view::npos) {
    return false;
  }
  pos += marker.size();
  size_t end = pos;
  while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end]))) {
    ++end;
  }
  if (end == pos) {
    return false;
  }
  auto [ptr, ec] = std::from_chars(line.data() + pos, line.data() + end, out);
  return ec == std::errc() && ptr == line.data() + end;
}

}  // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  auto digest = crypto::SHA256_Hash(sg::AsBytes(input));
  return HexEncode(std::span<const uint8_t>(digest.data(), digest.size()));
}

std::string RenderEventJson(const Event& event, std::string_view timestamp) {
  std::string payload;
  payload.reserve(256);
  payload += "{\"ts\":\"";
  payload += EscapeJson(timestamp);
  payload += "\",\"severity\":\"";
  payload += SeverityToString(event.severity);
  payload += "\",\"category\":\"";
  payload += CategoryToString(event.category);
  payload += "\"";
  if (!event.event_id.empty()) {
    payload += ",\"event_id\":\"";
    payload += EscapeJson(event.event_id);
    payload += "\"";
  }
  if (!event.message.empty()) {
    payload += ",\"message\":\"";
    payload += EscapeJson(event.message);
    payload += "\"";
  }
  for (const auto& field : event.fields) {
    auto privacy = field.privacy;
    if (privacy != FieldPrivacy::kRedact && FieldKeyImpliesSecret(field.key)) {
      privacy = FieldPrivacy::kRedact;
    }
    payload += ",\"";
    payload += EscapeJson(field.key);
    payload += "\":";
    if (privacy == FieldPrivacy::kRedact) {
      payload += "\"[REDACTED]\"";
    } else if (privacy == FieldPrivacy::kHash) {
      payload += "\"hash:" + HashForTelemetry(field.value) + "\"";
    } else if (field.numeric) {
      payload += field.value;
    } else {
      payload += "\"";
      payload += EscapeJson(field.value);
      payload += "\"";
    }
  }
  payload += "}";
  return payload;
}

JsonLineLogger::JsonLineLogger(std::filesystem::path log_path)
    : log_path_(std::move(log_path)),
      key_path_(log_path_.string() + ".key"),
      max_bytes_(ResolveMaxBytes()) {
  last_mac_.fill(0);
  std::lock_guard<std::mutex> guard(mutex_);
  EnsureKey();
  std::array<uint8_t, kHmacSize> existing_mac{};
  uint64_t existing_seq = 0;
  if (ParseLog(existing_mac, existing_seq)) {
    last_mac_ = existing_mac;
    entry_counter_ = existing_seq;
  } else {
    std::clog << "{\"event\":\"logger_integrity_failure\",\"message\":\"unable to verify existing audit log\"}"
              << std::endl;
    integrity_ok_ = false;
  }
}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

size_t JsonLineLogger::ResolveMaxBytes() {
  const char* env = std::getenv("SG_AUDIT_LOG_MAX_SIZE");
  if (!env || *env == '\0') {
    return kDefaultMaxBytes;
  }
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(env, env + std::strlen(env), value);
  if (ec != std::errc() || ptr != env + std::strlen(env) || value == 0) {
    return kDefaultMaxBytes;
  }
  return static_cast<size_t>(std::min<unsigned long long>(value, std::numeric_limits<size_t>::max()));
}

void JsonLineLogger::EnsureKey() {
  if (key_loaded_) {
    return;
  }
  try {
    auto existing = ReadFileIfExists(key_path_);
    if (existing) {
      if (existing->size() != hmac_key_.size()) {
        security::Zeroizer::WipeVector(*existing);
        std::clog << "{\"event\":\"logger_error\",\"message\":\"audit key has wrong length\"}"
                  << std::endl;
        integrity_ok_ = false;
        return;
      }
      std::copy(existing->begin(), existing->end(), hmac_key_.begin());
      security::Zeroizer::WipeVector(*existing);
      key_loaded_ = true;
      return;
    }
    crypto::SystemRandomBytes(std::span<uint8_t>(hmac_key_.data(), hmac_key_.size()));
    AtomicReplace(key_path_, std::span<const uint8_t>(hmac_key_.data(), hmac_key_.size()));
    key_loaded_ = true;
  } catch (const Error& err) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit key unavailable\",\"error_code\":"
              << err.code << "}" << std::endl;
    integrity_ok_ = false;
  }
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  std::error_code ec;
  auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log directory create failed\",\"error_code\":"
                << ec.value() << "}" << std::endl;
      return;
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

bool JsonLineLogger::ParseLog(std::array<uint8_t, kHmacSize>& mac, uint64_t& sequence) {
  if (!key_loaded_) {
    return false;
  }
  std::ifstream in(log_path_);
  if (!in) {
    mac.fill(0);
    sequence = 0;
    return true;
  }
  std::array<uint8_t, kHmacSize> previous{};
  uint64_t seq = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    if (line.size() > kMaxEventBytes + 256) {
      return false;
    }
    std::string_view line_view(line);
    constexpr std::string_view kMacMarker = ",\"audit_mac\":\"";
    auto mac_pos = line_view.rfind(kMacMarker);
    if (mac_pos == std::string_view::npos) {
      return false;
    }
    auto mac_start = mac_pos + kMacMarker.size();
    auto mac_end = line_view.find('"', mac_start);
    if (mac_end == std::string_view::npos) {
      return false;
    }
    std::array<uint8_t, kHmacSize> parsed{};
    if (!HexDecode(line_view.substr(mac_start, mac_end - mac_start), parsed)) {
      return false;
    }
    uint64_t parsed_seq = 0;
    if (!ParseUnsigned(line_view.substr(0, mac_pos), ",\"audit_seq\":", parsed_seq) ||
        parsed_seq != seq + 1) {
      return false;
    }
    std::string canonical(line_view.substr(0, mac_pos));
    canonical.push_back('}');
    auto expected_mac = ComputeChainedMac(hmac_key_, previous, parsed_seq, canonical);
    if (expected_mac != parsed) {
      return false;
    }
    previous = expected_mac;
    seq = parsed_seq;
  }
  if (in.bad()) {
    return false;
  }
  mac = previous;
  sequence = seq;
  return true;
}

bool JsonLineLogger::VerifyLogFile() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!integrity_ok_) {
    return false;
  }
  if (stream_.is_open()) {
    stream_.flush();
  }
  std::array<uint8_t, kHmacSize> mac{};
  uint64_t sequence = 0;
  if (!ParseLog(mac, sequence)) {
    return false;
  }
  return sequence == entry_counter_ && mac == last_mac_;
}

bool JsonLineLogger::healthy() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return integrity_ok_ && key_loaded_;
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  auto current_size = std::filesystem::file_size(log_path_, ec);
  if (ec) {
    current_size = 0;
    ec.clear();
  }
  if (current_size + incoming_bytes <= max_bytes_ || current_size == 0) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  for (size_t idx = kMaxFiles - 1; idx > 0; --idx) {
    std::filesystem::path src =
        idx == 1 ? log_path_ : std::filesystem::path(log_path_.string() + "." + std::to_string(idx - 1));
    std::filesystem::path dst = std::filesystem::path(log_path_.string() + "." + std::to_string(idx));
    std::error_code rotate_ec;
    if (!std::filesystem::exists(src, rotate_ec)) {
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    rotate_ec.clear();
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log rotate rename failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
    }
  }
  last_mac_.fill(0);
  entry_counter_ = 0;
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!integrity_ok_ || !key_loaded_) {
    return;
  }
  auto timestamp = FormatTimestamp(std::chrono::system_clock::now());
  auto base = RenderEventJson(event, timestamp);
  if (base.size() > kMaxEventBytes) {
    Event replacement;
    replacement.category = EventCategory::kDiagnostics;
    replacement.severity = EventSeverity::kWarning;
    replacement.event_id = "event_too_large";
    replacement.fields.emplace_back("original_event_id", event.event_id, FieldPrivacy::kHash);
    base = RenderEventJson(replacement, timestamp);
  }

  RotateIfNeeded(base.size() + 96);

  const uint64_t next_sequence = entry_counter_ + 1;
  std::string prefix = base.substr(0, base.size() - 1);
  prefix.append(",\"audit_seq\":");
  prefix.append(std::to_string(next_sequence));
  std::string canonical = prefix;
  canonical.push_back('}');
  auto mac = ComputeChainedMac(hmac_key_, last_mac_, next_sequence, canonical);
  std::string line = prefix;
  line.append(",\"audit_mac\":\"");
  line.append(HexEncode(std::span<const uint8_t>(mac.data(), mac.size())));
  line.append("\"}");

  EnsureOpen();
  if (!stream_.is_open()) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}"
              << std::endl;
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
  if (!stream_) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log write failed\"}" << std::endl;
    stream_.close();
    return;
  }
  last_mac_ = mac;
  entry_counter_ = next_sequence;
}

EventBus& EventBus::Instance() {
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  auto& instance = EventBusSingleton();
  if (!instance) {
    instance = std::make_unique<EventBus>();
  }
  return *instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard reentrancy(in_publish);
  std::shared_ptr<const SubscriberList> targets;
  std::shared_ptr<JsonLineLogger> log;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    targets = subscribers_;
    log = json_log_;
  }
  if (log) {
    log->Log(event);
  }
  for (const auto& entry : *targets) {
    if (entry.fn) {
      entry.fn(event);
    }
  }
}

EventBus::SubscriptionId EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto updated = std::make_shared<SubscriberList>(*subscribers_);
  const SubscriptionId id = next_id_++;
  updated->push_back(Entry{id, std::move(fn)});
  subscribers_ = std::move(updated);
  return id;
}

void EventBus::Unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto updated = std::make_shared<SubscriberList>(*subscribers_);
  updated->erase(std::remove_if(updated->begin(), updated->end(),
                                [id](const Entry& entry) { return entry.id == id; }),
                 updated->end());
  subscribers_ = std::move(updated);
}

void EventBus::AttachJsonLog(const std::filesystem::path& path) {
  auto logger = std::make_shared<JsonLineLogger>(path);
  std::lock_guard<std::mutex> guard(mutex_);
  json_log_ = std::move(logger);
}

void EventBus::DetachJsonLog() {
  std::lock_guard<std::mutex> guard(mutex_);
  json_log_.reset();
}

std::shared_ptr<JsonLineLogger> EventBus::json_log() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return json_log_;
}

void ResetEventBusForTesting() {
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  EventBusSingleton().reset();
}

} // namespace sg::orchestrator
