#include "sg/orchestrator/event_bus.h"

#include <array>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "sg/crypto/hmac_sha256.h"
#include "sg/orchestrator/io_util.h"
#include "test_helpers.h"

namespace {

using sg::orchestrator::Event;
using sg::orchestrator::EventBus;
using sg::orchestrator::FieldPrivacy;

Event MakeEvent(std::string id) {
  Event event;
  event.category = sg::orchestrator::EventCategory::kSecurity;
  event.event_id = std::move(id);
  event.message = "test";
  return event;
}

std::string ToHex(const std::array<uint8_t, 32>& bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  for (uint8_t b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

}  // namespace

int main() {
  sg::orchestrator::ResetEventBusForTesting();
  auto& bus = EventBus::Instance();

  // Subscribers run synchronously in subscription order.
  std::vector<std::string> calls;
  const auto first = bus.Subscribe([&](const Event& e) { calls.push_back("first:" + e.event_id); });
  const auto second = bus.Subscribe([&](const Event& e) { calls.push_back("second:" + e.event_id); });
  bus.Publish(MakeEvent("one"));
  SG_EXPECT(calls.size() == 2 && calls[0] == "first:one" && calls[1] == "second:one",
            "delivery order");
  bus.Unsubscribe(first);
  bus.Publish(MakeEvent("two"));
  SG_EXPECT(calls.size() == 3 && calls[2] == "second:two", "unsubscribed handler skipped");
  bus.Unsubscribe(second);

  // Secret-like keys are redacted whatever privacy they declare.
  Event secrets = MakeEvent("secrets");
  secrets.fields.emplace_back("password", "hunter22");
  secrets.fields.emplace_back("recovery_key", "ABCD-EFGH-JKLM-NPQR");
  secrets.fields.emplace_back("password_hash", "$sg-pbkdf2-sha256$12$x");
  secrets.fields.emplace_back("user", "alex", FieldPrivacy::kHash);
  secrets.fields.emplace_back("attempts", "3", FieldPrivacy::kPublic, true);
  const auto json = sg::orchestrator::RenderEventJson(secrets, "2026-01-01T00:00:00.000000Z");
  SG_EXPECT(json.find("hunter22") == std::string::npos, "password redacted");
  SG_EXPECT(json.find("ABCD-EFGH") == std::string::npos, "recovery key redacted");
  SG_EXPECT(json.find("pbkdf2") == std::string::npos, "hash redacted");
  SG_EXPECT(json.find("\"user\":\"hash:") != std::string::npos, "hashed field");
  SG_EXPECT(json.find("\"attempts\":3") != std::string::npos, "numeric field");

  // Audit log chain.
  sg::testing::TempDir dir("sg_event_bus_");
  const auto log_path = dir.path() / "audit.log";
  bus.AttachJsonLog(log_path);
  auto logger = bus.json_log();
  SG_EXPECT(logger && logger->healthy(), "logger attached");
  for (int i = 0; i < 3; ++i) {
    bus.Publish(MakeEvent("entry_" + std::to_string(i)));
  }
  SG_EXPECT(logger->VerifyLogFile(), "chain verifies");
  SG_EXPECT(std::filesystem::exists(dir.path() / "audit.log.key"), "chain key stored beside the log");
  const auto contents = ReadAll(log_path);
  SG_EXPECT(contents.find("\"audit_seq\":3") != std::string::npos, "sequence numbers");

  // The first MAC covers a zero chain value, the sequence as a big-endian
  // uint64 and the line up to the MAC field.
  {
    const auto key = sg::orchestrator::ReadFileIfExists(dir.path() / "audit.log.key");
    SG_EXPECT(key && key->size() == 32, "chain key is 32 bytes");
    const std::string first_line = contents.substr(0, contents.find('\n'));
    const std::string marker = ",\"audit_mac\":\"";
    const auto mac_pos = first_line.rfind(marker);
    SG_EXPECT(mac_pos != std::string::npos, "first line carries a MAC");
    std::vector<uint8_t> covered(32, 0);
    const std::array<uint8_t, 8> sequence_be{0, 0, 0, 0, 0, 0, 0, 1};
    covered.insert(covered.end(), sequence_be.begin(), sequence_be.end());
    const std::string canonical = first_line.substr(0, mac_pos) + "}";
    covered.insert(covered.end(), canonical.begin(), canonical.end());
    const auto expected = sg::crypto::HMAC_SHA256::Compute(
        std::span<const uint8_t>(key->data(), key->size()),
        std::span<const uint8_t>(covered.data(), covered.size()));
    SG_EXPECT(first_line.substr(mac_pos + marker.size(), 64) == ToHex(expected),
              "first audit MAC matches the documented layout");
  }
  bus.DetachJsonLog();
  logger.reset();

  // Reopening continues the chain.
  {
    sg::orchestrator::JsonLineLogger reopened(log_path);
    SG_EXPECT(reopened.healthy(), "existing chain accepted");
    reopened.Log(MakeEvent("entry_3"));
    SG_EXPECT(reopened.VerifyLogFile(), "continued chain verifies");
  }
  SG_EXPECT(ReadAll(log_path).find("\"audit_seq\":4") != std::string::npos, "sequence continued");

  // Editing a line breaks the chain.
  auto tampered = ReadAll(log_path);
  const auto pos = tampered.find("entry_1");
  SG_EXPECT(pos != std::string::npos, "entry present");
  tampered.replace(pos, 7, "entry_X");
  {
    std::ofstream out(log_path, std::ios::trunc);
    out << tampered;
  }
  sg::orchestrator::JsonLineLogger checker(log_path);
  SG_EXPECT(!checker.healthy(), "tampering detected on open");
  SG_EXPECT(!checker.VerifyLogFile(), "tampered chain fails verification");

  sg::orchestrator::ResetEventBusForTesting();
  std::cout << "event bus tests ok\n";
  return 0;
}
