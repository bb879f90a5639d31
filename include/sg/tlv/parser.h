#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace sg::tlv {

struct Record {
  uint16_t type{0};
  std::span<const uint8_t> value{};
};

// Records are encoded as little-endian uint16 type, uint16 length, payload.
class Parser {
 public:
  Parser(std::span<const uint8_t> buffer, std::size_t max_records = 64,
         std::size_t max_payload = 64 * 1024 - 1);

  [[nodiscard]] bool valid() const noexcept { return valid_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }

  [[nodiscard]] auto begin() const noexcept { return records_.begin(); }
  [[nodiscard]] auto end() const noexcept { return records_.end(); }

 private:
  bool valid_{false};
  std::size_t consumed_{0};
  std::vector<Record> records_{};
};

class Writer {
 public:
  void Append(uint16_t type, std::span<const uint8_t> value);
  void AppendString(uint16_t type, std::string_view value);
  void AppendU8(uint16_t type, uint8_t value);
  void AppendU32(uint16_t type, uint32_t value);
  void AppendI64(uint16_t type, int64_t value);

  [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept { return buffer_; }

 private:
  std::vector<uint8_t> buffer_{};
};

// Fixed-width payload readers. Return false when the payload width is wrong.
bool ReadU8(const Record& record, uint8_t& out) noexcept;
bool ReadU32(const Record& record, uint32_t& out) noexcept;
bool ReadI64(const Record& record, int64_t& out) noexcept;

}  // namespace sg::tlv
