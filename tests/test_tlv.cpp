#include "sg/tlv/parser.h"

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "test_helpers.h"

int main() {
  sg::tlv::Writer writer;
  writer.AppendString(1, "digest");
  writer.AppendU32(3, 0x01020304u);
  writer.AppendI64(4, -42);
  writer.AppendU8(5, 1);
  const auto& bytes = writer.bytes();
  // type 1, length 6, little-endian
  SG_EXPECT(bytes.size() == 4 + 6 + 4 + 4 + 4 + 8 + 4 + 1, "encoded size");
  SG_EXPECT(bytes[0] == 0x01 && bytes[1] == 0x00 && bytes[2] == 0x06 && bytes[3] == 0x00,
            "record header layout");

  sg::tlv::Parser parser(std::span<const uint8_t>(bytes.data(), bytes.size()));
  SG_EXPECT(parser.valid(), "well-formed buffer parses");
  SG_EXPECT(parser.consumed() == bytes.size(), "parser consumes everything");
  std::vector<sg::tlv::Record> records(parser.begin(), parser.end());
  SG_EXPECT(records.size() == 4, "four records");
  SG_EXPECT(std::string_view(reinterpret_cast<const char*>(records[0].value.data()),
                             records[0].value.size()) == "digest",
            "string payload");
  uint32_t u32 = 0;
  SG_EXPECT(sg::tlv::ReadU32(records[1], u32) && u32 == 0x01020304u, "u32 payload");
  int64_t i64 = 0;
  SG_EXPECT(sg::tlv::ReadI64(records[2], i64) && i64 == -42, "i64 payload");
  uint8_t u8 = 0;
  SG_EXPECT(sg::tlv::ReadU8(records[3], u8) && u8 == 1, "u8 payload");
  SG_EXPECT(!sg::tlv::ReadU32(records[3], u32), "width mismatch rejected");

  std::vector<uint8_t> truncated(bytes.begin(), bytes.end() - 1);
  sg::tlv::Parser short_parser(std::span<const uint8_t>(truncated.data(), truncated.size()));
  SG_EXPECT(!short_parser.valid(), "truncated payload is invalid");

  std::vector<uint8_t> trailing(bytes.begin(), bytes.end());
  trailing.push_back(0xAA);
  sg::tlv::Parser trailing_parser(std::span<const uint8_t>(trailing.data(), trailing.size()));
  SG_EXPECT(!trailing_parser.valid(), "trailing garbage is invalid");

  sg::tlv::Parser limited(std::span<const uint8_t>(bytes.data(), bytes.size()), 2);
  SG_EXPECT(!limited.valid(), "record limit enforced");

  std::vector<uint8_t> oversized(70000, 0);
  bool threw = false;
  try {
    sg::tlv::Writer big;
    big.Append(9, std::span<const uint8_t>(oversized.data(), oversized.size()));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  SG_EXPECT(threw, "payload over 65535 bytes rejected");

  std::cout << "tlv tests ok\n";
  return 0;
}
