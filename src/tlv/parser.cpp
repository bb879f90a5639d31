#include "sg/tlv/parser.h"

#include <algorithm>
#include <cstring>
#include <limits>

#include "sg/common.h"
#include "sg/error.h"

namespace sg::tlv {

Parser::Parser(std::span<const uint8_t> buffer, std::size_t max_records, std::size_t max_payload) {
  std::size_t offset = 0;
  std::size_t count = 0;
  while ((buffer.size() - offset) >= sizeof(uint16_t) * 2) {
    if (count >= max_records) {
      valid_ = false;
      return;
    }

    uint16_t type_le = 0;
    uint16_t length_le = 0;
    std::memcpy(&type_le, buffer.data() + offset, sizeof(type_le));
    std::memcpy(&length_le, buffer.data() + offset + sizeof(type_le), sizeof(length_le));

    const uint16_t type = sg::FromLittleEndian16(type_le);
    const std::size_t length = static_cast<std::size_t>(sg::FromLittleEndian16(length_le));

    if (length > max_payload) {
      valid_ = false;
      return;
    }

    offset += sizeof(uint16_t) * 2;
    if (offset > buffer.size() || (buffer.size() - offset) < length) {
      valid_ = false;
      return;
    }

    auto payload = buffer.subspan(offset, length);
    records_.push_back(Record{type, payload});

    offset += length;
    ++count;
  }

  valid_ = offset == buffer.size();
  consumed_ = offset;
}

void Writer::Append(uint16_t type, std::span<const uint8_t> value) {
  if (value.size() > std::numeric_limits<uint16_t>::max()) {
    throw Error(ErrorDomain::Internal, 0, "TLV payload exceeds 65535 bytes");
  }
  const uint16_t type_le = sg::ToLittleEndian16(type);
  const uint16_t length_le = sg::ToLittleEndian16(static_cast<uint16_t>(value.size()));
  const auto* type_bytes = reinterpret_cast<const uint8_t*>(&type_le);
  const auto* length_bytes = reinterpret_cast<const uint8_t*>(&length_le);
  buffer_.insert(buffer_.end(), type_bytes, type_bytes + sizeof(type_le));
  buffer_.insert(buffer_.end(), length_bytes, length_bytes + sizeof(length_le));
  buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void Writer::AppendString(uint16_t type, std::string_view value) {
  Append(type, sg::AsBytes(value));
}

void Writer::AppendU8(uint16_t type, uint8_t value) {
  Append(type, std::span<const uint8_t>(&value, 1));
}

void Writer::AppendU32(uint16_t type, uint32_t value) {
  const uint32_t le = sg::ToLittleEndian32(value);
  Append(type, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(&le), sizeof(le)));
}

void Writer::AppendI64(uint16_t type, int64_t value) {
  const uint64_t le = sg::ToLittleEndian64(static_cast<uint64_t>(value));
  Append(type, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(&le), sizeof(le)));
}

bool ReadU8(const Record& record, uint8_t& out) noexcept {
  if (record.value.size() != 1) {
    return false;
  }
  out = record.value[0];
  return true;
}

bool ReadU32(const Record& record, uint32_t& out) noexcept {
  if (record.value.size() != sizeof(uint32_t)) {
    return false;
  }
  uint32_t le = 0;
  std::memcpy(&le, record.value.data(), sizeof(le));
  out = sg::FromLittleEndian32(le);
  return true;
}

bool ReadI64(const Record& record, int64_t& out) noexcept {
  if (record.value.size() != sizeof(uint64_t)) {
    return false;
  }
  uint64_t le = 0;
  std::memcpy(&le, record.value.data(), sizeof(le));
  out = static_cast<int64_t>(sg::FromLittleEndian64(le));
  return true;
}

}  // namespace sg::tlv
