#include <cstdint>
#include <span>
#include <variant>
#include "common/byte_helpers.hpp"
#include "common/frame_error.hpp"
#include "tcp/tcp_modbus.hpp"

namespace mbframer {

uint16_t TcpModbus::ExtractU16(std::span<const uint8_t> data, size_t offset) {
  return MakeUint16BigEndian(data[offset], data[offset + 1]);
}

FrameResult<size_t> TcpModbus::AduLength(std::span<const uint8_t> data) {
  if (data.size() < kExcludedLength) {
    return FrameError::kNotEnoughData;
  }

  size_t adu_length = static_cast<size_t>(ExtractU16(data, kLengthOffset)) + kExcludedLength;
  if (adu_length > kAduMaxLength) {
    return FrameError::kBadLength;
  }
  return adu_length;
}

FrameResult<TcpHeader> TcpModbus::AduHeader(std::span<const uint8_t> data) {
  if (data.size() < kMbapHeaderSize) {
    return FrameError::kNotEnoughData;
  }

  TcpHeader header;
  header.transaction_id = ExtractU16(data, kTransactionIdOffset);
  header.protocol_id = ExtractU16(data, kProtocolIdOffset);
  header.length = ExtractU16(data, kLengthOffset);
  header.unit_id = data[kUnitIdOffset];
  return header;
}

CheckResult TcpModbus::AduCheck(std::span<const uint8_t> data) {
  auto length = AduLength(data);
  if (const auto *error = GetError(length)) {
    return *error;
  }

  size_t adu_length = std::get<size_t>(length);
  if (data.size() < adu_length) {
    return FrameError::kNotEnoughData;
  }
  // Length field 0: not even the unit ID fits
  if (adu_length < kMbapHeaderSize) {
    return FrameError::kBadLength;
  }
  return std::monostate{};
}

FrameResult<std::span<const uint8_t>> TcpModbus::PduBody(std::span<const uint8_t> data) {
  auto check = AduCheck(data);
  if (const auto *error = GetError(check)) {
    return *error;
  }

  // AduCheck guarantees kMbapHeaderSize <= adu_length <= data.size()
  size_t adu_length = std::get<size_t>(AduLength(data));
  return data.subspan(kMbapHeaderSize, adu_length - kMbapHeaderSize);
}

}  // namespace mbframer
