#pragma once

#include <cstdint>

namespace mbframer {

static constexpr uint8_t kMaxByte = 0xFF;
static constexpr uint8_t kBitsPerByte = 8;

static inline constexpr uint8_t GetLowByte(uint16_t value) {
  return value & kMaxByte;
}

static inline constexpr uint8_t GetHighByte(uint16_t value) {
  return (value >> kBitsPerByte) & kMaxByte;
}

// Modbus puts the high byte first on the wire
static inline constexpr uint16_t MakeUint16BigEndian(uint8_t high_byte, uint8_t low_byte) {
  return static_cast<uint16_t>((static_cast<uint16_t>(high_byte) << kBitsPerByte) | static_cast<uint16_t>(low_byte));
}

static inline constexpr uint16_t MakeUint16LittleEndian(uint8_t low_byte, uint8_t high_byte) {
  return MakeUint16BigEndian(high_byte, low_byte);
}

}  // namespace mbframer
