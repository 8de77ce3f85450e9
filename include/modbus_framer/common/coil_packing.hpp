#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace mbframer {

enum class Coil : uint8_t { kOff = 0, kOn = 1 };

static constexpr size_t kCoilsPerByte = 8;

/**
 * @brief Number of bytes needed to hold the given number of packed coils
 */
[[nodiscard]] constexpr size_t BytesNeeded(size_t coil_count) noexcept {
  return coil_count / kCoilsPerByte + (coil_count % kCoilsPerByte != 0 ? 1 : 0);
}

/**
 * @brief Pack coils into bytes, Modbus style
 *
 * Coil i lands in byte i / 8 at bit i % 8 (least significant bit first). Only the first
 * BytesNeeded(coils.size()) bytes are written; unused high bits of the last one are cleared and
 * any later bytes are left untouched.
 *
 * Aborts if bytes is smaller than BytesNeeded(coils.size()).
 *
 * @param coils Coil values to pack
 * @param bytes Destination, at least BytesNeeded(coils.size()) long
 */
void PackCoils(std::span<const Coil> coils, std::span<uint8_t> bytes);

/**
 * @brief Unpack coils from bytes; coils.size() decides how many are decoded
 *
 * Aborts if bytes is smaller than BytesNeeded(coils.size()).
 *
 * @param bytes Packed coil bytes
 * @param coils Destination for the decoded values
 */
void UnpackCoils(std::span<const uint8_t> bytes, std::span<Coil> coils);

}  // namespace mbframer
