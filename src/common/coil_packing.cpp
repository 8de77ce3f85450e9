#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <span>
#include "common/coil_packing.hpp"
#include "common/log.hpp"

namespace mbframer {

namespace {

[[noreturn]] void UndersizedCoilBuffer(size_t coil_count, size_t byte_count) {
  // Caller defect: the buffer was not sized with BytesNeeded
  MODBUS_FRAMER_LOG_WARNING("%zu coils do not fit in %zu bytes", coil_count, byte_count);
  std::abort();
}

}  // namespace

void PackCoils(std::span<const Coil> coils, std::span<uint8_t> bytes) {
  const size_t byte_count = BytesNeeded(coils.size());
  if (bytes.size() < byte_count) {
    UndersizedCoilBuffer(coils.size(), bytes.size());
  }

  auto packed = bytes.first(byte_count);
  std::fill(packed.begin(), packed.end(), uint8_t{0});

  for (size_t coil_index = 0; coil_index < coils.size(); ++coil_index) {
    const auto bit_flag = static_cast<uint8_t>(1U << (coil_index % kCoilsPerByte));
    if (coils[coil_index] == Coil::kOn) {
      packed[coil_index / kCoilsPerByte] |= bit_flag;
    }
  }
}

void UnpackCoils(std::span<const uint8_t> bytes, std::span<Coil> coils) {
  if (bytes.size() < BytesNeeded(coils.size())) {
    UndersizedCoilBuffer(coils.size(), bytes.size());
  }

  for (size_t coil_index = 0; coil_index < coils.size(); ++coil_index) {
    const auto bit_flag = static_cast<uint8_t>(1U << (coil_index % kCoilsPerByte));
    coils[coil_index] = (bytes[coil_index / kCoilsPerByte] & bit_flag) != 0 ? Coil::kOn : Coil::kOff;
  }
}

}  // namespace mbframer
