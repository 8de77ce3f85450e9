#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>
#include "../common/byte_helpers.hpp"
#include "../common/frame_error.hpp"

namespace mbframer {

static constexpr size_t kRtuAduMaxLength = 256;

/**
 * @brief Header data of a Modbus RTU ADU
 */
struct RtuHeader {
  uint8_t address{0};
  /** Trailing check value exactly as found on the wire */
  uint16_t check{0};

  bool operator==(const RtuHeader &) const = default;
};

/**
 * @brief Modbus RTU protocol contract
 *
 * An RTU ADU is: station address (1 byte), PDU (function code + data), check value (2 bytes,
 * low byte first). How long an ADU is and how its check value is computed depend on the serial
 * line and are supplied by the integrator through Rules:
 *
 * @code
 * struct MyRules {
 *   // Total ADU length including address and check value. kNotEnoughData while the window is
 *   // too short to tell, kBadFuncCode for an unknown function code.
 *   static FrameResult<size_t> AduLength(std::span<const uint8_t> data);
 *
 *   // Check value over the address and PDU bytes
 *   static uint16_t ComputeCheck(std::span<const uint8_t> covered);
 * };
 * @endcode
 *
 * RtuModbus adds the length bounds, the check comparison and the header/PDU slicing on top.
 */
template <typename Rules>
class RtuModbus {
 public:
  static constexpr size_t kAduMaxLength = kRtuAduMaxLength;
  static constexpr size_t kAddressSize = 1;
  static constexpr size_t kCheckSize = 2;
  static constexpr size_t kMinAduLength = kAddressSize + 1 + kCheckSize;  // address + function_code + check

  using Header = RtuHeader;

  /**
   * @brief Total ADU length as decided by Rules, bounded to [4, 256]
   */
  [[nodiscard]] static FrameResult<size_t> AduLength(std::span<const uint8_t> data) {
    FrameResult<size_t> length = Rules::AduLength(data);
    if (GetError(length) != nullptr) {
      return length;
    }

    size_t adu_length = std::get<size_t>(length);
    if (adu_length > kAduMaxLength || adu_length < kMinAduLength) {
      return FrameError::kBadLength;
    }
    return adu_length;
  }

  /**
   * @brief Station address and stored check value; needs the whole ADU
   */
  [[nodiscard]] static FrameResult<Header> AduHeader(std::span<const uint8_t> data) {
    auto length = AduLength(data);
    if (const auto *error = GetError(length)) {
      return *error;
    }

    size_t adu_length = std::get<size_t>(length);
    if (data.size() < adu_length) {
      return FrameError::kNotEnoughData;
    }

    Header header;
    header.address = data[0];
    header.check = StoredCheck(data.first(adu_length));
    return header;
  }

  /**
   * @brief Compare the stored check value against Rules::ComputeCheck
   */
  [[nodiscard]] static CheckResult AduCheck(std::span<const uint8_t> data) {
    auto length = AduLength(data);
    if (const auto *error = GetError(length)) {
      return *error;
    }

    size_t adu_length = std::get<size_t>(length);
    if (data.size() < adu_length) {
      return FrameError::kNotEnoughData;
    }

    auto adu = data.first(adu_length);
    if (Rules::ComputeCheck(adu.first(adu_length - kCheckSize)) != StoredCheck(adu)) {
      return FrameError::kBadErrorCheck;
    }
    return std::monostate{};
  }

  /**
   * @brief PDU between the address and the check value, after AduCheck
   */
  [[nodiscard]] static FrameResult<std::span<const uint8_t>> PduBody(std::span<const uint8_t> data) {
    auto check = AduCheck(data);
    if (const auto *error = GetError(check)) {
      return *error;
    }

    size_t adu_length = std::get<size_t>(AduLength(data));
    return data.subspan(kAddressSize, adu_length - kAddressSize - kCheckSize);
  }

 private:
  [[nodiscard]] static uint16_t StoredCheck(std::span<const uint8_t> adu) {
    return MakeUint16LittleEndian(adu[adu.size() - 2], adu[adu.size() - 1]);
  }
};

}  // namespace mbframer
