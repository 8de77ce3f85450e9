#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include "../common/frame_error.hpp"

namespace mbframer {

/**
 * @brief Header data of a Modbus TCP ADU (the MBAP header)
 */
struct TcpHeader {
  uint16_t transaction_id{0};
  uint16_t protocol_id{0};
  uint16_t length{0};
  uint8_t unit_id{0};

  bool operator==(const TcpHeader &) const = default;
};

/**
 * @brief Modbus TCP protocol contract
 *
 * Modbus TCP prefixes every PDU with the MBAP header:
 * - Transaction ID (2 bytes)
 * - Protocol ID (2 bytes)
 * - Length (2 bytes) - number of bytes following (Unit ID + PDU)
 * - Unit ID (1 byte)
 *
 * The length field counts the unit ID, which is part of the MBAP, so the header is 7 bytes but
 * only 6 bytes are excluded from the length: ADU length = length field + 6. The PDU starts at
 * offset 7 with the function code. There is no application-layer checksum.
 *
 * All fields are big-endian.
 */
class TcpModbus {
 public:
  static constexpr size_t kAduMaxLength = 260;
  static constexpr size_t kPduMaxLength = 253;
  static constexpr size_t kMbapHeaderSize = 7;  // Transaction ID(2) + Protocol ID(2) + Length(2) + Unit ID(1)
  static constexpr size_t kExcludedLength = 6;  // MBAP bytes not counted by the length field

  using Header = TcpHeader;

  /**
   * @brief Total ADU length from the length field
   * @param data Start of an ADU; at least 6 bytes are needed
   * @return length field + 6, kNotEnoughData if shorter than 6 bytes, kBadLength above 260
   */
  [[nodiscard]] static FrameResult<size_t> AduLength(std::span<const uint8_t> data);

  /**
   * @brief Parse the MBAP header
   * @param data Start of an ADU; at least 7 bytes are needed
   * @return Header, or kNotEnoughData if shorter than the MBAP header
   */
  [[nodiscard]] static FrameResult<Header> AduHeader(std::span<const uint8_t> data);

  /**
   * @brief Confirm the window holds a whole ADU
   *
   * Modbus TCP has no checksum, so this only checks there are enough bytes. A length field of 0
   * describes an ADU too short to carry a unit ID and is reported as kBadLength.
   */
  [[nodiscard]] static CheckResult AduCheck(std::span<const uint8_t> data);

  /**
   * @brief PDU (function code + data) of a complete ADU, after AduCheck
   * @return View into data starting at offset 7 and ending at the ADU end
   */
  [[nodiscard]] static FrameResult<std::span<const uint8_t>> PduBody(std::span<const uint8_t> data);

 private:
  static constexpr size_t kTransactionIdOffset = 0;
  static constexpr size_t kProtocolIdOffset = 2;
  static constexpr size_t kLengthOffset = 4;
  static constexpr size_t kUnitIdOffset = 6;

  [[nodiscard]] static uint16_t ExtractU16(std::span<const uint8_t> data, size_t offset);
};

}  // namespace mbframer
