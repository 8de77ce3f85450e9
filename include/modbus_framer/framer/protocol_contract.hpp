#pragma once

#include <algorithm>
#include <cstddef>
#include "../rtu/rtu_modbus.hpp"
#include "../tcp/tcp_modbus.hpp"

namespace mbframer {

/*
 * A protocol contract is a class with only static members that tells the framer how one
 * transport wraps a PDU:
 *
 *   static constexpr size_t kAduMaxLength;
 *   using Header = ...;
 *   static FrameResult<size_t> AduLength(std::span<const uint8_t> data);
 *   static FrameResult<Header> AduHeader(std::span<const uint8_t> data);
 *   static CheckResult AduCheck(std::span<const uint8_t> data);
 *   static FrameResult<std::span<const uint8_t>> PduBody(std::span<const uint8_t> data);
 *
 * AduLength is the cheap question ("how long will this ADU be?") and must answer from a prefix.
 * The other three are asked only once the whole ADU is buffered. TcpModbus and RtuModbus<Rules>
 * are the contracts shipped with the library.
 */

/**
 * @brief Receive buffer size shared by every framer: the longest ADU of any transport
 *
 * Add new transports here.
 */
static constexpr size_t kFramerBufferLength = std::max(TcpModbus::kAduMaxLength, kRtuAduMaxLength);

}  // namespace mbframer
