#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

namespace mbframer {

/**
 * @brief Reasons a byte window could not be turned into an ADU
 *
 * Only kNotEnoughData is non-destructive: the framer keeps what it has buffered and waits for
 * more bytes. Every other value means the buffered bytes are corrupt and get discarded.
 */
enum class FrameError : uint8_t {
  /** More bytes are required before the operation can answer */
  kNotEnoughData = 0x01,
  /** Declared or derived ADU length is outside what the transport allows */
  kBadLength = 0x02,
  /** Integrity check (checksum, CRC, ...) did not match */
  kBadErrorCheck = 0x03,
  /** A function code needed to size the ADU was not recognized */
  kBadFuncCode = 0x04
};

/**
 * @brief Result of a contract operation: the value on success, the error otherwise
 */
template <typename T>
using FrameResult = std::variant<T, FrameError>;

/**
 * @brief Result of a pure validation step
 */
using CheckResult = FrameResult<std::monostate>;

/**
 * @brief Stable name of an error, for logs and test output
 */
[[nodiscard]] std::string_view ToString(FrameError error) noexcept;

/**
 * @brief Error held by a result, if any
 */
template <typename T>
[[nodiscard]] constexpr const FrameError *GetError(const FrameResult<T> &result) noexcept {
  return std::get_if<FrameError>(&result);
}

}  // namespace mbframer
