#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>
#include "../common/frame_error.hpp"
#include "../common/log.hpp"
#include "protocol_contract.hpp"

namespace mbframer {

/**
 * @brief One decoded ADU
 *
 * pdu points into the framer's buffer and is only valid until the next call to
 * StreamFramer::Process or StreamFramer::Reset. Copy it out if it has to live longer.
 */
template <typename Protocol>
struct Packet {
  typename Protocol::Header header{};
  std::span<const uint8_t> pdu{};
};

/**
 * @brief A packet plus the part of the caller's input that was not consumed
 *
 * leftover is a suffix of the span passed to Process (never of the framer buffer); feed it back
 * to Process to decode the next ADU.
 */
template <typename Protocol>
struct DecodedFrame {
  Packet<Protocol> packet{};
  std::span<const uint8_t> leftover{};
};

/**
 * @brief Running totals of what a framer has produced and thrown away
 */
struct FramerStats {
  uint64_t packets_decoded{0};
  uint64_t frames_discarded{0};  // Destructive errors
  uint64_t bytes_discarded{0};   // Buffered bytes dropped by those errors
};

/**
 * @brief Turns a byte stream of any fragmentation into Modbus ADUs
 *
 * Feed every chunk read from the transport to Process. Each call returns either
 * - one decoded ADU and the unconsumed rest of the chunk (possibly empty), which must be fed back
 *   to Process before reading more from the transport, or
 * - kNotEnoughData: the bytes were buffered, read more, or
 * - any other FrameError: everything buffered was corrupt and has been discarded.
 *
 * The framer owns one fixed buffer of kFramerBufferLength bytes and never allocates. It is not
 * thread-safe; use one framer per stream.
 *
 * @tparam Protocol Protocol contract (TcpModbus, RtuModbus<Rules>, ...)
 */
template <typename Protocol>
class StreamFramer {
  static_assert(Protocol::kAduMaxLength <= kFramerBufferLength,
                "Protocol ADUs do not fit the framer buffer; raise kFramerBufferLength");

 public:
  using Header = typename Protocol::Header;
  using ProcessResult = std::variant<DecodedFrame<Protocol>, FrameError>;

  StreamFramer() = default;

  /**
   * @brief Add received bytes and try to extract one ADU
   * @param data Bytes just read from the transport, or the leftover of the previous call
   * @return Decoded frame and leftover, or the reason no frame is available
   */
  [[nodiscard]] ProcessResult Process(std::span<const uint8_t> data);

  /**
   * @brief Drop any buffered bytes, e.g. after the transport reconnected
   */
  void Reset() noexcept {
    size_used_ = 0;
    contains_complete_ = false;
  }

  /**
   * @brief Number of bytes currently buffered
   */
  [[nodiscard]] size_t Used() const noexcept { return size_used_; }

  [[nodiscard]] const FramerStats &GetStats() const noexcept { return stats_; }

 private:
  [[nodiscard]] size_t SpaceLeft() const noexcept { return buffer_.size() - size_used_; }
  [[nodiscard]] std::span<const uint8_t> Buffered() const noexcept { return {buffer_.data(), size_used_}; }

  void Append(std::span<const uint8_t> data) noexcept;
  [[nodiscard]] FrameError Discard(FrameError error) noexcept;

  // Invariant: if the buffer holds a complete ADU, contains_complete_ is set and size_used_ is
  // exactly its length
  std::array<uint8_t, kFramerBufferLength> buffer_{};
  size_t size_used_{0};
  bool contains_complete_{false};
  FramerStats stats_{};
};

template <typename Protocol>
void StreamFramer<Protocol>::Append(std::span<const uint8_t> data) noexcept {
  std::copy(data.begin(), data.end(), buffer_.begin() + static_cast<std::ptrdiff_t>(size_used_));
  size_used_ += data.size();
}

template <typename Protocol>
FrameError StreamFramer<Protocol>::Discard(FrameError error) noexcept {
  MODBUS_FRAMER_LOG_WARNING("discarding %zu buffered bytes: %s", size_used_, ToString(error).data());
  ++stats_.frames_discarded;
  stats_.bytes_discarded += size_used_;
  Reset();
  return error;
}

template <typename Protocol>
typename StreamFramer<Protocol>::ProcessResult StreamFramer<Protocol>::Process(std::span<const uint8_t> data) {
  // The previous ADU was handed out; start over
  if (contains_complete_) {
    Reset();
  }

  const size_t original_size = size_used_;
  Append(data.first(std::min(SpaceLeft(), data.size())));

  FrameResult<size_t> length = Protocol::AduLength(Buffered());
  if (const auto *error = GetError(length)) {
    if (*error != FrameError::kNotEnoughData) {
      return Discard(*error);
    }
    // A full buffer that still cannot be sized will never become an ADU
    if (SpaceLeft() == 0) {
      return Discard(FrameError::kBadLength);
    }
    return FrameError::kNotEnoughData;
  }

  const size_t adu_length = std::get<size_t>(length);
  if (size_used_ < adu_length) {
    return FrameError::kNotEnoughData;
  }

  // Earlier calls only buffered bytes short of an ADU, so the ADU ends inside this call's data.
  // A contract whose length shrinks as bytes arrive breaks that.
  if (adu_length < original_size) {
    return Discard(FrameError::kBadLength);
  }
  const size_t remaining_index = adu_length - original_size;

  const auto adu = Buffered().first(adu_length);
  auto pdu = Protocol::PduBody(adu);
  if (const auto *error = GetError(pdu)) {
    return Discard(*error);
  }
  auto header = Protocol::AduHeader(adu);
  if (const auto *error = GetError(header)) {
    return Discard(*error);
  }

  // Surplus bytes past the ADU go back to the caller through leftover
  contains_complete_ = true;
  size_used_ = adu_length;
  ++stats_.packets_decoded;
  MODBUS_FRAMER_LOG_DEBUG("decoded %zu byte ADU, %zu bytes left over", adu_length, data.size() - remaining_index);

  DecodedFrame<Protocol> frame;
  frame.packet.header = std::get<Header>(header);
  frame.packet.pdu = std::get<std::span<const uint8_t>>(pdu);
  frame.leftover = data.subspan(remaining_index);
  return frame;
}

}  // namespace mbframer
