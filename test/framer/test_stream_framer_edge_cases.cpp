#include <gtest/gtest.h>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>
#include "framer/framer_test_helpers.hpp"
#include "modbus_framer/common/frame_error.hpp"
#include "modbus_framer/common/log.hpp"
#include "modbus_framer/framer/stream_framer.hpp"
#include "modbus_framer/rtu/rtu_modbus.hpp"
#include "modbus_framer/tcp/tcp_modbus.hpp"
#include "rtu/rtu_test_rules.hpp"
#include "tcp/tcp_test_adus.hpp"

using mbframer::FrameError;
using mbframer::FrameResult;
using mbframer::kFramerBufferLength;
using mbframer::LogLevel;
using mbframer::RtuModbus;
using mbframer::SetLogSink;
using mbframer::StreamFramer;
using mbframer::TcpHeader;
using mbframer::TcpModbus;
using mbframer::test::GetFrame;
using mbframer::test::IsError;
using mbframer::test::kAdu1Header;
using mbframer::test::kAdu1Tcp;
using mbframer::test::NeverSizedRules;
using mbframer::test::ToVector;

namespace {

// Largest legal TCP ADU: length field 254, unit id 0x05, PDU bytes 0..252
std::vector<uint8_t> MaxTcpAdu() {
  std::vector<uint8_t> adu{0x00, 0x07, 0x00, 0x00, 0x00, 0xFE, 0x05};
  for (size_t i = 0; i < TcpModbus::kPduMaxLength; ++i) {
    adu.push_back(static_cast<uint8_t>(i));
  }
  return adu;
}

/**
 * @brief Contract whose reported length shrinks once more bytes arrive
 */
struct ShrinkingProtocol {
  struct Header {
    bool operator==(const Header &) const = default;
  };
  static constexpr size_t kAduMaxLength = 16;

  static FrameResult<size_t> AduLength(std::span<const uint8_t> data) {
    return data.size() < 8 ? size_t{10} : size_t{3};
  }
  static FrameResult<Header> AduHeader(std::span<const uint8_t>) { return Header{}; }
  static mbframer::CheckResult AduCheck(std::span<const uint8_t>) { return std::monostate{}; }
  static FrameResult<std::span<const uint8_t>> PduBody(std::span<const uint8_t> data) { return data; }
};

std::vector<std::string> g_warnings;

void WarningSink(LogLevel level, const char *message) {
  if (level == LogLevel::kWarning) {
    g_warnings.emplace_back(message);
  }
}

}  // namespace

TEST(StreamFramerEdgeCases, BufferFitsLargestAdu) {
  EXPECT_EQ(kFramerBufferLength, TcpModbus::kAduMaxLength);
  EXPECT_GE(kFramerBufferLength, mbframer::kRtuAduMaxLength);
}

TEST(StreamFramerEdgeCases, MaxLengthAduInOneCall) {
  const auto adu = MaxTcpAdu();
  ASSERT_EQ(adu.size(), TcpModbus::kAduMaxLength);
  StreamFramer<TcpModbus> framer;

  auto result = framer.Process(adu);
  const auto *frame = GetFrame(result);
  ASSERT_NE(frame, nullptr);
  EXPECT_EQ(frame->packet.header, (TcpHeader{7, 0, 254, 5}));
  EXPECT_EQ(frame->packet.pdu.size(), TcpModbus::kPduMaxLength);
  EXPECT_EQ(frame->packet.pdu.back(), 252);
  EXPECT_TRUE(frame->leftover.empty());
}

TEST(StreamFramerEdgeCases, ChunkLargerThanBufferReturnsSurplus) {
  auto input = MaxTcpAdu();
  input.insert(input.end(), kAdu1Tcp.begin(), kAdu1Tcp.end());
  StreamFramer<TcpModbus> framer;

  auto result = framer.Process(input);
  const auto *frame = GetFrame(result);
  ASSERT_NE(frame, nullptr);
  EXPECT_EQ(frame->packet.pdu.size(), TcpModbus::kPduMaxLength);
  EXPECT_EQ(ToVector(frame->leftover), ToVector(kAdu1Tcp));

  result = framer.Process(frame->leftover);
  frame = GetFrame(result);
  ASSERT_NE(frame, nullptr);
  EXPECT_EQ(frame->packet.header, kAdu1Header);
  EXPECT_TRUE(frame->leftover.empty());
}

TEST(StreamFramerEdgeCases, ChunkOverflowingPartialBufferReturnsSurplus) {
  auto input = MaxTcpAdu();
  input.insert(input.end(), kAdu1Tcp.begin(), kAdu1Tcp.end());
  std::span<const uint8_t> stream(input);
  StreamFramer<TcpModbus> framer;

  EXPECT_TRUE(IsError(framer.Process(stream.first(100)), FrameError::kNotEnoughData));
  EXPECT_EQ(framer.Used(), 100u);

  auto result = framer.Process(stream.subspan(100));
  const auto *frame = GetFrame(result);
  ASSERT_NE(frame, nullptr);
  EXPECT_EQ(frame->packet.header, (TcpHeader{7, 0, 254, 5}));
  EXPECT_EQ(frame->leftover.data(), stream.data() + TcpModbus::kAduMaxLength);
  EXPECT_EQ(frame->leftover.size(), kAdu1Tcp.size());
}

TEST(StreamFramerEdgeCases, FullBufferThatCannotBeSizedIsDiscarded) {
  StreamFramer<RtuModbus<NeverSizedRules>> framer;
  std::vector<uint8_t> noise(kFramerBufferLength - 1, 0x55);

  EXPECT_TRUE(IsError(framer.Process(noise), FrameError::kNotEnoughData));
  EXPECT_EQ(framer.Used(), kFramerBufferLength - 1);

  std::vector<uint8_t> more(5, 0x55);
  EXPECT_TRUE(IsError(framer.Process(more), FrameError::kBadLength));
  EXPECT_EQ(framer.Used(), 0u);
  EXPECT_EQ(framer.GetStats().frames_discarded, 1u);
  EXPECT_EQ(framer.GetStats().bytes_discarded, kFramerBufferLength);
}

TEST(StreamFramerEdgeCases, ZeroLengthFieldIsDiscarded) {
  StreamFramer<TcpModbus> framer;
  std::vector<uint8_t> header{0x00, 0x01, 0x00, 0x00, 0x00, 0x00};

  EXPECT_TRUE(IsError(framer.Process(header), FrameError::kBadLength));
  EXPECT_EQ(framer.Used(), 0u);
}

TEST(StreamFramerEdgeCases, ShrinkingLengthIsDiscarded) {
  StreamFramer<ShrinkingProtocol> framer;
  std::vector<uint8_t> chunk(5, 0x01);

  EXPECT_TRUE(IsError(framer.Process(chunk), FrameError::kNotEnoughData));
  EXPECT_TRUE(IsError(framer.Process(chunk), FrameError::kBadLength));
  EXPECT_EQ(framer.Used(), 0u);
  EXPECT_EQ(framer.GetStats().bytes_discarded, 10u);
}

TEST(StreamFramerEdgeCases, EmptyInputKeepsState) {
  StreamFramer<TcpModbus> framer;
  std::span<const uint8_t> adu(kAdu1Tcp);

  EXPECT_TRUE(IsError(framer.Process(std::span<const uint8_t>{}), FrameError::kNotEnoughData));
  EXPECT_TRUE(IsError(framer.Process(adu.first(4)), FrameError::kNotEnoughData));
  EXPECT_TRUE(IsError(framer.Process(std::span<const uint8_t>{}), FrameError::kNotEnoughData));
  EXPECT_EQ(framer.Used(), 4u);

  auto result = framer.Process(adu.subspan(4));
  ASSERT_NE(GetFrame(result), nullptr);
}

TEST(StreamFramerEdgeCases, NextCallAfterPacketStartsFresh) {
  StreamFramer<TcpModbus> framer;
  auto result = framer.Process(kAdu1Tcp);
  ASSERT_NE(GetFrame(result), nullptr);
  EXPECT_EQ(framer.Used(), kAdu1Tcp.size());

  std::span<const uint8_t> adu(kAdu1Tcp);
  EXPECT_TRUE(IsError(framer.Process(adu.first(2)), FrameError::kNotEnoughData));
  EXPECT_EQ(framer.Used(), 2u);
}

TEST(StreamFramerEdgeCases, StatsCountPacketsAndDiscards) {
  StreamFramer<TcpModbus> framer;
  std::vector<uint8_t> bad{0x00, 0x01, 0x00, 0x00, 0x01, 0x00};

  ASSERT_NE(GetFrame(framer.Process(kAdu1Tcp)), nullptr);
  EXPECT_TRUE(IsError(framer.Process(bad), FrameError::kBadLength));
  ASSERT_NE(GetFrame(framer.Process(kAdu1Tcp)), nullptr);

  const auto &stats = framer.GetStats();
  EXPECT_EQ(stats.packets_decoded, 2u);
  EXPECT_EQ(stats.frames_discarded, 1u);
  EXPECT_EQ(stats.bytes_discarded, bad.size());

  framer.Reset();
  EXPECT_EQ(framer.GetStats().packets_decoded, 2u);
}

#ifndef MODBUS_FRAMER_DISABLE_LOGGING

TEST(StreamFramerEdgeCases, DiscardLogsWarning) {
  g_warnings.clear();
  SetLogSink(&WarningSink);

  StreamFramer<TcpModbus> framer;
  std::vector<uint8_t> bad{0x00, 0x01, 0x00, 0x00, 0x01, 0x00, 0x11};
  EXPECT_TRUE(IsError(framer.Process(bad), FrameError::kBadLength));
  ASSERT_NE(GetFrame(framer.Process(kAdu1Tcp)), nullptr);

  SetLogSink(nullptr);
  ASSERT_EQ(g_warnings.size(), 1u);
  EXPECT_NE(g_warnings[0].find("discarding 7 buffered bytes: BadLength"), std::string::npos);
}

#endif  // MODBUS_FRAMER_DISABLE_LOGGING
