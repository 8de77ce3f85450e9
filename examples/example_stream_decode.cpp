/**
 * @file example_stream_decode.cpp
 * @brief Decode Modbus TCP ADUs from a fragmented byte stream
 *
 * A socket rarely hands over one ADU per read. This example replays a canned capture in uneven
 * chunks, the way a receive loop would see it, and prints every packet the framer recovers.
 * A corrupt header in the middle of the stream shows how the framer discards and resynchronizes.
 */

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <span>
#include <variant>
#include <vector>
#include "modbus_framer/common/coil_packing.hpp"
#include "modbus_framer/common/frame_error.hpp"
#include "modbus_framer/common/log.hpp"
#include "modbus_framer/framer/stream_framer.hpp"
#include "modbus_framer/tcp/tcp_modbus.hpp"

namespace {

void StderrSink(mbframer::LogLevel level, const char *message) {
  std::fprintf(stderr, "%s %s\n", level == mbframer::LogLevel::kWarning ? "WARN " : "DEBUG", message);
}

void PrintPacket(const mbframer::Packet<mbframer::TcpModbus> &packet) {
  std::cout << "  transaction " << packet.header.transaction_id << ", unit " << static_cast<int>(packet.header.unit_id)
            << ", PDU:";
  for (uint8_t byte : packet.pdu) {
    std::cout << ' ' << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte) << std::dec;
  }
  std::cout << '\n';
}

}  // namespace

int main() {
  using mbframer::Coil;
  using mbframer::DecodedFrame;
  using mbframer::FrameError;
  using mbframer::StreamFramer;
  using mbframer::TcpModbus;

  std::cout << "=== Modbus TCP Stream Decode Example ===\n\n";

  mbframer::SetLogSink(&StderrSink);

  // Read coils response carrying 10 coil states
  std::vector<Coil> coils{Coil::kOn,  Coil::kOff, Coil::kOn, Coil::kOn,  Coil::kOff,
                          Coil::kOff, Coil::kOn,  Coil::kOn, Coil::kOff, Coil::kOn};
  std::vector<uint8_t> coil_bytes(mbframer::BytesNeeded(coils.size()));
  mbframer::PackCoils(coils, coil_bytes);

  std::vector<uint8_t> capture{
      // Read holding registers request, transaction 1
      0x00, 0x01, 0x00, 0x00, 0x00, 0x06, 0x11, 0x03, 0x00, 0x6B, 0x00, 0x03,
      // Corrupt header: length field 0x0400 is out of range
      0x00, 0x02, 0x00, 0x00, 0x04, 0x00, 0x11,
  };
  // Read coils response, transaction 3
  std::vector<uint8_t> coils_adu{0x00, 0x03, 0x00, 0x00, 0x00, static_cast<uint8_t>(3 + coil_bytes.size()),
                                 0x11, 0x01, static_cast<uint8_t>(coil_bytes.size())};
  coils_adu.insert(coils_adu.end(), coil_bytes.begin(), coil_bytes.end());
  capture.insert(capture.end(), coils_adu.begin(), coils_adu.end());

  StreamFramer<TcpModbus> framer;
  std::span<const uint8_t> stream(capture);
  const size_t chunk_sizes[] = {5, 9, 5, 3, 20};

  size_t offset = 0;
  for (size_t chunk_size : chunk_sizes) {
    if (offset >= stream.size()) {
      break;
    }
    std::span<const uint8_t> pending = stream.subspan(offset, std::min(chunk_size, stream.size() - offset));
    offset += pending.size();
    std::cout << "Read " << pending.size() << " bytes\n";

    // Drain the chunk: each call yields at most one packet
    while (true) {
      auto result = framer.Process(pending);
      if (const auto *error = std::get_if<FrameError>(&result)) {
        if (*error != FrameError::kNotEnoughData) {
          std::cout << "  stream error: " << mbframer::ToString(*error) << '\n';
        }
        break;
      }
      const auto &frame = std::get<DecodedFrame<TcpModbus>>(result);
      PrintPacket(frame.packet);

      // Unpack the coil states of a read coils response
      if (frame.packet.pdu.size() >= 2 && frame.packet.pdu[0] == 0x01) {
        std::vector<Coil> decoded(coils.size());
        mbframer::UnpackCoils(frame.packet.pdu.subspan(2), decoded);
        std::cout << "  coils:";
        for (Coil coil : decoded) {
          std::cout << ' ' << (coil == Coil::kOn ? 1 : 0);
        }
        std::cout << '\n';
      }

      if (frame.leftover.empty()) {
        break;
      }
      pending = frame.leftover;
    }
  }

  const auto &stats = framer.GetStats();
  std::cout << "\nDecoded " << stats.packets_decoded << " packets, discarded " << stats.frames_discarded
            << " frames (" << stats.bytes_discarded << " bytes)\n";

  mbframer::SetLogSink(nullptr);
  return 0;
}
