#pragma once
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>
#include "core/frame.h"
#include "KanaviModels.h"

/*
 * VL-series distance datagram (big endian):
 *
 *   [0]      0xFA start marker
 *   [1]      product_line
 *   [2]      lidar_id
 *   [3..4]   command   0xDD 0xCn  (n = channel 0..15)
 *   [5..6]   data_length
 *   [7..]    payload   2 bytes/point (meters, centimeters) + optional detection block
 *   [7+len]  checksum  XOR of bytes 0..6
 */
namespace kanavi {

constexpr uint8_t kStartMarker    = 0xFA;
constexpr uint8_t kDistanceTag    = 0xDD;
constexpr uint8_t kChannelTag     = 0xC0;
constexpr size_t  kHeaderSize     = 7;
constexpr size_t  kMinPacketSize  = 8;

enum class DecodeError {
  BadHeader,
  NotDistanceData,
  Truncated,
  ChecksumError,
};

const char* toString(DecodeError e);

struct DecodeResult {
  std::variant<DecodedFrame, DecodeError> value{DecodeError::BadHeader};

  bool isFrame() const { return std::holds_alternative<DecodedFrame>(value); }
  bool isError() const { return std::holds_alternative<DecodeError>(value); }
  DecodedFrame& frame() { return std::get<DecodedFrame>(value); }
  const DecodedFrame& frame() const { return std::get<DecodedFrame>(value); }
  DecodeError error() const { return std::get<DecodeError>(value); }
};

// XOR of the 7 header bytes; caller guarantees len >= kHeaderSize.
uint8_t headerChecksum(const uint8_t* data);

// Never throws on malformed input; every failure is a DecodeError.
DecodeResult decodePacket(const uint8_t* data, size_t len, const KanaviModelTable& models);
DecodeResult decodePacket(const std::vector<uint8_t>& bytes,
                          const KanaviModelTable& models = KanaviModelTable::builtin());

} // namespace kanavi
