#include "KanaviPacketDecoder.h"

namespace kanavi {

namespace {

inline uint16_t read_be16(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

DecodeResult reject(DecodeError e) {
  DecodeResult r;
  r.value = e;
  return r;
}

} // namespace

const char* toString(DecodeError e) {
  switch (e) {
    case DecodeError::BadHeader:       return "BadHeader";
    case DecodeError::NotDistanceData: return "NotDistanceData";
    case DecodeError::Truncated:       return "Truncated";
    case DecodeError::ChecksumError:   return "ChecksumError";
  }
  return "Unknown";
}

uint8_t headerChecksum(const uint8_t* data) {
  uint8_t x = 0;
  for (size_t i = 0; i < kHeaderSize; ++i) x ^= data[i];
  return x;
}

DecodeResult decodePacket(const uint8_t* data, size_t len, const KanaviModelTable& models) {
  if (data == nullptr || len < kMinPacketSize) return reject(DecodeError::BadHeader);
  if (data[0] != kStartMarker) return reject(DecodeError::BadHeader);

  const uint8_t product_line = data[1];
  const uint8_t lidar_id     = data[2];
  const uint16_t command     = read_be16(data + 3);
  const uint16_t data_length = read_be16(data + 5);

  if ((command >> 8) != kDistanceTag) return reject(DecodeError::NotDistanceData);
  const uint8_t channel_byte = static_cast<uint8_t>(command & 0xFF);
  if ((channel_byte & 0xF0) != kChannelTag) return reject(DecodeError::NotDistanceData);
  const int channel = channel_byte & 0x0F;

  const size_t payload_end = kHeaderSize + data_length;
  if (len < payload_end + 1) return reject(DecodeError::Truncated);

  // checksum covers the header only, not the distance payload
  if (headerChecksum(data) != data[payload_end]) return reject(DecodeError::ChecksumError);

  const ModelConfig model = models.lookup(product_line);

  DecodeResult out;
  out.value = DecodedFrame{};
  DecodedFrame& f = out.frame();
  f.model_name        = model.name;
  f.channels_expected = model.channels;
  f.hfov_deg          = model.hfov_deg;
  f.channel           = channel;
  f.vertical_angle_deg = models.verticalAngle(model.name, channel);
  f.lidar_id          = lidar_id;
  f.product_line      = product_line;
  f.raw_command       = command;
  f.packet_size       = len;
  f.data_length       = data_length;

  const int expected = model.points_per_channel > 0 ? model.points_per_channel
                                                    : KanaviModelTable::kDefaultPoints;
  f.expected_points = expected;

  const uint8_t* payload = data + kHeaderSize;
  const size_t distance_bytes = static_cast<size_t>(expected) * 2;
  if (data_length < distance_bytes) {
    return out; // short payload: frame without points
  }

  // Trailing detection block, read modulo its length when shorter than the
  // point count. Not verified against real device framing.
  const uint8_t* detection_block = payload + distance_bytes;
  const size_t detection_len = data_length - distance_bytes;

  const double hfov = model.hfov_deg;
  f.points.reserve(static_cast<size_t>(expected));
  for (int i = 0; i < expected; ++i) {
    const uint8_t d_int  = payload[i * 2];
    const uint8_t d_frac = payload[i * 2 + 1];
    const double distance = static_cast<double>(d_int) + static_cast<double>(d_frac) / 100.0;

    if (distance <= 0.0) {
      ++f.invalid_points;
      continue;
    }

    const double azimuth = expected > 1
        ? -hfov / 2.0 + static_cast<double>(i) * hfov / static_cast<double>(expected - 1)
        : 0.0;

    PointSample p;
    p.channel     = channel;
    p.distance_m  = static_cast<float>(distance);
    p.azimuth_deg = static_cast<float>(azimuth);
    p.detection   = detection_len > 0 ? detection_block[static_cast<size_t>(i) % detection_len] : 0;
    p.index       = i;
    f.points.push_back(p);
  }
  return out;
}

DecodeResult decodePacket(const std::vector<uint8_t>& bytes, const KanaviModelTable& models) {
  return decodePacket(bytes.data(), bytes.size(), models);
}

} // namespace kanavi
