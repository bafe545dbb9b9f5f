#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct RawDatagram {
  std::vector<uint8_t> bytes;
  std::string source_ip{""};
  std::chrono::system_clock::time_point received_at{};
};

struct PointSample {
  int channel{0};
  float distance_m{0.0f};
  float azimuth_deg{0.0f};
  uint8_t detection{0};
  int index{0};
};

/**
 * One decoded single-channel scan.
 *
 * points are ordered by index and every point carries the frame's channel.
 * Frames are moved between pipeline stages, never shared.
 */
struct DecodedFrame {
  std::string model_name{""};
  int channels_expected{0};
  float hfov_deg{0.0f};
  int channel{0};
  std::vector<PointSample> points;
  float vertical_angle_deg{0.0f};
  std::string source_ip{""};
  uint8_t lidar_id{0};
  uint8_t product_line{0};
  std::chrono::system_clock::time_point timestamp{};

  // diagnostics
  uint16_t raw_command{0};
  size_t packet_size{0};
  uint16_t data_length{0};
  int expected_points{0};
  int invalid_points{0};   // distance <= 0, dropped from points
};
