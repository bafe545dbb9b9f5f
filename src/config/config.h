#pragma once
#include <cstdint>
#include <string>
#include <vector>

// One entry of the VL-series model table (keyed by the product_line byte).
struct ModelConfig {
  uint8_t product_line{0};
  std::string name{""};
  int channels{4};
  float hfov_deg{360.0f};
  int points_per_channel{360};
  std::string interface_label{"Unknown"};
  std::vector<float> vertical_angles_deg; // index = channel, missing = 0.0
};

struct ReceiverConfig {
  std::string multicast_group{"224.0.0.5"};
  std::string multicast_interface{"0.0.0.0"}; // local address to join on, 0.0.0.0 = kernel's choice
  int port{5000};
  int poll_timeout_ms{200};       // recv timeout, bounds stop() latency
  int recv_buffer_size{2048};
  int rate_limit_ms{50};          // per-channel minimum interval (20Hz)
  std::vector<ModelConfig> models; // empty => built-in table
};

struct PipelineConfig {
  int queue_capacity{256};
  int idle_sleep_ms{10};
};

struct UiConfig {
  std::string listen{"0.0.0.0:8765"};
  std::string log_level{"info"};
};

struct AppConfig {
  ReceiverConfig receiver{};
  PipelineConfig pipeline{};
  UiConfig ui{};
};

AppConfig load_app_config(const std::string& path);
AppConfig parse_app_config(const std::string& yaml_text);
std::string dump_app_config(const AppConfig& cfg);

// "host:port" -> host, port (1..65535). An empty host keeps the current one.
bool parse_listen_address(const std::string& text, std::string& host, uint16_t& port, std::string& err);
