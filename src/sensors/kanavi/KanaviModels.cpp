#include "KanaviModels.h"
#include <cstdio>

std::vector<ModelConfig> KanaviModelTable::builtinModels() {
  std::vector<ModelConfig> v;

  ModelConfig r2;
  r2.product_line = 0x03; r2.name = "VL-R2"; r2.channels = 2; r2.hfov_deg = 120.0f;
  r2.points_per_channel = 360; r2.interface_label = "Ethernet";
  r2.vertical_angles_deg = {-0.5f, 0.5f};
  v.push_back(r2);

  ModelConfig r4;
  r4.product_line = 0x06; r4.name = "VL-R4"; r4.channels = 4; r4.hfov_deg = 100.0f;
  r4.points_per_channel = 400; r4.interface_label = "Ethernet";
  r4.vertical_angles_deg = {-1.5f, -0.5f, 0.5f, 1.5f};
  v.push_back(r4);

  ModelConfig r270;
  r270.product_line = 0x07; r270.name = "VL-R270"; r270.channels = 1; r270.hfov_deg = 270.0f;
  r270.points_per_channel = 360; r270.interface_label = "Ethernet";
  v.push_back(r270);

  return v;
}

KanaviModelTable::KanaviModelTable() : KanaviModelTable(std::vector<ModelConfig>{}) {}

KanaviModelTable::KanaviModelTable(const std::vector<ModelConfig>& models) {
  ordered_ = builtinModels();
  // configured entries replace built-in ones with the same product_line
  for (const auto& m : models) {
    bool replaced = false;
    for (auto& cur : ordered_) {
      if (cur.product_line == m.product_line) { cur = m; replaced = true; break; }
    }
    if (!replaced) ordered_.push_back(m);
  }
  for (size_t i = 0; i < ordered_.size(); ++i) {
    by_line_[ordered_[i].product_line] = i;
    by_name_[ordered_[i].name] = i;
  }
}

const KanaviModelTable& KanaviModelTable::builtin() {
  static const KanaviModelTable t;
  return t;
}

bool KanaviModelTable::contains(uint8_t product_line) const {
  return by_line_.count(product_line) != 0;
}

ModelConfig KanaviModelTable::lookup(uint8_t product_line) const {
  auto it = by_line_.find(product_line);
  if (it != by_line_.end()) return ordered_[it->second];

  ModelConfig fallback;
  char name[16];
  std::snprintf(name, sizeof(name), "Unknown_%02X", static_cast<unsigned>(product_line));
  fallback.product_line = product_line;
  fallback.name = name;
  fallback.channels = 4;
  fallback.hfov_deg = 360.0f;
  fallback.points_per_channel = kDefaultPoints;
  fallback.interface_label = "Unknown";
  return fallback;
}

float KanaviModelTable::verticalAngle(const std::string& model_name, int channel) const {
  auto it = by_name_.find(model_name);
  if (it == by_name_.end()) return 0.0f;
  const auto& angles = ordered_[it->second].vertical_angles_deg;
  if (channel < 0 || channel >= static_cast<int>(angles.size())) return 0.0f;
  return angles[static_cast<size_t>(channel)];
}
