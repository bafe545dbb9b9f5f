#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "config/config.h"

/**
 * VL-series model table.
 *
 * Plain immutable mapping product_line -> ModelConfig. Unknown product lines
 * resolve to a generic 4ch / 360deg entry named "Unknown_<HH>".
 */
class KanaviModelTable {
public:
  KanaviModelTable();                                      // built-in table
  explicit KanaviModelTable(const std::vector<ModelConfig>& models);

  static const KanaviModelTable& builtin();
  static std::vector<ModelConfig> builtinModels();

  bool contains(uint8_t product_line) const;
  ModelConfig lookup(uint8_t product_line) const;
  const std::vector<ModelConfig>& models() const { return ordered_; }

  // (model_name, channel) -> vertical angle [deg], 0.0 when unknown
  float verticalAngle(const std::string& model_name, int channel) const;

  static constexpr int kDefaultPoints = 360;

private:
  std::vector<ModelConfig> ordered_;
  std::unordered_map<uint8_t, size_t> by_line_;
  std::unordered_map<std::string, size_t> by_name_;
};
