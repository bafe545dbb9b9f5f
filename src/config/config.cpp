#include "config.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <iostream>

static int clampi(int v, int lo, int hi){ return std::max(lo, std::min(hi, v)); }

static std::vector<ModelConfig> parseModels(const YAML::Node& ms) {
  std::vector<ModelConfig> out;
  if (!ms || !ms.IsSequence()) return out;
  out.reserve(ms.size());
  for (const auto& m : ms) {
    ModelConfig c;
    if (!m["product_line"]) {
      std::cerr << "[Config] model entry without product_line skipped" << std::endl;
      continue;
    }
    c.product_line = static_cast<uint8_t>(clampi(m["product_line"].as<int>(0), 0, 255));
    if (m["name"])      c.name               = m["name"].as<std::string>(c.name);
    if (m["channels"])  c.channels           = clampi(m["channels"].as<int>(c.channels), 1, 16);
    if (m["hfov"])      c.hfov_deg           = std::max(0.0f, m["hfov"].as<float>(c.hfov_deg));
    if (m["points"])    c.points_per_channel = std::max(1, m["points"].as<int>(c.points_per_channel));
    if (m["interface"]) c.interface_label    = m["interface"].as<std::string>(c.interface_label);
    if (auto va = m["vertical_angles"]) {
      if (va.IsSequence()) {
        for (const auto& a : va) c.vertical_angles_deg.push_back(a.as<float>());
      }
    }
    if (c.name.empty()) {
      std::cerr << "[Config] model entry 0x" << std::hex << int(c.product_line) << std::dec
                << " has no name, skipped" << std::endl;
      continue;
    }
    out.push_back(std::move(c));
  }
  return out;
}

static AppConfig from_node(const YAML::Node& y) {
  AppConfig cfg;

  if (auto r = y["receiver"]) {
    if (r["multicast_group"])  cfg.receiver.multicast_group  = r["multicast_group"].as<std::string>(cfg.receiver.multicast_group);
    if (r["multicast_interface"]) cfg.receiver.multicast_interface = r["multicast_interface"].as<std::string>(cfg.receiver.multicast_interface);
    if (r["port"])             cfg.receiver.port             = clampi(r["port"].as<int>(cfg.receiver.port), 1, 65535);
    if (r["poll_timeout_ms"])  cfg.receiver.poll_timeout_ms  = clampi(r["poll_timeout_ms"].as<int>(cfg.receiver.poll_timeout_ms), 10, 5000);
    if (r["recv_buffer_size"]) cfg.receiver.recv_buffer_size = clampi(r["recv_buffer_size"].as<int>(cfg.receiver.recv_buffer_size), 8, 65536);
  }

  if (auto p = y["pipeline"]) {
    if (p["rate_limit_ms"])  cfg.receiver.rate_limit_ms   = std::max(0, p["rate_limit_ms"].as<int>(cfg.receiver.rate_limit_ms));
    if (p["queue_capacity"]) cfg.pipeline.queue_capacity  = clampi(p["queue_capacity"].as<int>(cfg.pipeline.queue_capacity), 1, 65536);
    if (p["idle_sleep_ms"])  cfg.pipeline.idle_sleep_ms   = clampi(p["idle_sleep_ms"].as<int>(cfg.pipeline.idle_sleep_ms), 1, 1000);
  }

  if (auto u = y["ui"]) {
    if (u["listen"])    cfg.ui.listen    = u["listen"].as<std::string>(cfg.ui.listen);
    if (u["log_level"]) cfg.ui.log_level = u["log_level"].as<std::string>(cfg.ui.log_level);
  }

  cfg.receiver.models = parseModels(y["models"]);
  return cfg;
}

AppConfig load_app_config(const std::string& path){
  return from_node(YAML::LoadFile(path));
}

AppConfig parse_app_config(const std::string& yaml_text){
  return from_node(YAML::Load(yaml_text));
}

std::string dump_app_config(const AppConfig& cfg) {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "receiver" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "multicast_group" << YAML::Value << cfg.receiver.multicast_group;
  out << YAML::Key << "multicast_interface" << YAML::Value << cfg.receiver.multicast_interface;
  out << YAML::Key << "port" << YAML::Value << cfg.receiver.port;
  out << YAML::Key << "poll_timeout_ms" << YAML::Value << cfg.receiver.poll_timeout_ms;
  out << YAML::Key << "recv_buffer_size" << YAML::Value << cfg.receiver.recv_buffer_size;
  out << YAML::EndMap;

  out << YAML::Key << "pipeline" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "rate_limit_ms" << YAML::Value << cfg.receiver.rate_limit_ms;
  out << YAML::Key << "queue_capacity" << YAML::Value << cfg.pipeline.queue_capacity;
  out << YAML::Key << "idle_sleep_ms" << YAML::Value << cfg.pipeline.idle_sleep_ms;
  out << YAML::EndMap;

  out << YAML::Key << "ui" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "listen" << YAML::Value << cfg.ui.listen;
  out << YAML::Key << "log_level" << YAML::Value << cfg.ui.log_level;
  out << YAML::EndMap;

  if (!cfg.receiver.models.empty()) {
    out << YAML::Key << "models" << YAML::Value << YAML::BeginSeq;
    for (const auto& m : cfg.receiver.models) {
      out << YAML::BeginMap;
      out << YAML::Key << "product_line" << YAML::Value << int(m.product_line);
      out << YAML::Key << "name" << YAML::Value << m.name;
      out << YAML::Key << "channels" << YAML::Value << m.channels;
      out << YAML::Key << "hfov" << YAML::Value << m.hfov_deg;
      out << YAML::Key << "points" << YAML::Value << m.points_per_channel;
      out << YAML::Key << "interface" << YAML::Value << m.interface_label;
      out << YAML::Key << "vertical_angles" << YAML::Value << YAML::Flow << m.vertical_angles_deg;
      out << YAML::EndMap;
    }
    out << YAML::EndSeq;
  }

  out << YAML::EndMap;
  return std::string(out.c_str());
}

bool parse_listen_address(const std::string& text, std::string& host, uint16_t& port, std::string& err) {
  const auto pos = text.rfind(':');
  if (pos == std::string::npos) {
    err = "expected host:port, got '" + text + "'";
    return false;
  }
  const std::string p = text.substr(pos + 1);
  if (p.empty() || p.find_first_not_of("0123456789") != std::string::npos || p.size() > 5) {
    err = "invalid port '" + p + "'";
    return false;
  }
  const int v = std::stoi(p);
  if (v < 1 || v > 65535) {
    err = "port " + p + " out of range";
    return false;
  }
  if (pos > 0) host = text.substr(0, pos);
  port = static_cast<uint16_t>(v);
  return true;
}
