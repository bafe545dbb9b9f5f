#include "messages.h"
#include "core/scan_controller.h"
#include "sensors/kanavi/KanaviModels.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace msg {

std::string formatTimestamp(std::chrono::system_clock::time_point t) {
  std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  localtime_r(&tt, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

std::string hexByte(uint8_t v) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(v));
  return buf;
}

std::string serialize(const Json::Value& v) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, v);
}

Json::Value lidar(const DecodedFrame& f) {
  Json::Value j;
  j["type"] = "lidar";
  j["model"] = f.model_name;
  j["pointsize"] = static_cast<int>(f.points.size());
  j["channel"] = f.channel;
  j["hfov"] = f.hfov_deg;

  Json::Value vfov(Json::arrayValue);
  Json::Value distances(Json::arrayValue);
  Json::Value azimuth(Json::arrayValue);
  Json::Value detections(Json::arrayValue);
  float max_d = 0.0f;
  for (const auto& p : f.points) {
    // two-decimal resolution on the wire, as the device reports it
    distances.append(std::round(p.distance_m * 100.0) / 100.0);
    azimuth.append(p.azimuth_deg);
    detections.append(Json::UInt(p.detection));
    vfov.append(f.vertical_angle_deg);
    max_d = std::max(max_d, p.distance_m);
  }
  j["vfov"] = vfov;
  j["vertical_angle"] = vfov;
  j["distances"] = distances;
  j["azimuth"] = azimuth;
  j["detection_data"] = detections;
  j["max"] = f.points.empty() ? 50.0 : std::round(max_d * 100.0) / 100.0;
  j["timestamp"] = formatTimestamp(f.timestamp);
  j["source_ip"] = f.source_ip;
  j["lidar_id"] = hexByte(f.lidar_id);
  j["product_line"] = hexByte(f.product_line);
  return j;
}

Json::Value connection(const ReceiverConfig& rc) {
  Json::Value j;
  j["type"] = "connection";
  j["message"] = "Connected to Kanavi VL-Series LiDAR server";
  Json::Value info;
  info["version"] = kProtocolVersion;
  info["encoding"] = "Big Endian";
  info["communication"] = "Ethernet UDP Multicast";
  info["multicast_group"] = rc.multicast_group;
  info["listen_port"] = rc.port;
  j["protocol_info"] = info;
  j["instructions"] = "Send a 'start_scan' message to begin streaming";
  return j;
}

Json::Value scanStarted(const ReceiverConfig& rc, const KanaviModelTable& models) {
  Json::Value j;
  j["type"] = "scan_status";
  j["status"] = "Kanavi LiDAR scan started";
  j["scanning"] = true;
  j["listen_port"] = rc.port;
  j["multicast_group"] = rc.multicast_group;
  j["supported_models"] = Json::arrayValue;
  for (const auto& m : models.models()) j["supported_models"].append(m.name);
  return j;
}

Json::Value scanStopped() {
  Json::Value j;
  j["type"] = "scan_status";
  j["status"] = "Kanavi LiDAR scan stopped";
  j["scanning"] = false;
  return j;
}

Json::Value statusResponse(const ScanStatus& st, const KanaviModelTable& models) {
  Json::Value j;
  j["type"] = "status_response";
  j["status"] = "Kanavi VL-Series LiDAR server running";
  j["state"] = toString(st.state);
  j["scanning"] = st.scanning();
  j["listen_port"] = st.receiver.port;
  j["multicast_group"] = st.receiver.multicast_group;
  j["protocol"] = kProtocolName;

  Json::Value sm(Json::objectValue);
  for (const auto& m : models.models()) {
    char fov[16];
    std::snprintf(fov, sizeof(fov), "%g", static_cast<double>(m.hfov_deg));
    sm[m.name] = std::to_string(m.channels) + "Ch " + fov + "\xC2\xB0 " + m.interface_label;
  }
  j["supported_models"] = sm;
  j["connected_clients"] = Json::UInt64(st.connected_clients);
  j["timestamp"] = formatTimestamp(std::chrono::system_clock::now());

  Json::Value s;
  const auto& r = st.receiver_stats;
  s["datagrams"]         = Json::UInt64(r.datagrams);
  s["decoded"]           = Json::UInt64(r.decoded);
  s["bad_header"]        = Json::UInt64(r.bad_header);
  s["not_distance_data"] = Json::UInt64(r.not_distance_data);
  s["truncated"]         = Json::UInt64(r.truncated);
  s["checksum_error"]    = Json::UInt64(r.checksum_error);
  s["empty_frames"]      = Json::UInt64(r.empty_frames);
  s["rate_limited"]      = Json::UInt64(r.rate_limited);
  s["queued"]            = Json::UInt64(r.queued);
  s["socket_errors"]     = Json::UInt64(r.socket_errors);
  s["queue_depth"]       = Json::UInt64(st.queue_depth);
  s["queue_capacity"]    = Json::UInt64(st.queue_capacity);
  s["dropped_frames"]    = Json::UInt64(st.dropped_frames);
  s["frames_broadcast"]  = Json::UInt64(st.hub.frames_broadcast);
  s["messages_sent"]     = Json::UInt64(st.hub.messages_sent);
  s["sessions_dropped"]  = Json::UInt64(st.hub.sessions_dropped);
  j["stats"] = s;
  return j;
}

Json::Value pong(const Json::Value& request) {
  Json::Value j;
  j["type"] = "pong";
  j["message"] = "Kanavi LiDAR server response";
  j["server_timestamp"] = formatTimestamp(std::chrono::system_clock::now());
  if (request.isObject() && request.isMember("timestamp")) {
    j["client_timestamp"] = request["timestamp"];
  }
  return j;
}

Json::Value error(const std::string& message) {
  Json::Value j;
  j["type"] = "error";
  j["message"] = message;
  return j;
}

} // namespace msg
