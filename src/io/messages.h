#pragma once
#include <chrono>
#include <string>
#include <json/json.h>
#include "core/frame.h"
#include "config/config.h"

struct ScanStatus;
class KanaviModelTable;

namespace msg {

constexpr const char* kProtocolVersion = "1.5.2";
constexpr const char* kProtocolName    = "Kanavi VL-Series Protocol v1.5.2";

// "YYYY-MM-DD HH:MM:SS", local time
std::string formatTimestamp(std::chrono::system_clock::time_point t);
// "0xHH"
std::string hexByte(uint8_t v);

// compact single-line JSON
std::string serialize(const Json::Value& v);

Json::Value lidar(const DecodedFrame& f);
Json::Value connection(const ReceiverConfig& rc);
Json::Value scanStarted(const ReceiverConfig& rc, const KanaviModelTable& models);
Json::Value scanStopped();
Json::Value statusResponse(const ScanStatus& st, const KanaviModelTable& models);
Json::Value pong(const Json::Value& request);
Json::Value error(const std::string& message);

} // namespace msg
