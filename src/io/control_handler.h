#pragma once
#include <memory>
#include <string>
#include <json/json.h>
#include "io/session.h"
#include "sensors/kanavi/KanaviModels.h"

class BroadcastHub;
class ScanController;

/**
 * Control protocol shared by every transport.
 *
 * client -> server : start_scan, stop_scan, get_status, ping
 * server -> client : connection, scan_status, status_response, pong, error
 *
 * Frames themselves ("lidar") are pushed by BroadcastHub, not from here.
 */
class ControlHandler {
public:
  ControlHandler(BroadcastHub& hub, ScanController& scan, KanaviModelTable models);

  void onOpen(const std::shared_ptr<ISession>& session);
  void onMessage(const std::shared_ptr<ISession>& session, const std::string& text);
  void onClose(uint64_t session_id);
  void sendError(const std::shared_ptr<ISession>& session, const std::string& message);

private:
  void reply(const std::shared_ptr<ISession>& session, const Json::Value& msg);
  void handleStartScan(const std::shared_ptr<ISession>& session);
  void handleStopScan(const std::shared_ptr<ISession>& session);

  BroadcastHub& hub_;
  ScanController& scan_;
  KanaviModelTable models_;
};
