#include "control_handler.h"
#include "broadcast_hub.h"
#include "messages.h"
#include "core/scan_controller.h"

#include <iostream>
#include <utility>

ControlHandler::ControlHandler(BroadcastHub& hub, ScanController& scan, KanaviModelTable models)
  : hub_(hub), scan_(scan), models_(std::move(models)) {}

void ControlHandler::onOpen(const std::shared_ptr<ISession>& session){
  if(!session) return;
  hub_.registerSession(session);
  std::cout << "[Control] client connected id=" << session->id()
            << " addr=" << session->remoteAddress()
            << " (clients=" << hub_.sessionCount() << ")" << std::endl;
  reply(session, msg::connection(scan_.receiverConfig()));
}

void ControlHandler::onClose(uint64_t session_id){
  if(hub_.unregisterSession(session_id)){
    std::cout << "[Control] client disconnected id=" << session_id
              << " (clients=" << hub_.sessionCount() << ")" << std::endl;
  }
}

void ControlHandler::reply(const std::shared_ptr<ISession>& session, const Json::Value& msg){
  if(session->alive() && session->send(msg::serialize(msg))) return;
  // undeliverable reply: the session is gone for fan-out too
  hub_.unregisterSession(session->id());
}

void ControlHandler::sendError(const std::shared_ptr<ISession>& session, const std::string& message){
  if(session) reply(session, msg::error(message));
}

void ControlHandler::onMessage(const std::shared_ptr<ISession>& session, const std::string& text){
  if(!session) return;

  Json::CharReaderBuilder b;
  std::unique_ptr<Json::CharReader> r(b.newCharReader());
  Json::Value j;
  std::string errs;
  const bool ok = r->parse(text.data(), text.data()+text.size(), &j, &errs);
  if(!ok || !j.isObject()){
    reply(session, msg::error("invalid JSON message"));
    return;
  }

  const Json::Value& tv = j["type"];
  const std::string t = tv.isString() ? tv.asString() : "unknown";

  if(t == "start_scan"){
    handleStartScan(session);
    return;
  }
  if(t == "stop_scan"){
    handleStopScan(session);
    return;
  }
  if(t == "get_status"){
    reply(session, msg::statusResponse(scan_.status(), models_));
    return;
  }
  if(t == "ping"){
    reply(session, msg::pong(j));
    return;
  }

  reply(session, msg::error("unsupported command: " + t));
}

void ControlHandler::handleStartScan(const std::shared_ptr<ISession>& session){
  std::string err;
  if(!scan_.startScan(err)){
    reply(session, msg::error("failed to start scan: " + err));
    return;
  }
  reply(session, msg::scanStarted(scan_.receiverConfig(), models_));
}

void ControlHandler::handleStopScan(const std::shared_ptr<ISession>& session){
  scan_.stopScan();
  reply(session, msg::scanStopped());
}
