#include "ws_handlers.h"
#include "control_handler.h"

#include <exception>
#include <iostream>

CrowSession::CrowSession(uint64_t id, crow::websocket::connection* conn)
  : id_(id), conn_(conn) {
  if(conn_) remote_ = conn_->get_remote_ip();
}

bool CrowSession::send(const std::string& text){
  std::lock_guard<std::mutex> lk(mu_);
  if(closed_ || !conn_) return false;
  // queued on the connection's io context, returns without waiting for the peer
  conn_->send_text(text);
  return true;
}

bool CrowSession::alive() const {
  std::lock_guard<std::mutex> lk(mu_);
  return !closed_ && conn_ != nullptr;
}

void CrowSession::markClosed(){
  std::lock_guard<std::mutex> lk(mu_);
  closed_ = true;
  conn_ = nullptr;
}

void LiveWs::registerWebSocketRoutes(crow::SimpleApp& app){
  CROW_WEBSOCKET_ROUTE(app, "/")
    .onopen([this](crow::websocket::connection& conn){
      handleNewConnection(conn);
    })
    .onclose([this](crow::websocket::connection& conn, const std::string& reason){
      handleConnectionClosed(conn, reason);
    })
    .onmessage([this](crow::websocket::connection& conn, const std::string& data, bool is_binary){
      handleNewMessage(conn, data, is_binary);
    });
}

std::shared_ptr<CrowSession> LiveWs::find(crow::websocket::connection* conn) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = conns_.find(conn);
  return it == conns_.end() ? nullptr : it->second;
}

void LiveWs::handleNewConnection(crow::websocket::connection& conn){
  auto session = std::make_shared<CrowSession>(next_id_.fetch_add(1), &conn);
  {
    std::lock_guard<std::mutex> lk(mtx_);
    conns_[&conn] = session;
  }
  control_.onOpen(session);
}

void LiveWs::handleConnectionClosed(crow::websocket::connection& conn, const std::string& reason){
  std::shared_ptr<CrowSession> session;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = conns_.find(&conn);
    if(it == conns_.end()) return;
    session = it->second;
    conns_.erase(it);
  }
  // Crow frees the connection after this callback returns
  session->markClosed();
  control_.onClose(session->id());
  std::cout << "[LiveWs] connection " << session->id() << " closed: " << reason << std::endl;
}

void LiveWs::handleNewMessage(crow::websocket::connection& conn, const std::string& data, bool is_binary){
  auto session = find(&conn);
  if(!session) return;

  if(is_binary){
    control_.sendError(session, "binary messages are not supported");
    return;
  }
  try {
    control_.onMessage(session, data);
  } catch (const std::exception& e) {
    std::cerr << "[LiveWs] message handling failed for connection " << session->id()
              << ": " << e.what() << std::endl;
    control_.sendError(session, std::string("internal error: ") + e.what());
  }
}
