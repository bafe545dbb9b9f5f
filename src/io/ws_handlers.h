#pragma once
#include <crow.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "io/session.h"

class ControlHandler;

// ISession over a Crow websocket connection.
class CrowSession final : public ISession {
 public:
   CrowSession(uint64_t id, crow::websocket::connection* conn);

   uint64_t id() const override { return id_; }
   bool send(const std::string& text) override;
   bool alive() const override;
   std::string remoteAddress() const override { return remote_; }

   // Called from Crow's close callback, before Crow releases the connection.
   void markClosed();

 private:
   const uint64_t id_;
   std::string remote_;
   mutable std::mutex mu_;
   crow::websocket::connection* conn_;
   bool closed_{false};
};

class LiveWs {
   ControlHandler& control_;
 public:
   explicit LiveWs(ControlHandler& control) : control_(control) {}

   // Register WebSocket routes with the Crow app
   void registerWebSocketRoutes(crow::SimpleApp& app);

   void handleNewConnection(crow::websocket::connection& conn);
   void handleConnectionClosed(crow::websocket::connection& conn, const std::string& reason);
   void handleNewMessage(crow::websocket::connection& conn, const std::string& data, bool is_binary);

 private:
   std::shared_ptr<CrowSession> find(crow::websocket::connection* conn) const;

   mutable std::mutex mtx_;
   std::unordered_map<crow::websocket::connection*, std::shared_ptr<CrowSession>> conns_;
   std::atomic<uint64_t> next_id_{1};
};
