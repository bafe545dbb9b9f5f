#include <catch2/catch.hpp>
#include "core/ingestion_queue.h"
#include "core/scan_controller.h"
#include "io/broadcast_hub.h"
#include "io/control_handler.h"
#include "test_support.h"

using testing_support::FakeSensor;
using testing_support::FakeSensorCounters;
using testing_support::FakeSession;

namespace {

struct Fixture {
  ReceiverConfig cfg;
  IngestionQueue queue{16};
  BroadcastHub hub{queue};
  FakeSensorCounters counters;
  bool start_ok{true};
  ScanController scan{cfg, queue, hub, [this] {
    return std::make_unique<FakeSensor>(counters, start_ok);
  }};
  ControlHandler control{hub, scan, KanaviModelTable()};

  std::shared_ptr<FakeSession> connect(uint64_t id) {
    auto s = std::make_shared<FakeSession>(id);
    control.onOpen(s);
    return s;
  }
};

} // namespace

TEST_CASE("new session is registered and greeted") {
  Fixture fx;
  auto s = fx.connect(1);
  REQUIRE(fx.hub.sessionCount() == 1);
  auto j = s->last();
  REQUIRE(j["type"].asString() == "connection");
  REQUIRE(j["protocol_info"]["version"].asString() == "1.5.2");
  REQUIRE(j["protocol_info"]["multicast_group"].asString() == "224.0.0.5");
  REQUIRE(j["protocol_info"]["listen_port"].asInt() == 5000);
}

TEST_CASE("start_scan and stop_scan drive the scan state") {
  Fixture fx;
  auto s = fx.connect(1);

  fx.control.onMessage(s, R"({"type":"start_scan"})");
  auto started = s->last();
  REQUIRE(started["type"].asString() == "scan_status");
  REQUIRE(started["scanning"].asBool());
  REQUIRE(started["listen_port"].asInt() == 5000);
  REQUIRE(started["supported_models"].size() == 3);
  REQUIRE(fx.scan.isScanning());

  fx.control.onMessage(s, R"({"type":"start_scan"})");
  REQUIRE(fx.counters.created == 1);

  fx.control.onMessage(s, R"({"type":"stop_scan"})");
  auto stopped = s->last();
  REQUIRE(stopped["type"].asString() == "scan_status");
  REQUIRE_FALSE(stopped["scanning"].asBool());
  REQUIRE_FALSE(fx.scan.isScanning());

  // stop while idle still answers
  fx.control.onMessage(s, R"({"type":"stop_scan"})");
  REQUIRE_FALSE(s->last()["scanning"].asBool());
  REQUIRE(fx.hub.sessionCount() == 1);
}

TEST_CASE("failed start is reported as an error") {
  Fixture fx;
  fx.start_ok = false;
  auto s = fx.connect(1);
  fx.control.onMessage(s, R"({"type":"start_scan"})");
  auto j = s->last();
  REQUIRE(j["type"].asString() == "error");
  REQUIRE(j["message"].asString() == "failed to start scan: bind failed");
  REQUIRE_FALSE(fx.scan.isScanning());
  REQUIRE(fx.hub.sessionCount() == 1);
}

TEST_CASE("get_status answers without changing state") {
  Fixture fx;
  auto s = fx.connect(1);
  fx.connect(2);
  fx.control.onMessage(s, R"({"type":"get_status"})");
  auto j = s->last();
  REQUIRE(j["type"].asString() == "status_response");
  REQUIRE(j["state"].asString() == "IDLE");
  REQUIRE_FALSE(j["scanning"].asBool());
  REQUIRE(j["connected_clients"].asUInt() == 2);
  REQUIRE(j["protocol"].asString() == "Kanavi VL-Series Protocol v1.5.2");
  REQUIRE(j["supported_models"].isMember("VL-R4"));
  REQUIRE(j["stats"]["queue_capacity"].asUInt() == 16);
  REQUIRE_FALSE(fx.scan.isScanning());
  REQUIRE(fx.counters.created == 0);
}

TEST_CASE("ping echoes the client timestamp") {
  Fixture fx;
  auto s = fx.connect(1);

  fx.control.onMessage(s, R"({"type":"ping","timestamp":"12:00:01"})");
  auto j = s->last();
  REQUIRE(j["type"].asString() == "pong");
  REQUIRE(j["client_timestamp"].asString() == "12:00:01");
  REQUIRE(j["server_timestamp"].isString());

  fx.control.onMessage(s, R"({"type":"ping"})");
  REQUIRE_FALSE(s->last().isMember("client_timestamp"));
}

TEST_CASE("malformed and unknown messages get an error and keep the session") {
  Fixture fx;
  auto s = fx.connect(1);

  SECTION("not JSON") {
    fx.control.onMessage(s, "start_scan please");
    REQUIRE(s->last()["type"].asString() == "error");
    REQUIRE(s->last()["message"].asString() == "invalid JSON message");
  }
  SECTION("not an object") {
    fx.control.onMessage(s, "[1,2,3]");
    REQUIRE(s->last()["message"].asString() == "invalid JSON message");
  }
  SECTION("no type") {
    fx.control.onMessage(s, R"({"command":"start_scan"})");
    REQUIRE(s->last()["message"].asString() == "unsupported command: unknown");
  }
  SECTION("type is not a string") {
    fx.control.onMessage(s, R"({"type":5})");
    REQUIRE(s->last()["message"].asString() == "unsupported command: unknown");
  }
  SECTION("unknown type") {
    fx.control.onMessage(s, R"({"type":"reboot"})");
    REQUIRE(s->last()["message"].asString() == "unsupported command: reboot");
  }
  REQUIRE(fx.hub.sessionCount() == 1);
  REQUIRE_FALSE(fx.scan.isScanning());
}

TEST_CASE("a session that cannot take a reply is dropped") {
  Fixture fx;
  auto s = fx.connect(1);
  s->setFail(true);
  fx.control.onMessage(s, R"({"type":"ping"})");
  REQUIRE(fx.hub.sessionCount() == 0);
}

TEST_CASE("close unregisters the session") {
  Fixture fx;
  fx.connect(1);
  fx.connect(2);
  fx.control.onClose(1);
  REQUIRE(fx.hub.sessionCount() == 1);
  fx.control.onClose(1);
  REQUIRE(fx.hub.sessionCount() == 1);
}

TEST_CASE("sendError delivers an error message") {
  Fixture fx;
  auto s = fx.connect(1);
  fx.control.sendError(s, "binary messages are not supported");
  REQUIRE(s->last()["type"].asString() == "error");
  REQUIRE(s->last()["message"].asString() == "binary messages are not supported");
}
