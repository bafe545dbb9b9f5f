#include <catch2/catch.hpp>
#include "core/ingestion_queue.h"
#include "io/broadcast_hub.h"
#include "test_support.h"

#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;
using testing_support::FakeSession;
using testing_support::parseJson;

namespace {

DecodedFrame sampleFrame(int channel) {
  DecodedFrame f;
  f.model_name = "VL-R2";
  f.channels_expected = 2;
  f.hfov_deg = 120.0f;
  f.channel = channel;
  f.points.push_back(PointSample{channel, 4.5f, -60.0f, 0, 0});
  f.points.push_back(PointSample{channel, 5.25f, 60.0f, 1, 359});
  f.product_line = 0x03;
  f.lidar_id = 0x01;
  return f;
}

class ThrowingSession : public ISession {
public:
  explicit ThrowingSession(uint64_t id) : id_(id) {}
  uint64_t id() const override { return id_; }
  bool send(const std::string&) override { throw std::runtime_error("socket reset"); }
  bool alive() const override { return true; }
private:
  uint64_t id_;
};

} // namespace

TEST_CASE("every registered session receives each frame") {
  IngestionQueue q(16);
  BroadcastHub hub(q);
  auto a = std::make_shared<FakeSession>(1);
  auto b = std::make_shared<FakeSession>(2);
  auto c = std::make_shared<FakeSession>(3);
  hub.registerSession(a);
  hub.registerSession(b);
  hub.registerSession(c);

  REQUIRE(q.push(sampleFrame(0)));
  REQUIRE(q.push(sampleFrame(1)));
  REQUIRE(hub.drainOnce() == 2);

  for (const auto& s : {a, b, c}) {
    auto sent = s->sent();
    REQUIRE(sent.size() == 2);
    auto j0 = parseJson(sent[0]);
    REQUIRE(j0["type"].asString() == "lidar");
    REQUIRE(j0["channel"].asInt() == 0);
    REQUIRE(parseJson(sent[1])["channel"].asInt() == 1);
  }
  REQUIRE(hub.stats().frames_broadcast == 2);
  REQUIRE(hub.stats().messages_sent == 6);
}

TEST_CASE("a failing session is removed and the others keep receiving") {
  IngestionQueue q(16);
  BroadcastHub hub(q);
  auto good = std::make_shared<FakeSession>(1);
  auto bad = std::make_shared<FakeSession>(2, true);
  auto gone = std::make_shared<FakeSession>(3);
  gone->setAlive(false);
  auto throwing = std::make_shared<ThrowingSession>(4);
  hub.registerSession(bad);
  hub.registerSession(good);
  hub.registerSession(gone);
  hub.registerSession(throwing);

  REQUIRE(q.push(sampleFrame(0)));
  hub.drainOnce();

  REQUIRE(good->sent().size() == 1);
  REQUIRE(hub.sessionCount() == 1);
  REQUIRE(hub.stats().sessions_dropped == 3);

  REQUIRE(q.push(sampleFrame(1)));
  hub.drainOnce();
  REQUIRE(good->sent().size() == 2);
}

TEST_CASE("frames are discarded when nobody is connected") {
  IngestionQueue q(16);
  BroadcastHub hub(q);
  REQUIRE(q.push(sampleFrame(0)));
  REQUIRE(q.push(sampleFrame(1)));
  REQUIRE(hub.drainOnce() == 2);
  REQUIRE(q.size() == 0);
  REQUIRE(hub.stats().frames_broadcast == 0);

  // a late joiner gets no replay
  auto late = std::make_shared<FakeSession>(9);
  hub.registerSession(late);
  REQUIRE(hub.drainOnce() == 0);
  REQUIRE(late->sent().empty());
}

TEST_CASE("session registry") {
  IngestionQueue q(4);
  BroadcastHub hub(q);
  auto a = std::make_shared<FakeSession>(1);

  SECTION("duplicate ids register once") {
    hub.registerSession(a);
    hub.registerSession(a);
    hub.registerSession(std::make_shared<FakeSession>(1));
    REQUIRE(hub.sessionCount() == 1);
  }
  SECTION("unregister reports whether the id was known") {
    hub.registerSession(a);
    REQUIRE(hub.unregisterSession(1));
    REQUIRE_FALSE(hub.unregisterSession(1));
    REQUIRE(hub.sessionCount() == 0);
  }
  SECTION("null sessions are ignored") {
    hub.registerSession(nullptr);
    REQUIRE(hub.sessionCount() == 0);
  }
  SECTION("snapshots are unaffected by later changes") {
    hub.registerSession(a);
    auto snap = hub.snapshot();
    hub.registerSession(std::make_shared<FakeSession>(2));
    hub.unregisterSession(1);
    REQUIRE(snap->size() == 1);
    REQUIRE((*snap)[0]->id() == 1);
    REQUIRE(hub.sessionCount() == 1);
  }
}

TEST_CASE("broadcast returns the number of deliveries") {
  IngestionQueue q(4);
  BroadcastHub hub(q);
  REQUIRE(hub.broadcast("{}") == 0);
  hub.registerSession(std::make_shared<FakeSession>(1));
  hub.registerSession(std::make_shared<FakeSession>(2, true));
  REQUIRE(hub.broadcast("{}") == 1);
  REQUIRE(hub.sessionCount() == 1);
}

TEST_CASE("drain thread delivers queued frames until stopped") {
  IngestionQueue q(16);
  BroadcastHub hub(q, 1ms);
  auto s = std::make_shared<FakeSession>(1);
  hub.registerSession(s);

  hub.start();
  hub.start();
  REQUIRE(hub.isRunning());
  REQUIRE(q.push(sampleFrame(0)));

  for (int i = 0; i < 2000 && s->sent().empty(); ++i) {
    std::this_thread::sleep_for(1ms);
  }
  hub.stop();
  hub.stop();
  REQUIRE_FALSE(hub.isRunning());
  REQUIRE(s->sent().size() == 1);
}
