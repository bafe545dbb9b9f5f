#include <catch2/catch.hpp>
#include "config/config.h"

TEST_CASE("empty document yields defaults") {
  auto cfg = parse_app_config("{}");
  REQUIRE(cfg.receiver.multicast_group == "224.0.0.5");
  REQUIRE(cfg.receiver.multicast_interface == "0.0.0.0");
  REQUIRE(cfg.receiver.port == 5000);
  REQUIRE(cfg.receiver.rate_limit_ms == 50);
  REQUIRE(cfg.receiver.models.empty());
  REQUIRE(cfg.pipeline.queue_capacity == 256);
  REQUIRE(cfg.pipeline.idle_sleep_ms == 10);
  REQUIRE(cfg.ui.listen == "0.0.0.0:8765");
  REQUIRE(cfg.ui.log_level == "info");
}

TEST_CASE("sections override defaults") {
  auto cfg = parse_app_config(R"(
receiver:
  multicast_group: 239.1.2.3
  multicast_interface: 10.0.0.2
  port: 6000
  poll_timeout_ms: 100
pipeline:
  rate_limit_ms: 100
  queue_capacity: 32
ui:
  listen: 127.0.0.1:9000
  log_level: debug
)");
  REQUIRE(cfg.receiver.multicast_group == "239.1.2.3");
  REQUIRE(cfg.receiver.multicast_interface == "10.0.0.2");
  REQUIRE(cfg.receiver.port == 6000);
  REQUIRE(cfg.receiver.poll_timeout_ms == 100);
  REQUIRE(cfg.receiver.rate_limit_ms == 100);
  REQUIRE(cfg.pipeline.queue_capacity == 32);
  REQUIRE(cfg.pipeline.idle_sleep_ms == 10);
  REQUIRE(cfg.ui.listen == "127.0.0.1:9000");
  REQUIRE(cfg.ui.log_level == "debug");
}

TEST_CASE("out-of-range values are clamped") {
  auto cfg = parse_app_config(R"(
receiver:
  port: 70000
  poll_timeout_ms: 1
pipeline:
  rate_limit_ms: -5
  queue_capacity: 0
)");
  REQUIRE(cfg.receiver.port == 65535);
  REQUIRE(cfg.receiver.poll_timeout_ms == 10);
  REQUIRE(cfg.receiver.rate_limit_ms == 0);
  REQUIRE(cfg.pipeline.queue_capacity == 1);
}

TEST_CASE("model entries are parsed and incomplete ones skipped") {
  auto cfg = parse_app_config(R"(
models:
  - product_line: 8
    name: VL-R8
    channels: 8
    hfov: 120
    points: 480
    interface: Ethernet
    vertical_angles: [-3.5, -2.5]
  - name: no-product-line
  - product_line: 9
)");
  REQUIRE(cfg.receiver.models.size() == 1);
  const auto& m = cfg.receiver.models[0];
  REQUIRE(m.product_line == 8);
  REQUIRE(m.name == "VL-R8");
  REQUIRE(m.channels == 8);
  REQUIRE(m.hfov_deg == Approx(120.0f));
  REQUIRE(m.points_per_channel == 480);
  REQUIRE(m.interface_label == "Ethernet");
  REQUIRE(m.vertical_angles_deg.size() == 2);
  REQUIRE(m.vertical_angles_deg[1] == Approx(-2.5f));
}

TEST_CASE("dumped config parses back to the same values") {
  AppConfig in;
  in.receiver.port = 5123;
  in.receiver.rate_limit_ms = 25;
  in.pipeline.queue_capacity = 64;
  in.ui.log_level = "warning";
  ModelConfig m;
  m.product_line = 0x10;
  m.name = "VL-X";
  m.vertical_angles_deg = {1.0f};
  in.receiver.models.push_back(m);

  auto out = parse_app_config(dump_app_config(in));
  REQUIRE(out.receiver.port == 5123);
  REQUIRE(out.receiver.rate_limit_ms == 25);
  REQUIRE(out.pipeline.queue_capacity == 64);
  REQUIRE(out.ui.log_level == "warning");
  REQUIRE(out.receiver.models.size() == 1);
  REQUIRE(out.receiver.models[0].product_line == 0x10);
  REQUIRE(out.receiver.models[0].name == "VL-X");
}

TEST_CASE("listen address parsing") {
  std::string host = "0.0.0.0";
  uint16_t port = 8765;
  std::string err;

  SECTION("host and port") {
    REQUIRE(parse_listen_address("127.0.0.1:9000", host, port, err));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 9000);
  }
  SECTION("port only keeps the host") {
    REQUIRE(parse_listen_address(":9001", host, port, err));
    REQUIRE(host == "0.0.0.0");
    REQUIRE(port == 9001);
  }
  SECTION("ports beyond 16 bits are rejected, not wrapped") {
    REQUIRE_FALSE(parse_listen_address(":70000", host, port, err));
    REQUIRE(err.find("out of range") != std::string::npos);
    REQUIRE(port == 8765);
  }
  SECTION("malformed input") {
    REQUIRE_FALSE(parse_listen_address("localhost", host, port, err));
    REQUIRE_FALSE(parse_listen_address("localhost:", host, port, err));
    REQUIRE_FALSE(parse_listen_address("localhost:80a", host, port, err));
    REQUIRE_FALSE(parse_listen_address("localhost:0", host, port, err));
    REQUIRE_FALSE(parse_listen_address("localhost:99999999999", host, port, err));
    REQUIRE(host == "0.0.0.0");
    REQUIRE(port == 8765);
  }
}
