#include <crow.h>
#include <exception>
#include <iostream>
#include "config/config.h"
#include "core/ingestion_queue.h"
#include "core/scan_controller.h"
#include "io/broadcast_hub.h"
#include "io/control_handler.h"
#include "io/ws_handlers.h"
#include "sensors/SensorFactory.h"
#include "sensors/kanavi/KanaviModels.h"

static crow::LogLevel toCrowLogLevel(const std::string& s) {
  if (s == "debug")   return crow::LogLevel::Debug;
  if (s == "warning") return crow::LogLevel::Warning;
  if (s == "error")   return crow::LogLevel::Error;
  return crow::LogLevel::Info;
}

int main(int argc, char** argv) {
  std::string cfgPath = "./config/default.yaml";
  std::string wsListen = "";

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if(a=="--config" && i+1<argc) cfgPath = argv[++i];
    else if(a=="--listen" && i+1<argc) wsListen = argv[++i];
    else if(a=="--help"){
      std::cout << "usage: kanavihub [--config <file.yaml>] [--listen host:port]" << std::endl;
      return 0;
    }
  }

  AppConfig appcfg;
  try {
    appcfg = load_app_config(cfgPath);
  } catch (const std::exception& e) {
    std::cerr << "[App] failed to load config " << cfgPath << ": " << e.what() << std::endl;
    return 1;
  }

  KanaviModelTable models(appcfg.receiver.models);

  // receive thread -> queue -> hub drain thread -> websocket sessions
  IngestionQueue queue(static_cast<size_t>(appcfg.pipeline.queue_capacity));
  BroadcastHub hub(queue, std::chrono::milliseconds(appcfg.pipeline.idle_sleep_ms));
  ScanController scan(appcfg.receiver, queue, hub, [&appcfg, &queue] {
    return create_sensor(appcfg.receiver, queue);
  });
  ControlHandler control(hub, scan, models);

  crow::SimpleApp app;
  app.loglevel(toCrowLogLevel(appcfg.ui.log_level));

  LiveWs ws(control);
  ws.registerWebSocketRoutes(app);

  // Configure websocket listen address and port
  std::string host = "0.0.0.0";
  uint16_t port = 8765;

  const std::string& listen = !wsListen.empty() ? wsListen : appcfg.ui.listen;
  if (!listen.empty()) {
    std::string err;
    if (!parse_listen_address(listen, host, port, err)) {
      std::cerr << "[App] invalid listen address: " << err << std::endl;
      return 1;
    }
  }

  std::cout << "[App] multicast group=" << appcfg.receiver.multicast_group
            << " udp port=" << appcfg.receiver.port << std::endl;
  std::cout << "[App] Starting websocket server on host:" << host << " port:" << port << std::endl;

  app.bindaddr(host).port(port).multithreaded();
  app.run();

  // app.run() returns on SIGINT/SIGTERM
  scan.stopScan();
  return 0;
}
