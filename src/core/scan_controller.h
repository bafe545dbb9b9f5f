#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "config/config.h"
#include "sensors/ISensor.h"
#include "io/broadcast_hub.h"

class IngestionQueue;

enum class ScanState { Idle, Scanning };

const char* toString(ScanState s);

// Point-in-time view for get_status; reading it changes nothing.
struct ScanStatus {
  ScanState state{ScanState::Idle};
  ReceiverConfig receiver{};
  ReceiverStats receiver_stats{};   // zero while idle
  size_t queue_depth{0};
  size_t queue_capacity{0};
  uint64_t dropped_frames{0};
  HubStats hub{};
  size_t connected_clients{0};

  bool scanning() const { return state == ScanState::Scanning; }
};

/**
 * IDLE <-> SCANNING.
 *
 * Owns the single active receiver: a receiver exists iff the state is
 * Scanning. start/stop are idempotent and serialized by an internal mutex,
 * control messages may arrive on any websocket worker thread.
 */
class ScanController {
public:
  using ReceiverFactory = std::function<std::unique_ptr<ISensor>()>;

  ScanController(const ReceiverConfig& cfg, IngestionQueue& queue, BroadcastHub& hub,
                 ReceiverFactory factory);
  ~ScanController();

  ScanController(const ScanController&) = delete;
  ScanController& operator=(const ScanController&) = delete;

  // true when scanning afterwards; on failure err is set and state stays Idle
  bool startScan(std::string& err);
  void stopScan();

  ScanStatus status() const;
  ScanState state() const;
  bool isScanning() const { return state() == ScanState::Scanning; }
  bool receiverActive() const;
  const ReceiverConfig& receiverConfig() const { return cfg_; }

private:
  const ReceiverConfig cfg_;
  IngestionQueue& queue_;
  BroadcastHub& hub_;
  ReceiverFactory factory_;

  mutable std::mutex mu_;
  ScanState state_{ScanState::Idle};
  std::unique_ptr<ISensor> receiver_;
};
