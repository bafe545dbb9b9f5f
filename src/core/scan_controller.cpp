#include "scan_controller.h"
#include "core/ingestion_queue.h"

#include <iostream>
#include <utility>

const char* toString(ScanState s) {
  return s == ScanState::Scanning ? "SCANNING" : "IDLE";
}

ScanController::ScanController(const ReceiverConfig& cfg, IngestionQueue& queue, BroadcastHub& hub,
                               ReceiverFactory factory)
  : cfg_(cfg), queue_(queue), hub_(hub), factory_(std::move(factory)) {
}

ScanController::~ScanController() {
  stopScan();
}

bool ScanController::startScan(std::string& err) {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ == ScanState::Scanning) {
    return true;
  }

  std::unique_ptr<ISensor> rx;
  if (factory_) rx = factory_();
  if (!rx) {
    err = "no receiver available";
    std::cerr << "[ScanController] " << err << std::endl;
    return false;
  }
  // frames left over from a previous scan are stale; cleared before the
  // receive thread can push anything
  queue_.clear();
  if (!rx->start(cfg_, err)) {
    std::cerr << "[ScanController] receiver start failed: " << err << std::endl;
    return false;
  }

  receiver_ = std::move(rx);
  hub_.start();
  state_ = ScanState::Scanning;
  std::cout << "[ScanController] IDLE -> SCANNING (group=" << cfg_.multicast_group
            << " port=" << cfg_.port << ")" << std::endl;
  return true;
}

void ScanController::stopScan() {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ == ScanState::Idle) return;

  if (receiver_) receiver_->stop();
  hub_.stop();
  receiver_.reset();
  queue_.clear();
  state_ = ScanState::Idle;
  std::cout << "[ScanController] SCANNING -> IDLE" << std::endl;
}

ScanStatus ScanController::status() const {
  ScanStatus st;
  {
    std::lock_guard<std::mutex> lk(mu_);
    st.state = state_;
    if (receiver_) st.receiver_stats = receiver_->stats();
  }
  st.receiver          = cfg_;
  st.queue_depth       = queue_.size();
  st.queue_capacity    = queue_.capacity();
  st.dropped_frames    = queue_.dropped();
  st.hub               = hub_.stats();
  st.connected_clients = hub_.sessionCount();
  return st;
}

ScanState ScanController::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

bool ScanController::receiverActive() const {
  std::lock_guard<std::mutex> lk(mu_);
  return receiver_ != nullptr && receiver_->isRunning();
}
