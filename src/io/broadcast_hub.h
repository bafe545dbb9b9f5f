#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "io/session.h"

class IngestionQueue;

struct HubStats {
  uint64_t frames_broadcast{0};
  uint64_t messages_sent{0};
  uint64_t sessions_dropped{0};
};

/**
 * Session registry + fan-out.
 *
 * The registry is copy-on-write: every fan-out iterates an immutable snapshot,
 * so sessions may connect or disconnect while a frame is being delivered.
 * A session whose send fails is removed; delivery to the others continues.
 */
class BroadcastHub {
public:
  using SessionPtr  = std::shared_ptr<ISession>;
  using SessionList = std::vector<SessionPtr>;

  explicit BroadcastHub(IngestionQueue& queue,
                        std::chrono::milliseconds idle_sleep = std::chrono::milliseconds(10));
  ~BroadcastHub();

  BroadcastHub(const BroadcastHub&) = delete;
  BroadcastHub& operator=(const BroadcastHub&) = delete;

  void registerSession(SessionPtr session);
  bool unregisterSession(uint64_t session_id);
  size_t sessionCount() const;
  std::shared_ptr<const SessionList> snapshot() const;

  // Send text to every registered session; returns how many accepted it.
  size_t broadcast(const std::string& text);

  // One drain + fan-out pass. Returns the number of frames taken off the queue.
  size_t drainOnce();

  // Drain loop, runs until stop(). start() runs it on the hub thread.
  void run();
  void start();
  void stop();
  bool isRunning() const { return running_.load(); }

  HubStats stats() const;

private:
  bool deliver(const SessionPtr& s, const std::string& text);
  void removeSessions(const std::vector<uint64_t>& ids);

  IngestionQueue& queue_;
  std::chrono::milliseconds idle_sleep_;

  mutable std::mutex sessions_mutex_;
  std::shared_ptr<const SessionList> sessions_;

  std::atomic<bool> running_{false};
  std::thread th_;

  std::atomic<uint64_t> frames_broadcast_{0};
  std::atomic<uint64_t> messages_sent_{0};
  std::atomic<uint64_t> sessions_dropped_{0};
};
