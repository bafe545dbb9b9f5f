#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>
#include "core/frame.h"

/**
 * Bounded handoff between the receive thread (producer) and the broadcast
 * drain loop (consumer).
 *
 * push() never blocks: when full the incoming frame is dropped and counted.
 * drain() returns everything queued, oldest first, and never blocks.
 */
class IngestionQueue {
public:
  explicit IngestionQueue(size_t capacity = 256);

  bool push(DecodedFrame&& frame);
  std::vector<DecodedFrame> drain();

  size_t size() const;
  size_t capacity() const { return capacity_; }
  uint64_t dropped() const { return dropped_.load(); }
  void clear();

private:
  const size_t capacity_;
  mutable std::mutex mu_;
  std::deque<DecodedFrame> items_;
  std::atomic<uint64_t> dropped_{0};
};
