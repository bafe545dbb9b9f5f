#include "ingestion_queue.h"
#include <algorithm>
#include <utility>

IngestionQueue::IngestionQueue(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {}

bool IngestionQueue::push(DecodedFrame&& frame) {
  std::lock_guard<std::mutex> lk(mu_);
  if (items_.size() >= capacity_) {
    dropped_.fetch_add(1);
    return false;
  }
  items_.push_back(std::move(frame));
  return true;
}

std::vector<DecodedFrame> IngestionQueue::drain() {
  std::deque<DecodedFrame> taken;
  {
    std::lock_guard<std::mutex> lk(mu_);
    taken.swap(items_);
  }
  std::vector<DecodedFrame> out;
  out.reserve(taken.size());
  for (auto& f : taken) out.push_back(std::move(f));
  return out;
}

size_t IngestionQueue::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return items_.size();
}

void IngestionQueue::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  items_.clear();
}
