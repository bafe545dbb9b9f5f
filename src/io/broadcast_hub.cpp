#include "broadcast_hub.h"
#include "messages.h"
#include "core/ingestion_queue.h"
#include <algorithm>
#include <exception>
#include <iostream>

BroadcastHub::BroadcastHub(IngestionQueue& queue, std::chrono::milliseconds idle_sleep)
    : queue_(queue), idle_sleep_(idle_sleep) {
    sessions_ = std::make_shared<const SessionList>();
}

BroadcastHub::~BroadcastHub() {
    stop();
}

void BroadcastHub::registerSession(SessionPtr session) {
    if (!session) return;
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto next = std::make_shared<SessionList>(*sessions_);
    for (const auto& s : *next) {
        if (s->id() == session->id()) return;
    }
    next->push_back(std::move(session));
    sessions_ = std::move(next);
}

bool BroadcastHub::unregisterSession(uint64_t session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto next = std::make_shared<SessionList>();
    next->reserve(sessions_->size());
    bool found = false;
    for (const auto& s : *sessions_) {
        if (s->id() == session_id) { found = true; continue; }
        next->push_back(s);
    }
    if (found) sessions_ = std::move(next);
    return found;
}

size_t BroadcastHub::sessionCount() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_->size();
}

std::shared_ptr<const BroadcastHub::SessionList> BroadcastHub::snapshot() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_;
}

bool BroadcastHub::deliver(const SessionPtr& s, const std::string& text) {
    if (!s->alive()) return false;
    try {
        return s->send(text);
    } catch (const std::exception& e) {
        std::cerr << "[BroadcastHub] send to session " << s->id() << " failed: " << e.what() << std::endl;
        return false;
    }
}

void BroadcastHub::removeSessions(const std::vector<uint64_t>& ids) {
    if (ids.empty()) return;
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto next = std::make_shared<SessionList>();
    next->reserve(sessions_->size());
    for (const auto& s : *sessions_) {
        if (std::find(ids.begin(), ids.end(), s->id()) == ids.end()) next->push_back(s);
    }
    sessions_dropped_ += sessions_->size() - next->size();
    sessions_ = std::move(next);
}

size_t BroadcastHub::broadcast(const std::string& text) {
    auto list = snapshot();
    if (list->empty()) return 0;

    std::vector<uint64_t> failed;
    size_t delivered = 0;
    for (const auto& s : *list) {
        if (deliver(s, text)) {
            ++delivered;
        } else {
            failed.push_back(s->id());
        }
    }
    messages_sent_ += delivered;

    if (!failed.empty()) {
        std::cout << "[BroadcastHub] dropping " << failed.size() << " session(s)" << std::endl;
        removeSessions(failed);
    }
    return delivered;
}

size_t BroadcastHub::drainOnce() {
    auto frames = queue_.drain();
    if (frames.empty()) return 0;

    // nobody listening: frames are discarded, no replay for late joiners
    if (sessionCount() == 0) return frames.size();

    for (const auto& f : frames) {
        broadcast(msg::serialize(msg::lidar(f)));
        ++frames_broadcast_;
    }
    return frames.size();
}

void BroadcastHub::run() {
    std::cout << "[BroadcastHub] drain loop started" << std::endl;
    while (running_.load()) {
        if (drainOnce() == 0) {
            std::this_thread::sleep_for(idle_sleep_);
        }
    }
    std::cout << "[BroadcastHub] drain loop stopped" << std::endl;
}

void BroadcastHub::start() {
    if (running_.exchange(true)) return;
    th_ = std::thread([this] { run(); });
}

void BroadcastHub::stop() {
    running_ = false;
    if (th_.joinable()) th_.join();
}

HubStats BroadcastHub::stats() const {
    HubStats s;
    s.frames_broadcast = frames_broadcast_.load();
    s.messages_sent    = messages_sent_.load();
    s.sessions_dropped = sessions_dropped_.load();
    return s;
}
