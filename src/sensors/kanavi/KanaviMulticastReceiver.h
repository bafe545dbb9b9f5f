#pragma once
#include "sensors/ISensor.h"
#include "core/frame.h"
#include "core/rate_limiter.h"
#include "KanaviModels.h"
#include <atomic>
#include <thread>
#include <netinet/in.h>

class IngestionQueue;

class KanaviMulticastReceiver final : public ISensor {
public:
    KanaviMulticastReceiver(IngestionQueue& queue, KanaviModelTable models);
    ~KanaviMulticastReceiver() override;

    KanaviMulticastReceiver(const KanaviMulticastReceiver&) = delete;
    KanaviMulticastReceiver& operator=(const KanaviMulticastReceiver&) = delete;

    bool start(const ReceiverConfig& cfg, std::string& err) override;
    void stop() override;
    bool isRunning() const override { return running_.load(); }
    ReceiverStats stats() const override;

    // decode -> drop empty -> rate limit -> enqueue; run on the receive thread
    void handleDatagram(const RawDatagram& dg, RateLimiter::Clock::time_point now);

    // used by handleDatagram; replaced on every start()
    void setRateLimit(std::chrono::milliseconds interval) { limiter_ = RateLimiter(interval); }

private:
    bool openSocket(std::string& err);
    void closeSocket();
    void rxLoop();

    IngestionQueue& queue_;
    KanaviModelTable models_;
    RateLimiter limiter_;
    ReceiverConfig cfg_{};

    int fd_{-1};
    bool joined_{false};
    ip_mreq mreq_{};

    std::atomic<bool> running_{false};
    std::thread th_;

    std::atomic<uint64_t> datagrams_{0};
    std::atomic<uint64_t> decoded_{0};
    std::atomic<uint64_t> bad_header_{0};
    std::atomic<uint64_t> not_distance_data_{0};
    std::atomic<uint64_t> truncated_{0};
    std::atomic<uint64_t> checksum_error_{0};
    std::atomic<uint64_t> empty_frames_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> queued_{0};
    std::atomic<uint64_t> socket_errors_{0};
};
