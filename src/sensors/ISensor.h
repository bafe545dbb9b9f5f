#pragma once
#include <cstdint>
#include <string>
#include "config/config.h"

struct ReceiverStats {
    uint64_t datagrams{0};
    uint64_t decoded{0};
    uint64_t bad_header{0};
    uint64_t not_distance_data{0};
    uint64_t truncated{0};
    uint64_t checksum_error{0};
    uint64_t empty_frames{0};     // valid packet, no usable points
    uint64_t rate_limited{0};
    uint64_t queued{0};
    uint64_t socket_errors{0};
};

class ISensor {
public:
    virtual ~ISensor() = default;
    // false when the device/socket could not be acquired; sets err
    virtual bool start(const ReceiverConfig& cfg, std::string& err) = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;
    virtual ReceiverStats stats() const { return {}; }
};
