#include "KanaviMulticastReceiver.h"
#include "KanaviPacketDecoder.h"
#include "core/ingestion_queue.h"
#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <iostream>
#include <utility>
#include <vector>

using clock_mono = std::chrono::steady_clock;
using clock_sys  = std::chrono::system_clock;

KanaviMulticastReceiver::KanaviMulticastReceiver(IngestionQueue& queue, KanaviModelTable models)
    : queue_(queue), models_(std::move(models))
{
}

KanaviMulticastReceiver::~KanaviMulticastReceiver() {
    stop();
}

bool KanaviMulticastReceiver::start(const ReceiverConfig& cfg, std::string& err) {
    if (running_) return true;
    cfg_ = cfg;
    limiter_ = RateLimiter(std::chrono::milliseconds(cfg_.rate_limit_ms));

    if (!openSocket(err)) {
        std::cerr << "[KanaviReceiver] " << err << std::endl;
        return false;
    }

    running_ = true;
    th_ = std::thread([this] { rxLoop(); });
    std::cout << "[KanaviReceiver] listening group=" << cfg_.multicast_group
              << " port=" << cfg_.port << std::endl;
    return true;
}

void KanaviMulticastReceiver::stop() {
    running_ = false;
    if (th_.joinable()) th_.join();
    closeSocket();
}

bool KanaviMulticastReceiver::openSocket(std::string& err) {
    closeSocket();

    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        err = std::string("socket() failed: ") + std::strerror(errno);
        return false;
    }

    int yes = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
        err = std::string("SO_REUSEADDR failed: ") + std::strerror(errno);
        closeSocket();
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(cfg_.port));
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        err = "bind to port " + std::to_string(cfg_.port) + " failed: " + std::strerror(errno);
        closeSocket();
        return false;
    }

    std::memset(&mreq_, 0, sizeof(mreq_));
    if (inet_pton(AF_INET, cfg_.multicast_group.c_str(), &mreq_.imr_multiaddr) <= 0) {
        err = "invalid multicast group: " + cfg_.multicast_group;
        closeSocket();
        return false;
    }
    if (inet_pton(AF_INET, cfg_.multicast_interface.c_str(), &mreq_.imr_interface) <= 0) {
        err = "invalid multicast interface: " + cfg_.multicast_interface;
        closeSocket();
        return false;
    }
    if (::setsockopt(fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq_, sizeof(mreq_)) < 0) {
        err = "join " + cfg_.multicast_group + " failed: " + std::strerror(errno);
        closeSocket();
        return false;
    }
    joined_ = true;

    // bounded recv so the loop notices stop()
    timeval tv{};
    tv.tv_sec  = cfg_.poll_timeout_ms / 1000;
    tv.tv_usec = (cfg_.poll_timeout_ms % 1000) * 1000;
    if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        err = std::string("SO_RCVTIMEO failed: ") + std::strerror(errno);
        closeSocket();
        return false;
    }
    return true;
}

void KanaviMulticastReceiver::closeSocket() {
    if (fd_ < 0) return;
    if (joined_) {
        if (::setsockopt(fd_, IPPROTO_IP, IP_DROP_MEMBERSHIP, &mreq_, sizeof(mreq_)) < 0) {
            std::cerr << "[KanaviReceiver] leave group failed: " << std::strerror(errno) << std::endl;
        }
        joined_ = false;
    }
    ::close(fd_);
    fd_ = -1;
}

void KanaviMulticastReceiver::rxLoop() {
    std::vector<uint8_t> buf(static_cast<size_t>(cfg_.recv_buffer_size));

    while (running_) {
        sockaddr_in src{};
        socklen_t src_len = sizeof(src);
        const ssize_t n = ::recvfrom(fd_, buf.data(), buf.size(), 0,
                                     reinterpret_cast<sockaddr*>(&src), &src_len);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            ++socket_errors_;
            std::cerr << "[KanaviReceiver] recvfrom failed: " << std::strerror(errno) << std::endl;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        RawDatagram dg;
        dg.bytes.assign(buf.begin(), buf.begin() + n);
        dg.received_at = clock_sys::now();
        char ip[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &src.sin_addr, ip, sizeof(ip)) != nullptr) dg.source_ip = ip;

        handleDatagram(dg, clock_mono::now());
    }
}

void KanaviMulticastReceiver::handleDatagram(const RawDatagram& dg, RateLimiter::Clock::time_point now) {
    ++datagrams_;

    auto result = kanavi::decodePacket(dg.bytes.data(), dg.bytes.size(), models_);
    if (result.isError()) {
        switch (result.error()) {
            case kanavi::DecodeError::BadHeader:       ++bad_header_; break;
            case kanavi::DecodeError::NotDistanceData: ++not_distance_data_; break;
            case kanavi::DecodeError::Truncated:       ++truncated_; break;
            case kanavi::DecodeError::ChecksumError:   ++checksum_error_; break;
        }
        return;
    }
    ++decoded_;

    DecodedFrame& frame = result.frame();
    if (frame.points.empty()) {
        ++empty_frames_;
        return;
    }
    if (!limiter_.allow(frame.channel, now)) {
        ++rate_limited_;
        return;
    }

    frame.source_ip = dg.source_ip;
    frame.timestamp = dg.received_at;
    if (queue_.push(std::move(frame))) ++queued_;
}

ReceiverStats KanaviMulticastReceiver::stats() const {
    ReceiverStats s;
    s.datagrams         = datagrams_.load();
    s.decoded           = decoded_.load();
    s.bad_header        = bad_header_.load();
    s.not_distance_data = not_distance_data_.load();
    s.truncated         = truncated_.load();
    s.checksum_error    = checksum_error_.load();
    s.empty_frames      = empty_frames_.load();
    s.rate_limited      = rate_limited_.load();
    s.queued            = queued_.load();
    s.socket_errors     = socket_errors_.load();
    return s;
}
