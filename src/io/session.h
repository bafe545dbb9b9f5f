#pragma once
#include <cstdint>
#include <string>

// One connected stream client as seen by the broadcast hub.
class ISession {
public:
  virtual ~ISession() = default;
  virtual uint64_t id() const = 0;
  // false when the peer is gone or the write could not be queued
  virtual bool send(const std::string& text) = 0;
  virtual bool alive() const = 0;
  virtual std::string remoteAddress() const { return ""; }
};
