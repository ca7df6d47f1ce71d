#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fieldgate::device {

using Bytes = std::vector<uint8_t>;

struct Endpoint {
  std::string host;
  uint32_t    rack = 0;
  uint32_t    slot = 1;

  std::chrono::milliseconds connect_timeout{5000};

  std::string ToString() const;
};

/*
  Raw access to a field controller's data blocks.

  Implementations throw util::ConnectionError when the link is down or
  cannot be established and util::ReadTimeout when a read does not
  complete in time. They carry no retry logic; DeviceLink owns that.
*/
class Transport {
 public:
  virtual ~Transport() = default;

  virtual void Connect(const Endpoint& endpoint) = 0;
  virtual void Disconnect()                      = 0;

  // Liveness of the current session; false when never connected.
  virtual bool IsAlive() = 0;

  virtual Bytes ReadBlock(uint32_t block_id, uint32_t offset, uint32_t size) = 0;

  virtual std::string Name() const = 0;
};

using TransportPtr = std::unique_ptr<Transport>;

} // namespace fieldgate::device
