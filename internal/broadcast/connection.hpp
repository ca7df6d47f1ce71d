#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "fieldgate/v1.hpp"

namespace fieldgate::broadcast {

/*
  One subscriber transport (a gRPC stream in production, a fake in tests).

  Send returns false once the peer is gone; Close must be safe to call
  more than once and from any thread.
*/
class Connection {
 public:
  virtual ~Connection() = default;

  virtual bool Send(const fieldgate::v1::ServerMessage& message) = 0;
  virtual void Close(const std::string& reason)                  = 0;

  virtual std::string Peer() const = 0;
};

/*
  Blocking per-subscriber writer underneath a QueuedConnection.

  Write may block until the peer reads or Cancel runs. Cancel must not block
  and may be called from any thread while a Write is in flight.
*/
class StreamSink {
 public:
  virtual ~StreamSink() = default;

  virtual bool Write(const fieldgate::v1::ServerMessage& message) = 0;
  virtual void Cancel()                                           = 0;

  virtual std::string Peer() const = 0;
};

using ConnectionPtr = std::shared_ptr<Connection>;
using ConnectionId  = uint64_t;

} // namespace fieldgate::broadcast
