#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "internal/util/time.hpp"
#include "retry_policy.hpp"
#include "transport.hpp"

namespace fieldgate::device {

enum class LinkState { kDisconnected, kConnected, kReconnecting };

const char* ToString(LinkState state);

struct LinkStatus {
  std::string endpoint;
  LinkState   state              = LinkState::kDisconnected;
  uint32_t    consecutive_errors = 0;
  uint64_t    connect_count      = 0;
  uint64_t    error_count        = 0;
  std::string last_error;

  std::optional<util::TimePoint> last_connect_time;
  std::optional<util::TimePoint> last_read_time;
};

/*
  The single managed connection to the field controller.

  Owns the transport and applies the read retry and reconnect policies.
  Reads are expected from one caller (the poll scheduler); Status() may be
  called from any thread.
*/
class DeviceLink {
 public:
  DeviceLink(TransportPtr transport, Endpoint endpoint, ReadRetryPolicy read_retry, ReconnectPolicy reconnect,
             Sleeper sleeper = ThreadSleeper());
  ~DeviceLink();

  DeviceLink(const DeviceLink&)            = delete;
  DeviceLink& operator=(const DeviceLink&) = delete;

  // Reuses a live session, otherwise connects. Never throws.
  bool Connect();

  // Throws util::ConnectionError or util::ReadTimeout once every attempt failed.
  Bytes ReadBlock(uint32_t block_id, uint32_t offset, uint32_t size);

  bool Reconnect();
  void Disconnect();

  LinkStatus Status() const;

 private:
  bool ConnectLocked();
  bool ReconnectLocked();
  void DisconnectLocked();

  void SetState(LinkState state);
  void RecordError(const std::string& what);

  TransportPtr    transport_;
  Endpoint        endpoint_;
  ReadRetryPolicy read_retry_;
  ReconnectPolicy reconnect_;
  Sleeper         sleeper_;

  // serializes transport calls
  std::mutex io_mutex_;

  mutable std::mutex status_mutex_;
  LinkStatus         status_;
};

} // namespace fieldgate::device
