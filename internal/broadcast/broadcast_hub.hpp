#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "connection.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/snapshot/snapshot_store.hpp"
#include "internal/util/time.hpp"

namespace fieldgate::broadcast {

inline constexpr const char* kRealtimeChannel = "realtime";

struct HubOptions {
  std::chrono::milliseconds push_interval{1000};
  std::chrono::milliseconds heartbeat_timeout{45000};
  std::chrono::milliseconds reap_interval{10000};
  std::string               source = "plc";
};

struct HubStats {
  uint64_t connections          = 0;
  uint64_t realtime_subscribers = 0;
  uint64_t pushes               = 0;
  uint64_t timeouts             = 0;
};

/*
  Subscriber registry plus the push and reaper loops.

  Registry:
    connection id -> {connection, channels, last heartbeat}
    guarded by mutex_; sends always happen on a copy taken outside it.

  A connection whose Send fails is removed; nothing else is affected.
  Disconnect is idempotent, so the reaper, a failed push and the
  transport's own teardown may all race to remove the same id.
*/
class BroadcastHub {
 public:
  BroadcastHub(std::shared_ptr<snapshot::SnapshotStore> snapshot, HubOptions options);
  ~BroadcastHub();

  ConnectionId Connect(ConnectionPtr connection, util::TimePoint now = util::Now());

  // Returns false when the id was already gone.
  bool Disconnect(ConnectionId id, const std::string& reason);

  bool Subscribe(ConnectionId id, const std::string& channel);
  void Unsubscribe(ConnectionId id, const std::string& channel);
  void Heartbeat(ConnectionId id, util::TimePoint now = util::Now());

  // Dispatches one client message and sends the reply, if any.
  void HandleMessage(ConnectionId id, const fieldgate::v1::ClientMessage& message, util::TimePoint now = util::Now());

  // Disconnects every subscriber silent for at least heartbeat_timeout.
  size_t ReapExpired(util::TimePoint now = util::Now());

  // Sends the current snapshot to every realtime subscriber; returns how
  // many sends succeeded.
  size_t PushOnce(util::TimePoint now = util::Now());

  void Start();
  void Stop();

  HubStats Stats() const;
  size_t   SubscriberCount(const std::string& channel) const;
  size_t   ConnectionCount() const;

  static bool ValidChannel(const std::string& channel);

 private:
  struct Subscriber {
    ConnectionPtr         connection;
    std::set<std::string> channels;
    util::TimePoint       last_heartbeat;
  };

  bool SendTo(ConnectionId id, const fieldgate::v1::ServerMessage& message);
  void SendError(ConnectionId id, fieldgate::v1::ErrorCode code, const std::string& text);

  std::shared_ptr<snapshot::SnapshotStore> snapshot_;
  HubOptions                               options_;

  mutable std::mutex                 mutex_;
  std::map<ConnectionId, Subscriber> subscribers_;
  ConnectionId                       next_id_ = 1;

  std::atomic<uint64_t> pushes_{0};
  std::atomic<uint64_t> timeouts_{0};

  std::unique_ptr<runtime::PeriodicTask> push_task_;
  std::unique_ptr<runtime::PeriodicTask> reap_task_;
};

} // namespace fieldgate::broadcast
