#include "broadcast_hub.hpp"

#include <vector>

#include "internal/observability/logging.hpp"

namespace fieldgate::broadcast {

using observability::IntField;
using observability::StringField;

namespace v1 = fieldgate::v1;

namespace {

constexpr uint64_t kPushLogEvery = 50;

} // namespace

BroadcastHub::BroadcastHub(std::shared_ptr<snapshot::SnapshotStore> snapshot, HubOptions options)
    : snapshot_(std::move(snapshot)), options_(std::move(options)) {
}

BroadcastHub::~BroadcastHub() {
  Stop();
}

bool BroadcastHub::ValidChannel(const std::string& channel) {
  return channel == kRealtimeChannel;
}

// ------------------------------------------------------------------
// Registry
// ------------------------------------------------------------------

ConnectionId BroadcastHub::Connect(ConnectionPtr connection, util::TimePoint now) {
  const std::string peer = connection->Peer();

  ConnectionId id;
  size_t       total;
  {
    std::lock_guard lock(mutex_);
    id                = next_id_++;
    subscribers_[id]  = Subscriber{std::move(connection), {}, now};
    total             = subscribers_.size();
  }

  FIELDGATE_LOG_INFO("subscriber connected", {IntField("id", static_cast<int64_t>(id)), StringField("peer", peer), IntField("connections", static_cast<int64_t>(total))});
  return id;
}

bool BroadcastHub::Disconnect(ConnectionId id, const std::string& reason) {
  ConnectionPtr connection;
  size_t        remaining;
  {
    std::lock_guard lock(mutex_);
    auto            it = subscribers_.find(id);
    if (it == subscribers_.end()) return false;

    connection = std::move(it->second.connection);
    subscribers_.erase(it);
    remaining = subscribers_.size();
  }

  connection->Close(reason);

  FIELDGATE_LOG_INFO("subscriber disconnected",
                     {IntField("id", static_cast<int64_t>(id)), StringField("reason", reason), IntField("connections", static_cast<int64_t>(remaining))});
  return true;
}

bool BroadcastHub::Subscribe(ConnectionId id, const std::string& channel) {
  if (!ValidChannel(channel)) {
    FIELDGATE_LOG_WARN("subscribe to unknown channel", {IntField("id", static_cast<int64_t>(id)), StringField("channel", channel)});
    return false;
  }

  std::lock_guard lock(mutex_);
  auto            it = subscribers_.find(id);
  if (it == subscribers_.end()) return false;

  it->second.channels.insert(channel);
  return true;
}

void BroadcastHub::Unsubscribe(ConnectionId id, const std::string& channel) {
  std::lock_guard lock(mutex_);
  auto            it = subscribers_.find(id);
  if (it != subscribers_.end()) it->second.channels.erase(channel);
}

void BroadcastHub::Heartbeat(ConnectionId id, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  auto            it = subscribers_.find(id);
  if (it != subscribers_.end()) it->second.last_heartbeat = now;
}

// ------------------------------------------------------------------
// Protocol
// ------------------------------------------------------------------

bool BroadcastHub::SendTo(ConnectionId id, const v1::ServerMessage& message) {
  ConnectionPtr connection;
  {
    std::lock_guard lock(mutex_);
    auto            it = subscribers_.find(id);
    if (it == subscribers_.end()) return false;
    connection = it->second.connection;
  }

  if (connection->Send(message)) return true;

  Disconnect(id, "send failed");
  return false;
}

void BroadcastHub::SendError(ConnectionId id, v1::ErrorCode code, const std::string& text) {
  v1::ServerMessage msg;
  msg.mutable_error()->set_code(code);
  msg.mutable_error()->set_message(text);
  SendTo(id, msg);
}

void BroadcastHub::HandleMessage(ConnectionId id, const v1::ClientMessage& message, util::TimePoint now) {
  switch (message.kind_case()) {
    case v1::ClientMessage::kSubscribe:
      if (!Subscribe(id, message.subscribe().channel())) {
        SendError(id, v1::ERROR_CODE_INVALID_CHANNEL, "invalid channel: " + message.subscribe().channel());
      }
      return;

    case v1::ClientMessage::kUnsubscribe:
      Unsubscribe(id, message.unsubscribe().channel());
      return;

    case v1::ClientMessage::kHeartbeat: {
      Heartbeat(id, now);

      v1::ServerMessage ack;
      *ack.mutable_heartbeat()->mutable_timestamp() = util::ToProto(now);
      SendTo(id, ack);
      return;
    }

    case v1::ClientMessage::KIND_NOT_SET:
      break;
  }

  SendError(id, v1::ERROR_CODE_INVALID_MESSAGE, "message has no recognised kind");
}

// ------------------------------------------------------------------
// Loops
// ------------------------------------------------------------------

size_t BroadcastHub::ReapExpired(util::TimePoint now) {
  std::vector<std::pair<ConnectionId, int64_t>> expired;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, sub] : subscribers_) {
      auto silent = now - sub.last_heartbeat;
      if (silent >= options_.heartbeat_timeout) {
        expired.emplace_back(id, std::chrono::duration_cast<std::chrono::seconds>(silent).count());
      }
    }
  }

  size_t removed = 0;
  for (const auto& [id, silent_s] : expired) {
    FIELDGATE_LOG_WARN("subscriber heartbeat timeout", {IntField("id", static_cast<int64_t>(id)), IntField("silent_s", silent_s)});
    if (Disconnect(id, "heartbeat timeout")) {
      ++removed;
      ++timeouts_;
    }
  }
  return removed;
}

size_t BroadcastHub::PushOnce(util::TimePoint now) {
  std::vector<std::pair<ConnectionId, ConnectionPtr>> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, sub] : subscribers_) {
      if (sub.channels.count(kRealtimeChannel)) targets.emplace_back(id, sub.connection);
    }
  }
  if (targets.empty()) return 0;

  auto latest = snapshot_->GetAll();
  if (latest.empty()) {
    FIELDGATE_LOG_DEBUG("snapshot empty, nothing to push");
    return 0;
  }

  v1::ServerMessage msg;
  auto*             data = msg.mutable_realtime_data();
  *data->mutable_timestamp() = util::ToProto(now);
  data->set_source(options_.source);
  for (auto& [device_id, reading] : latest) {
    (*data->mutable_data())[device_id] = std::move(reading);
  }

  size_t delivered = 0;
  for (const auto& [id, connection] : targets) {
    if (connection->Send(msg)) {
      ++delivered;
    } else {
      Disconnect(id, "send failed");
    }
  }

  const auto n = ++pushes_;
  if (n % kPushLogEvery == 0) {
    FIELDGATE_LOG_INFO("push summary", {IntField("pushes", static_cast<int64_t>(n)), IntField("subscribers", static_cast<int64_t>(delivered)),
                                        IntField("devices", static_cast<int64_t>(data->data_size())), StringField("source", options_.source)});
  }
  return delivered;
}

void BroadcastHub::Start() {
  if (push_task_) return;

  push_task_ = std::make_unique<runtime::PeriodicTask>("realtime-push", options_.push_interval, [this] { PushOnce(); });
  reap_task_ = std::make_unique<runtime::PeriodicTask>("realtime-reaper", options_.reap_interval, [this] { ReapExpired(); });
  push_task_->Start();
  reap_task_->Start();

  FIELDGATE_LOG_INFO("realtime hub started", {IntField("push_interval_ms", options_.push_interval.count()),
                                              IntField("heartbeat_timeout_ms", options_.heartbeat_timeout.count())});
}

void BroadcastHub::Stop() {
  if (!push_task_) return;

  push_task_->Stop();
  reap_task_->Stop();
  push_task_.reset();
  reap_task_.reset();

  FIELDGATE_LOG_INFO("realtime hub stopped");
}

// ------------------------------------------------------------------
// Introspection
// ------------------------------------------------------------------

size_t BroadcastHub::SubscriberCount(const std::string& channel) const {
  std::lock_guard lock(mutex_);
  size_t          n = 0;
  for (const auto& [_, sub] : subscribers_) {
    if (sub.channels.count(channel)) ++n;
  }
  return n;
}

size_t BroadcastHub::ConnectionCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

HubStats BroadcastHub::Stats() const {
  HubStats s;
  s.connections          = ConnectionCount();
  s.realtime_subscribers = SubscriberCount(kRealtimeChannel);
  s.pushes               = pushes_;
  s.timeouts             = timeouts_;
  return s;
}

} // namespace fieldgate::broadcast
