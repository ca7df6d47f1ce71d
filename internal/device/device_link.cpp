#include "device_link.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fieldgate::device {

using observability::IntField;
using observability::StringField;

std::string Endpoint::ToString() const {
  return host + " rack=" + std::to_string(rack) + " slot=" + std::to_string(slot);
}

const char* ToString(LinkState state) {
  switch (state) {
    case LinkState::kDisconnected:
      return "disconnected";
    case LinkState::kConnected:
      return "connected";
    case LinkState::kReconnecting:
      return "reconnecting";
  }
  return "unknown";
}

DeviceLink::DeviceLink(TransportPtr transport, Endpoint endpoint, ReadRetryPolicy read_retry, ReconnectPolicy reconnect, Sleeper sleeper)
    : transport_(std::move(transport)),
      endpoint_(std::move(endpoint)),
      read_retry_(read_retry),
      reconnect_(reconnect),
      sleeper_(std::move(sleeper)) {
  if (read_retry_.max_attempts == 0) read_retry_.max_attempts = 1;
  if (reconnect_.max_attempts == 0) reconnect_.max_attempts = 1;

  status_.endpoint = endpoint_.ToString();
}

DeviceLink::~DeviceLink() {
  Disconnect();
}

// ------------------------------------------------------------------
// State bookkeeping
// ------------------------------------------------------------------

void DeviceLink::SetState(LinkState state) {
  LinkState previous;
  {
    std::lock_guard lock(status_mutex_);
    previous      = status_.state;
    status_.state = state;
    if (state == LinkState::kConnected) {
      ++status_.connect_count;
      status_.last_connect_time = util::Now();
    }
  }

  if (previous != state) {
    FIELDGATE_LOG_INFO("device link state changed",
                       {StringField("endpoint", endpoint_.ToString()), StringField("from", ToString(previous)), StringField("to", ToString(state))});
  }
}

void DeviceLink::RecordError(const std::string& what) {
  std::lock_guard lock(status_mutex_);
  ++status_.consecutive_errors;
  ++status_.error_count;
  status_.last_error = what;
}

LinkStatus DeviceLink::Status() const {
  std::lock_guard lock(status_mutex_);
  return status_;
}

// ------------------------------------------------------------------
// Connect / disconnect
// ------------------------------------------------------------------

bool DeviceLink::Connect() {
  std::lock_guard io(io_mutex_);
  return ConnectLocked();
}

bool DeviceLink::ConnectLocked() {
  if (Status().state == LinkState::kConnected) {
    if (transport_->IsAlive()) return true;
    FIELDGATE_LOG_WARN("device link stale, reconnecting", {StringField("endpoint", endpoint_.ToString())});
    SetState(LinkState::kDisconnected);
  }

  try {
    transport_->Connect(endpoint_);
  } catch (const util::ConnectionError& e) {
    RecordError(e.what());
    SetState(LinkState::kDisconnected);
    FIELDGATE_LOG_WARN("device connect failed", {StringField("endpoint", endpoint_.ToString()), StringField("error", e.what())});
    return false;
  }

  SetState(LinkState::kConnected);
  return true;
}

void DeviceLink::Disconnect() {
  std::lock_guard io(io_mutex_);
  DisconnectLocked();
}

void DeviceLink::DisconnectLocked() {
  if (Status().state == LinkState::kDisconnected && !transport_->IsAlive()) return;

  transport_->Disconnect();
  SetState(LinkState::kDisconnected);
}

bool DeviceLink::Reconnect() {
  std::lock_guard io(io_mutex_);
  return ReconnectLocked();
}

bool DeviceLink::ReconnectLocked() {
  transport_->Disconnect();
  SetState(LinkState::kReconnecting);

  for (uint32_t attempt = 1; attempt <= reconnect_.max_attempts; ++attempt) {
    sleeper_(reconnect_.backoff);

    try {
      transport_->Connect(endpoint_);
      {
        std::lock_guard lock(status_mutex_);
        status_.consecutive_errors = 0;
      }
      SetState(LinkState::kConnected);
      return true;
    } catch (const util::ConnectionError& e) {
      RecordError(e.what());
      FIELDGATE_LOG_WARN("device reconnect attempt failed",
                         {StringField("endpoint", endpoint_.ToString()), IntField("attempt", attempt), IntField("max_attempts", reconnect_.max_attempts),
                          StringField("error", e.what())});
    }
  }

  SetState(LinkState::kDisconnected);
  return false;
}

// ------------------------------------------------------------------
// Read
// ------------------------------------------------------------------

Bytes DeviceLink::ReadBlock(uint32_t block_id, uint32_t offset, uint32_t size) {
  std::lock_guard io(io_mutex_);

  if (Status().consecutive_errors >= reconnect_.error_threshold) {
    FIELDGATE_LOG_WARN("device error threshold reached", {StringField("endpoint", endpoint_.ToString()), IntField("threshold", reconnect_.error_threshold)});
    if (!ReconnectLocked()) {
      throw util::ConnectionError("reconnect to " + endpoint_.ToString() + " failed after " + std::to_string(reconnect_.max_attempts) + " attempts");
    }
  }

  bool        timed_out = false;
  std::string last_error;

  for (uint32_t attempt = 1; attempt <= read_retry_.max_attempts; ++attempt) {
    if (attempt > 1) sleeper_(read_retry_.delay);

    if (Status().state != LinkState::kConnected && !ConnectLocked()) {
      timed_out  = false;
      last_error = Status().last_error;
      continue;
    }

    try {
      Bytes data = transport_->ReadBlock(block_id, offset, size);
      {
        std::lock_guard lock(status_mutex_);
        status_.consecutive_errors = 0;
        status_.last_read_time     = util::Now();
      }
      return data;
    } catch (const util::ReadTimeout& e) {
      timed_out  = true;
      last_error = e.what();
    } catch (const util::ConnectionError& e) {
      timed_out  = false;
      last_error = e.what();
    }

    RecordError(last_error);
    SetState(LinkState::kDisconnected);
    FIELDGATE_LOG_WARN("block read failed",
                       {IntField("block_id", block_id), IntField("attempt", attempt), IntField("max_attempts", read_retry_.max_attempts),
                        StringField("error", last_error)});
  }

  std::string msg = "read of block " + std::to_string(block_id) + " failed after " + std::to_string(read_retry_.max_attempts) + " attempts: " + last_error;
  if (timed_out) throw util::ReadTimeout(msg);
  throw util::ConnectionError(msg);
}

} // namespace fieldgate::device
