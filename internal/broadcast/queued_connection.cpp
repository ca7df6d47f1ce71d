#include "queued_connection.hpp"

#include "internal/observability/logging.hpp"

namespace fieldgate::broadcast {

using observability::IntField;
using observability::StringField;

QueuedConnection::QueuedConnection(std::shared_ptr<StreamSink> sink, QueueOptions options)
    : sink_(std::move(sink)), options_(options), peer_(sink_->Peer()) {
  if (options_.max_pending == 0) options_.max_pending = 1;
  writer_ = std::thread([this] { WriterLoop(); });
}

QueuedConnection::~QueuedConnection() {
  Finish();
}

bool QueuedConnection::Send(const fieldgate::v1::ServerMessage& message) {
  int64_t stalled_ms = -1;
  {
    std::lock_guard lock(state_mutex_);
    if (closed_ || finished_ || failed_) return false;

    if (writing_) {
      const auto in_flight = SteadyClock::now() - write_started_;
      if (in_flight >= options_.write_timeout) {
        stalled_ms = std::chrono::duration_cast<std::chrono::milliseconds>(in_flight).count();
      }
    }

    if (stalled_ms < 0 && outbox_.size() < options_.max_pending) {
      outbox_.push_back(message);
      cv_.notify_one();
      return true;
    }
  }

  if (stalled_ms >= 0) {
    FIELDGATE_LOG_WARN("subscriber write stalled", {StringField("peer", peer_), IntField("in_flight_ms", stalled_ms)});
  } else {
    FIELDGATE_LOG_WARN("subscriber outbox full", {StringField("peer", peer_), IntField("max_pending", static_cast<int64_t>(options_.max_pending))});
  }
  return false;
}

void QueuedConnection::Close(const std::string& reason) {
  std::lock_guard lock(state_mutex_);
  if (closed_ || finished_) return;

  closed_       = true;
  close_reason_ = reason;
  outbox_.clear();
  // must not block; unblocks a Write stuck on flow control
  sink_->Cancel();
  cv_.notify_all();
}

std::string QueuedConnection::Peer() const {
  return peer_;
}

void QueuedConnection::Finish() {
  {
    std::lock_guard lock(state_mutex_);
    if (!finished_) {
      finished_ = true;
      if (writing_) sink_->Cancel();
      cv_.notify_all();
    }
  }
  if (writer_.joinable()) writer_.join();
}

std::string QueuedConnection::CloseReason() const {
  std::lock_guard lock(state_mutex_);
  return close_reason_;
}

void QueuedConnection::WriterLoop() {
  std::unique_lock lock(state_mutex_);
  for (;;) {
    cv_.wait(lock, [this] { return !outbox_.empty() || closed_ || finished_; });
    if (closed_ || finished_) return;

    auto message = std::move(outbox_.front());
    outbox_.pop_front();
    writing_       = true;
    write_started_ = SteadyClock::now();
    lock.unlock();

    const bool ok = sink_->Write(message);

    lock.lock();
    writing_ = false;
    if (!ok) {
      failed_ = true;
      outbox_.clear();
      return;
    }
  }
}

} // namespace fieldgate::broadcast
