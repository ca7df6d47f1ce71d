#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "connection.hpp"

namespace fieldgate::broadcast {

struct QueueOptions {
  // a write in flight longer than this marks the subscriber stalled
  std::chrono::milliseconds write_timeout{5000};
  size_t                    max_pending = 8;
};

/*
  Connection that never blocks its caller.

  Send only enqueues; a dedicated writer thread drains the outbox into the
  sink. Send returns false once the sink failed, the outbox is full, or the
  current write has been in flight for write_timeout, so the hub drops the
  subscriber instead of waiting on it.

  Close cancels the sink under state_mutex_, which the writer never holds
  across Write. Finish is called by the owner of the sink before the sink
  dies: it cancels any in-flight write and joins the writer.
*/
class QueuedConnection final : public Connection {
 public:
  QueuedConnection(std::shared_ptr<StreamSink> sink, QueueOptions options);
  ~QueuedConnection() override;

  QueuedConnection(const QueuedConnection&)            = delete;
  QueuedConnection& operator=(const QueuedConnection&) = delete;

  bool Send(const fieldgate::v1::ServerMessage& message) override;
  void Close(const std::string& reason) override;

  std::string Peer() const override;

  void Finish();

  // Empty unless Close ran before Finish.
  std::string CloseReason() const;

 private:
  using SteadyClock = std::chrono::steady_clock;

  void WriterLoop();

  std::shared_ptr<StreamSink> sink_;
  QueueOptions                options_;
  std::string                 peer_;

  mutable std::mutex                        state_mutex_;
  std::condition_variable                   cv_;
  std::deque<fieldgate::v1::ServerMessage>  outbox_;
  bool                                      writing_  = false;
  SteadyClock::time_point                   write_started_;
  bool                                      failed_   = false;
  bool                                      closed_   = false;
  bool                                      finished_ = false;
  std::string                               close_reason_;

  std::thread writer_;
};

} // namespace fieldgate::broadcast
