#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"

namespace fieldgate::db::postgres {

using observability::IntField;

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout, OnConnect on_connect)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      acquire_timeout_(acquire_timeout),
      on_connect_(std::move(on_connect)) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  const bool ready = cv_.wait_for(lock, acquire_timeout_, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });
  if (!ready) {
    throw PoolExhausted("postgres pool: no connection within " + std::to_string(acquire_timeout_.count()) + "ms");
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    // a connection dropped by the server is replaced on the spot
    if (conn->is_open()) return Wrap(std::move(conn));
    --live_connections_;
  }

  ++live_connections_;
  lock.unlock();

  try {
    return Wrap(Open());
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

std::size_t PgPool::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_connections_;
}

std::unique_ptr<pqxx::connection> PgPool::Open() {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  if (on_connect_) on_connect_(*conn);
  FIELDGATE_LOG_DEBUG("postgres connection opened", {IntField("live", static_cast<int64_t>(LiveConnections()))});
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [weak_self](pqxx::connection* released) {
    std::unique_ptr<pqxx::connection> owned(released);
    if (auto self = weak_self.lock()) self->Release(std::move(owned));
  });
}

void PgPool::Release(std::unique_ptr<pqxx::connection> conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.push_back(std::move(conn));
  }
  cv_.notify_one();
}

} // namespace fieldgate::db::postgres
