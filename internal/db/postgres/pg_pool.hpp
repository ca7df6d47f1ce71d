#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <stdexcept>
#include <string>
#include <vector>

namespace fieldgate::db::postgres {

// Raised when every connection stays checked out for the whole acquire timeout.
class PoolExhausted : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/*
  Bounded pqxx connection pool.

  Connections are opened lazily up to max_connections and handed out as
  shared_ptrs whose deleter returns them to the idle list. A pqxx::connection
  is single-threaded; the pool never hands one to two holders.

  on_connect runs once per fresh connection (prepared statements).
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  using OnConnect = std::function<void(pqxx::connection&)>;

  PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout, OnConnect on_connect = {});

  std::shared_ptr<pqxx::connection> Acquire();

  std::size_t LiveConnections() const;

 private:
  std::unique_ptr<pqxx::connection> Open();
  std::shared_ptr<pqxx::connection> Wrap(std::unique_ptr<pqxx::connection> conn);
  void                              Release(std::unique_ptr<pqxx::connection> conn);

  std::string               conninfo_;
  std::size_t               max_connections_;
  std::chrono::milliseconds acquire_timeout_;
  OnConnect                 on_connect_;

  mutable std::mutex                             mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace fieldgate::db::postgres
