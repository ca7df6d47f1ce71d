#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/factory.hpp"
#include "internal/overflow/overflow_cache.hpp"
#include "internal/store/timeseries_store.hpp"

namespace {

using fieldgate::runtime::config::StoreConfig;
using fieldgate::store::TimeSeriesStore;
using fieldgate::v1::Point;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                     name;
  std::function<std::shared_ptr<TimeSeriesStore>()> make_store;
  std::function<void()>                           cleanup;
};

Point MakePoint(const std::string& run, const std::string& device, uint64_t ts_ms, double value) {
  Point p;
  p.set_measurement("parity_" + run);
  (*p.mutable_tags())["device_id"]   = device;
  (*p.mutable_tags())["module_type"] = "TemperatureSensor";
  (*p.mutable_tags())["module_tag"]  = "T1";
  (*p.mutable_fields())["temperature"] = value;
  *p.mutable_timestamp()               = fieldgate::util::ToProto(fieldgate::util::FromUnixMillis(ts_ms));
  return p;
}

void VerifyWriteAndOverwrite(TimeSeriesStore& store, const std::string& run) {
  const uint64_t base = 1'700'000'000'000;
  const auto     before = store.PointCount();

  std::vector<Point> batch;
  for (uint64_t i = 0; i < 5; ++i) {
    batch.push_back(MakePoint(run, "tt-01", base + i * 5000, 20.0 + i));
    batch.push_back(MakePoint(run, "tt-02", base + i * 5000, 30.0 + i));
  }

  assert(store.Healthy());
  assert(store.WriteBatch(batch));
  assert(store.PointCount() == before + 10);

  assert(store.WriteBatch(batch));
  assert(store.PointCount() == before + 10);

  auto latest = store.LatestTimestamp();
  assert(latest.has_value());
  assert(*latest >= fieldgate::util::FromUnixMillis(base + 20000));
}

void VerifyReplayIntoStore(TimeSeriesStore& store, const std::string& run) {
  auto path = (std::filesystem::temp_directory_path() / ("fieldgate_parity_overflow_" + run + ".db")).string();
  std::filesystem::remove(path);

  const uint64_t base   = 1'600'000'000'000;
  const auto     before = store.PointCount();
  {
    fieldgate::overflow::OverflowCache cache(path, 100);
    std::vector<Point>                 pending;
    for (uint64_t i = 0; i < 7; ++i) pending.push_back(MakePoint(run, "tt-03", base + i * 1000, i));
    cache.Enqueue(pending);
  }

  fieldgate::overflow::OverflowCache cache(path, 100);
  auto                               result = cache.Replay(store, 3);
  assert(!result.failed);
  assert(result.replayed == 7);
  assert(cache.Depth() == 0);
  assert(store.PointCount() == before + 7);

  std::filesystem::remove(path);
}

BackendFactory MakeMemoryFactory() {
  BackendFactory factory;
  factory.name       = "memory";
  factory.make_store = [] {
    StoreConfig config;
    config.mutable_memory();
    return fieldgate::factory::BuildStore(config);
  };
  factory.cleanup = [] {};
  return factory;
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("fieldgate_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  BackendFactory factory;
  factory.name       = "sqlite";
  factory.make_store = [db_path] {
    StoreConfig config;
    config.mutable_sqlite()->set_path(db_path);
    return fieldgate::factory::BuildStore(config);
  };
  factory.cleanup = [db_path] {
    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path + "-wal");
    std::filesystem::remove(db_path + "-shm");
  };
  return factory;
}

#if FIELDGATE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("FIELDGATE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("FIELDGATE_TEST_POSTGRES_URI is not set");
  }

  BackendFactory factory;
  factory.name       = "postgres";
  factory.make_store = [conn = std::string(uri)] {
    StoreConfig config;
    config.mutable_postgres()->set_connection_uri(conn);
    config.mutable_postgres()->set_max_connections(2);
    config.set_write_timeout_ms(5000);
    return fieldgate::factory::BuildStore(config);
  };
  factory.cleanup = [] {};
  return factory;
}
#endif

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

#if FIELDGATE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    const auto run   = backend.name + "_" + std::to_string(NowMs());
    auto       store = backend.make_store();
    assert(store->Name() == backend.name);

    VerifyWriteAndOverwrite(*store, run);
    VerifyReplayIntoStore(*store, run);

    // a reopened store sees what the first one wrote
    if (backend.name != "memory") {
      const auto count = store->PointCount();
      store.reset();
      auto reopened = backend.make_store();
      assert(reopened->PointCount() == count);
    }

    backend.cleanup();
    std::cout << "store parity ok: " << backend.name << "\n";
  }

  std::cout << "fieldgate_integration_store_parity: pass\n";
  return 0;
}
