#include "internal/overflow/overflow_cache.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>

#include "internal/store/memory/memory_timeseries_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using fieldgate::v1::Point;

// Fails the first `failures` writes, and call number `fail_on_call`, then delegates.
class FlakyStore final : public fieldgate::store::TimeSeriesStore {
 public:
  explicit FlakyStore(int failures) : failures_(failures) {
  }

  fieldgate::db::Result WriteBatch(const std::vector<Point>& points) override {
    ++calls;
    if (calls == fail_on_call) {
      return fieldgate::db::Result::Err(fieldgate::db::ErrorCode::Timeout, "slow");
    }
    if (failures_ > 0) {
      --failures_;
      return fieldgate::db::Result::Err(fieldgate::db::ErrorCode::Unavailable, "down");
    }
    written.insert(written.end(), points.begin(), points.end());
    return inner.WriteBatch(points);
  }

  bool Healthy() override {
    return failures_ == 0;
  }

  uint64_t PointCount() override {
    return inner.PointCount();
  }

  std::optional<fieldgate::util::TimePoint> LatestTimestamp() override {
    return inner.LatestTimestamp();
  }

  std::string Name() const override {
    return "flaky";
  }

  int                                          calls        = 0;
  int                                          fail_on_call = 0;
  std::vector<Point>                           written;
  fieldgate::store::memory::MemoryTimeSeriesStore inner;

 private:
  int failures_;
};

std::string TempPath(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / ("fieldgate_overflow_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  auto path = dir / (name + ".db");
  std::filesystem::remove(path);
  return path.string();
}

Point MakePoint(const std::string& device, int n) {
  Point p;
  p.set_measurement("sensor_data");
  (*p.mutable_tags())["device_id"] = device;
  (*p.mutable_fields())["value"]   = n;
  *p.mutable_timestamp()           = fieldgate::util::ToProto(fieldgate::util::FromUnixMillis(1'700'000'000'000 + n * 1000));
  return p;
}

std::vector<Point> Points(int from, int count) {
  std::vector<Point> out;
  for (int i = from; i < from + count; ++i) out.push_back(MakePoint("tt-01", i));
  return out;
}

double ValueOf(const Point& p) {
  return p.fields().at("value");
}

void TestRejectsZeroCapacity() {
  bool rejected = false;
  try {
    fieldgate::overflow::OverflowCache cache(TempPath("zero"), 0);
  } catch (const fieldgate::util::InvalidConfig&) {
    rejected = true;
  }
  assert(rejected);
}

void TestFifoOrder() {
  fieldgate::overflow::OverflowCache cache(TempPath("fifo"), 100);
  assert(cache.Enqueue(Points(0, 3)) == 0);
  assert(cache.Enqueue(Points(3, 2)) == 0);
  assert(cache.Depth() == 5);

  auto head = cache.Peek(5);
  assert(head.size() == 5);
  for (int i = 0; i < 5; ++i) assert(ValueOf(head[i]) == i);
}

void TestEvictsOldestAtCapacity() {
  fieldgate::overflow::OverflowCache cache(TempPath("evict"), 4);
  assert(cache.Enqueue(Points(0, 3)) == 0);
  assert(cache.Enqueue(Points(3, 3)) == 2);

  assert(cache.Depth() == 4);
  assert(cache.EvictedCount() == 2);
  assert(ValueOf(cache.Peek(1).front()) == 2);
}

void TestReplayDrainsInChunks() {
  fieldgate::overflow::OverflowCache cache(TempPath("drain"), 100);
  cache.Enqueue(Points(0, 7));

  FlakyStore store(0);
  auto       result = cache.Replay(store, 3);

  assert(!result.failed);
  assert(result.replayed == 7);
  assert(result.remaining == 0);
  assert(store.calls == 3);
  for (size_t i = 0; i < store.written.size(); ++i) assert(ValueOf(store.written[i]) == static_cast<double>(i));
  assert(cache.ReplayedCount() == 7);
  assert(cache.LastReplay().has_value());
}

void TestReplayStopsAtFirstFailure() {
  fieldgate::overflow::OverflowCache cache(TempPath("stop"), 100);
  cache.Enqueue(Points(0, 6));

  FlakyStore store(1);
  auto       result = cache.Replay(store, 2);

  assert(result.failed);
  assert(result.replayed == 0);
  assert(result.remaining == 6);
  assert(store.calls == 1);
  assert(cache.MaxAttempts() == 1);
  assert(!cache.LastReplay().has_value());

  result = cache.Replay(store, 2);
  assert(!result.failed);
  assert(result.replayed == 6);
  assert(cache.Depth() == 0);
}

void TestFailedPassKeepsDeviceOrder() {
  fieldgate::overflow::OverflowCache cache(TempPath("order"), 100);
  cache.Enqueue(Points(0, 3));

  FlakyStore store(0);
  store.fail_on_call = 2;

  auto result = cache.Replay(store, 1);
  assert(result.failed);
  assert(result.replayed == 1);
  assert(store.written.size() == 1);
  assert(ValueOf(store.written[0]) == 0);
  assert(cache.Depth() == 2);
  assert(ValueOf(cache.Peek(1).front()) == 1);

  result = cache.Replay(store, 1);
  assert(!result.failed);
  assert(result.replayed == 2);
  assert(store.written.size() == 3);
  for (int i = 0; i < 3; ++i) assert(ValueOf(store.written[i]) == i);
  assert(cache.Depth() == 0);
}

void TestPeekLeavesCorruptRows() {
  const auto path = TempPath("peek");
  fieldgate::overflow::OverflowCache cache(path, 100);
  cache.Enqueue(Points(0, 2));

  fieldgate::db::sqlite::SqliteDB other(path);
  other.Exec("INSERT INTO overflow(device_id, payload, enqueued_at_ms) VALUES('tt-01', X'FFFF', 0);");

  assert(cache.Peek(10).size() == 2);
  assert(cache.Depth() == 3);
  assert(cache.EvictedCount() == 0);

  FlakyStore store(0);
  auto       result = cache.Replay(store, 10);
  assert(!result.failed);
  assert(result.replayed == 2);
  assert(cache.EvictedCount() == 1);
  assert(cache.Depth() == 0);
}

void TestReadErrorFailsReplay() {
  const auto path = TempPath("read_error");
  fieldgate::overflow::OverflowCache cache(path, 100);
  cache.Enqueue(Points(0, 2));

  // abs() of INT64_MIN raises at step time, not at prepare time
  fieldgate::db::sqlite::SqliteDB other(path);
  other.Exec("DROP TABLE overflow;");
  other.Exec("CREATE TABLE src(seq INTEGER);");
  other.Exec("INSERT INTO src VALUES (1);");
  other.Exec("CREATE VIEW overflow AS SELECT seq, CAST(abs(seq - 9223372036854775807 - 2) AS BLOB) AS payload FROM src;");

  FlakyStore store(0);
  auto       result = cache.Replay(store, 10);
  assert(result.failed);
  assert(result.replayed == 0);
  assert(!result.error.empty());
  assert(store.calls == 0);
}

void TestSurvivesReopen() {
  const auto path = TempPath("reopen");
  {
    fieldgate::overflow::OverflowCache cache(path, 100);
    cache.Enqueue(Points(0, 4));
  }

  fieldgate::overflow::OverflowCache cache(path, 100);
  assert(cache.Depth() == 4);
  assert(ValueOf(cache.Peek(1).front()) == 0);

  cache.Enqueue(Points(4, 1));
  auto all = cache.Peek(10);
  assert(ValueOf(all.back()) == 4);
}

} // namespace

int main() {
  TestRejectsZeroCapacity();
  TestFifoOrder();
  TestEvictsOldestAtCapacity();
  TestReplayDrainsInChunks();
  TestReplayStopsAtFirstFailure();
  TestFailedPassKeepsDeviceOrder();
  TestPeekLeavesCorruptRows();
  TestReadErrorFailsReplay();
  TestSurvivesReopen();

  std::cout << "fieldgate_unit_overflow_cache: pass\n";
  return 0;
}
