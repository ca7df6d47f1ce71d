#include "internal/pipeline/batch_writer.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>

#include "internal/store/memory/memory_timeseries_store.hpp"

namespace {

using fieldgate::pipeline::BatchPolicy;
using fieldgate::pipeline::BatchWriter;
using fieldgate::pipeline::FlushOutcome;
using fieldgate::v1::DeviceReading;
using fieldgate::v1::Point;

class SwitchableStore final : public fieldgate::store::TimeSeriesStore {
 public:
  fieldgate::db::Result WriteBatch(const std::vector<Point>& points) override {
    ++write_calls;
    if (fail_writes) return fieldgate::db::Result::Err(fieldgate::db::ErrorCode::Timeout, "write timed out");
    return inner.WriteBatch(points);
  }

  bool Healthy() override {
    return healthy;
  }

  uint64_t PointCount() override {
    return inner.PointCount();
  }

  std::optional<fieldgate::util::TimePoint> LatestTimestamp() override {
    return inner.LatestTimestamp();
  }

  std::string Name() const override {
    return "switchable";
  }

  bool healthy     = true;
  bool fail_writes = false;
  int  write_calls = 0;

  fieldgate::store::memory::MemoryTimeSeriesStore inner;
};

std::shared_ptr<fieldgate::overflow::OverflowCache> TempOverflow(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / ("fieldgate_batch_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  auto path = dir / (name + ".db");
  std::filesystem::remove(path);
  return std::make_shared<fieldgate::overflow::OverflowCache>(path.string(), 1000);
}

const auto kT0 = fieldgate::util::FromUnixMillis(1'700'000'000'000);

DeviceReading Reading(const std::string& id, fieldgate::util::TimePoint at, int modules = 1) {
  DeviceReading r;
  r.set_device_id(id);
  r.set_device_type("Thermometer");
  r.set_block_id(8);
  *r.mutable_timestamp() = fieldgate::util::ToProto(at);
  for (int m = 0; m < modules; ++m) {
    auto& module = (*r.mutable_modules())["T" + std::to_string(m + 1)];
    module.set_module_type("TemperatureSensor");
    (*module.mutable_fields())["temperature"] = 20.0 + m;
  }
  return r;
}

BatchPolicy Policy(uint32_t cycles, std::chrono::milliseconds max_age, uint32_t max_points) {
  BatchPolicy p;
  p.cycle_threshold = cycles;
  p.max_age         = max_age;
  p.max_points      = max_points;
  return p;
}

void TestToPointsOnePerModule() {
  auto points = BatchWriter::ToPoints({Reading("tt-01", kT0, 2)}, "sensor_data");
  assert(points.size() == 2);

  const auto& p = points[0];
  assert(p.measurement() == "sensor_data");
  assert(p.tags().at("device_id") == "tt-01");
  assert(p.tags().at("device_type") == "Thermometer");
  assert(p.tags().at("module_type") == "TemperatureSensor");
  assert(p.tags().at("module_tag") == "T1");
  assert(p.tags().at("block_id") == "8");
  assert(p.fields().at("temperature") == 20.0);
  assert(fieldgate::util::FromProto(p.timestamp()) == kT0);
}

void TestCycleThresholdTrigger() {
  auto        store = std::make_shared<SwitchableStore>();
  BatchWriter writer(Policy(3, std::chrono::hours(1), 0), store, TempOverflow("cycles"));

  // empty cycles still count
  writer.RecordCycle({Reading("tt-01", kT0)}, kT0);
  writer.RecordCycle({}, kT0 + std::chrono::seconds(5));
  assert(!writer.FlushDue(kT0 + std::chrono::seconds(5)));
  assert(writer.FlushIfDue(kT0 + std::chrono::seconds(5)) == FlushOutcome::kNotDue);

  writer.RecordCycle({Reading("tt-01", kT0 + std::chrono::seconds(10))}, kT0 + std::chrono::seconds(10));
  assert(writer.FlushIfDue(kT0 + std::chrono::seconds(10)) == FlushOutcome::kWritten);

  auto stats = writer.Stats();
  assert(stats.written_points == 2);
  assert(stats.pending_cycles == 0);
  assert(stats.pending_points == 0);
  assert(stats.last_successful_flush.has_value());
  assert(store->inner.PointCount() == 2);
}

void TestMaxAgeTrigger() {
  auto        store = std::make_shared<SwitchableStore>();
  BatchWriter writer(Policy(100, std::chrono::seconds(30), 0), store, TempOverflow("age"));

  writer.RecordCycle({Reading("tt-01", kT0)}, kT0);
  writer.RecordCycle({Reading("tt-01", kT0 + std::chrono::seconds(20))}, kT0 + std::chrono::seconds(20));
  assert(!writer.FlushDue(kT0 + std::chrono::seconds(29)));
  assert(writer.FlushDue(kT0 + std::chrono::seconds(30)));
}

void TestMaxPointsTrigger() {
  auto        store = std::make_shared<SwitchableStore>();
  BatchWriter writer(Policy(100, std::chrono::hours(1), 4), store, TempOverflow("points"));

  writer.RecordCycle({Reading("tt-01", kT0, 2)}, kT0);
  assert(!writer.FlushDue(kT0));
  writer.RecordCycle({Reading("tt-02", kT0, 2)}, kT0);
  assert(writer.FlushDue(kT0));
}

void TestFailedWriteGoesToOverflow() {
  auto store       = std::make_shared<SwitchableStore>();
  auto overflow    = TempOverflow("fail");
  store->fail_writes = true;
  BatchWriter writer(Policy(1, std::chrono::hours(1), 0), store, overflow);

  writer.RecordCycle({Reading("tt-01", kT0), Reading("tt-02", kT0)}, kT0);
  assert(writer.FlushIfDue(kT0) == FlushOutcome::kOverflowed);

  auto stats = writer.Stats();
  assert(stats.failed_flushes == 1);
  assert(stats.failed_points == 2);
  assert(stats.lost_points == 0);
  assert(stats.pending_points == 0);
  assert(overflow->Depth() == 2);
}

void TestUnhealthyStoreSkipsWrite() {
  auto store     = std::make_shared<SwitchableStore>();
  auto overflow  = TempOverflow("unhealthy");
  store->healthy = false;
  BatchWriter writer(Policy(1, std::chrono::hours(1), 0), store, overflow);

  writer.RecordCycle({Reading("tt-01", kT0)}, kT0);
  assert(writer.Flush() == FlushOutcome::kOverflowed);
  assert(store->write_calls == 0);
  assert(overflow->Depth() == 1);
}

void TestFlushOfEmptyBuffer() {
  auto        store = std::make_shared<SwitchableStore>();
  BatchWriter writer(Policy(1, std::chrono::hours(1), 0), store, TempOverflow("empty"));

  assert(writer.Flush() == FlushOutcome::kEmpty);
  writer.RecordCycle({}, kT0);
  assert(writer.FlushIfDue(kT0) == FlushOutcome::kEmpty);
  assert(store->write_calls == 0);
}

} // namespace

int main() {
  TestToPointsOnePerModule();
  TestCycleThresholdTrigger();
  TestMaxAgeTrigger();
  TestMaxPointsTrigger();
  TestFailedWriteGoesToOverflow();
  TestUnhealthyStoreSkipsWrite();
  TestFlushOfEmptyBuffer();

  std::cout << "fieldgate_unit_batch_writer: pass\n";
  return 0;
}
