#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fieldgate_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

const char* kBlocks = R"(blocks:
  - block_id: 8
    name: "DB8"
    size: 16
    devices:
      - device_id: "hopper_1"
        device_type: "hopper"
        modules:
          - tag: "temp"
            module_type: "TemperatureSensor"
            fields:
              - name: "Temperature"
                data_type: Int
                offset: 0
)";

bool ThrowsInvalidConfig(const std::filesystem::path& path) {
  try {
    (void)fieldgate::config::ConfigLoader::LoadFromYaml(path.string());
  } catch (const fieldgate::util::InvalidConfig&) {
    return true;
  }
  return false;
}

void TestMinimalConfigGetsDefaults() {
  const auto yaml_path = WriteYaml("minimal", kBlocks);

  auto config = fieldgate::config::ConfigLoader::LoadFromYaml(yaml_path.string());

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.device().transport() == "simulated");
  assert(config.device().read_retry().max_attempts() == 2);
  assert(config.device().read_retry().delay_ms() == 2000);
  assert(config.device().reconnect().backoff_ms() == 1000);
  assert(config.polling().interval_ms() == 5000);
  assert(!config.polling().disabled());
  assert(config.batch().cycle_threshold() == 12);
  assert(config.batch().max_points() == 500);
  assert(config.batch().max_age_ms() == 12u * 5000u * 2u);
  assert(config.batch().measurement() == "sensor_data");
  assert(config.store().has_memory());
  assert(config.overflow().replay_interval_ms() == 60000);
  assert(config.overflow().replay_batch_size() == 100);
  assert(config.realtime().heartbeat_timeout_ms() == 45000);
  assert(config.realtime().reap_interval_ms() == 10000);
  assert(config.realtime().write_timeout_ms() == 5000);
  assert(config.realtime().max_pending_messages() == 8);
  assert(config.realtime().source() == "mock");

  const auto& field = config.blocks(0).devices(0).modules(0).fields(0);
  assert(field.data_type() == "Int");
  assert(field.name() == "Temperature");
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted", std::string(R"(server:
  bind_address: "line1\nline2☃"
store:
  sqlite:
    path: "C:\\fieldgate\\\"quoted\"\\points.db"
)") + kBlocks);

  auto config = fieldgate::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.store().sqlite().path() == "C:\\fieldgate\\\"quoted\"\\points.db");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", std::string("unknown_field: 123\n") + kBlocks);
  assert(ThrowsInvalidConfig(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestMissingBlocksAreRejected() {
  const auto yaml_path = WriteYaml("no_blocks", R"(server:
  bind_address: "0.0.0.0:50061"
)");
  assert(ThrowsInvalidConfig(yaml_path));
}

void TestPushMustBeFasterThanPolling() {
  const auto yaml_path = WriteYaml("slow_push", std::string(R"(polling:
  interval_ms: 1000
realtime:
  push_interval_ms: 2000
)") + kBlocks);
  assert(ThrowsInvalidConfig(yaml_path));
}

void TestHeartbeatTimeoutMustExceedReapInterval() {
  const auto yaml_path = WriteYaml("short_timeout", std::string(R"(realtime:
  heartbeat_timeout_ms: 5000
  reap_interval_ms: 10000
)") + kBlocks);
  assert(ThrowsInvalidConfig(yaml_path));
}

void TestUnknownTransportIsRejected() {
  const auto yaml_path = WriteYaml("bad_transport", std::string(R"(device:
  transport: "modbus"
)") + kBlocks);
  assert(ThrowsInvalidConfig(yaml_path));
}

void TestMissingFileIsInvalidConfig() {
  assert(ThrowsInvalidConfig(std::filesystem::temp_directory_path() / "fieldgate_does_not_exist.yaml"));
}

} // namespace

int main() {
  TestMinimalConfigGetsDefaults();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingBlocksAreRejected();
  TestPushMustBeFasterThanPolling();
  TestHeartbeatTimeoutMustExceedReapInterval();
  TestUnknownTransportIsRejected();
  TestMissingFileIsInvalidConfig();

  std::cout << "fieldgate_unit_config_loader: pass\n";
  return 0;
}
