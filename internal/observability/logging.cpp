#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace fieldgate::observability {
namespace {

constexpr const char* kLoggerName     = "fieldgate";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) return value;
  if (!configured.empty()) return configured;
  return fallback;
}

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\"=") != std::string::npos;
}

void AppendValue(std::ostringstream& out, const std::string& value) {
  if (!NeedsQuoting(value)) {
    out << value;
    return;
  }
  out << '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out << '\\';
    out << c;
  }
  out << '"';
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) out << ' ';
    first = false;
    out << field.key << '=';
    AppendValue(out, field.value);
  }
  return out.str();
}

std::vector<spdlog::sink_ptr> BuildSinks(const fieldgate::runtime::config::LoggingConfig& logging) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!logging.file().empty()) {
    const std::size_t max_mb    = logging.file_max_size_mb() == 0 ? 10 : logging.file_max_size_mb();
    const std::size_t max_files = logging.file_max_files() == 0 ? 5 : logging.file_max_files();
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logging.file(), max_mb * 1024 * 1024, max_files));
  }
  return sinks;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

void InitializeLogging(const fieldgate::runtime::config::RuntimeConfig& config) {
  const auto& logging    = config.logging();
  const auto  level_name = EnvOr("FIELDGATE_LOG_LEVEL", logging.level(), "info");

  spdlog::drop(kLoggerName);
  auto sinks  = BuildSinks(logging);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(EnvOr("FIELDGATE_LOG_PATTERN", logging.pattern(), kDefaultPattern));

  // from_str maps unknown names to off
  auto level = spdlog::level::from_str(level_name);
  if (level == spdlog::level::off && level_name != "off") {
    level = spdlog::level::info;
    logger->warn("unknown log level '{}', using info", level_name);
  }
  logger->set_level(level);

  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace fieldgate::observability
