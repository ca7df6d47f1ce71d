#include "value_converter.hpp"

#include <cmath>

#include "internal/util/errors.hpp"

namespace fieldgate::convert {

// ------------------------------------------------------------------
// Built-ins
// ------------------------------------------------------------------

FieldValues TemperatureConverter::Convert(const FieldValues& raw) const {
  auto   it          = raw.find("Temperature");
  double temperature = it == raw.end() ? 0.0 : std::trunc(it->second) * 0.1;

  if (temperature < -10.0) temperature = std::fabs(temperature);

  return {{"temperature", std::round(temperature * 10.0) / 10.0}};
}

LinearConverter::LinearConverter(const fieldgate::runtime::config::ModuleTypeConfig& config) {
  for (const auto& f : config.fields()) {
    if (f.field().empty()) throw util::InvalidConfig("module type " + config.module_type() + ": conversion without field name");

    Rule rule;
    rule.output = f.output().empty() ? f.field() : f.output();
    rule.scale  = f.scale() == 0.0 ? 1.0 : f.scale();
    rule.bias   = f.bias();
    rules_[f.field()] = std::move(rule);
  }
}

FieldValues LinearConverter::Convert(const FieldValues& raw) const {
  FieldValues out;
  for (const auto& [field, rule] : rules_) {
    auto it = raw.find(field);
    if (it == raw.end()) continue;
    out[rule.output] = it->second * rule.scale + rule.bias;
  }
  return out;
}

// ------------------------------------------------------------------
// Registry
// ------------------------------------------------------------------

ValueConverter::ValueConverter() {
  Register("TemperatureSensor", std::make_shared<TemperatureConverter>());
}

ValueConverter::ValueConverter(const fieldgate::runtime::config::RuntimeConfig& config) : ValueConverter() {
  for (const auto& mt : config.module_types()) {
    if (mt.module_type().empty()) throw util::InvalidConfig("module_types entry without module_type");
    if (mt.fields_size() == 0) continue;
    Register(mt.module_type(), std::make_shared<LinearConverter>(mt));
  }
}

void ValueConverter::Register(const std::string& module_type, std::shared_ptr<const ModuleConverter> converter) {
  converters_[module_type] = std::move(converter);
}

FieldValues ValueConverter::Convert(const std::string& module_type, const FieldValues& raw) const {
  auto it = converters_.find(module_type);
  if (it == converters_.end()) return raw;
  return it->second->Convert(raw);
}

} // namespace fieldgate::convert
