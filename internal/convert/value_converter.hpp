#pragma once

#include <map>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/decode/block_decoder.hpp"

namespace fieldgate::convert {

using decode::FieldValues;

// Raw decoded values of one module -> engineering units.
class ModuleConverter {
 public:
  virtual ~ModuleConverter() = default;

  virtual FieldValues Convert(const FieldValues& raw) const = 0;
};

/*
  TemperatureSensor: raw Temperature is 0.1 degC (Int).
  Readings below -10 degC are a known sensor sign fault and are reported
  as their absolute value. Output rounded to 0.1.
*/
class TemperatureConverter final : public ModuleConverter {
 public:
  FieldValues Convert(const FieldValues& raw) const override;
};

// Configured per module type: out = raw * scale + bias, listed fields only.
class LinearConverter final : public ModuleConverter {
 public:
  explicit LinearConverter(const fieldgate::runtime::config::ModuleTypeConfig& config);

  FieldValues Convert(const FieldValues& raw) const override;

 private:
  struct Rule {
    std::string output;
    double      scale = 1.0;
    double      bias  = 0.0;
  };

  std::map<std::string, Rule> rules_;
};

/*
  Module type -> converter.

  Configured module types override built-ins; unknown types pass raw
  values through unchanged.
*/
class ValueConverter {
 public:
  ValueConverter();
  explicit ValueConverter(const fieldgate::runtime::config::RuntimeConfig& config);

  void Register(const std::string& module_type, std::shared_ptr<const ModuleConverter> converter);

  FieldValues Convert(const std::string& module_type, const FieldValues& raw) const;

  bool Has(const std::string& module_type) const {
    return converters_.count(module_type) != 0;
  }

 private:
  std::map<std::string, std::shared_ptr<const ModuleConverter>> converters_;
};

} // namespace fieldgate::convert
