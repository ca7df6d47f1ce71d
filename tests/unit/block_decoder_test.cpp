#include "internal/decode/block_decoder.hpp"

#include <cassert>
#include <cmath>
#include <cstring>
#include <iostream>
#include <string>

#include "internal/decode/block_layout.hpp"
#include "internal/util/errors.hpp"

namespace {

using fieldgate::decode::FieldLayout;
using fieldgate::decode::FieldType;
using fieldgate::runtime::config::RuntimeConfig;

RuntimeConfig OneDeviceConfig() {
  RuntimeConfig config;
  auto*         block = config.add_blocks();
  block->set_block_id(8);
  block->set_size(16);

  auto* device = block->add_devices();
  device->set_device_id("tt-01");
  device->set_device_type("Thermometer");
  device->set_offset(4);

  auto* module = device->add_modules();
  module->set_tag("T1");
  module->set_module_type("TemperatureSensor");
  module->set_offset(2);

  auto* field = module->add_fields();
  field->set_name("Temperature");
  field->set_data_type("Int");
  field->set_offset(0);
  return config;
}

template <typename Fn>
bool ThrowsInvalidConfig(Fn&& fn) {
  try {
    fn();
  } catch (const fieldgate::util::InvalidConfig&) {
    return true;
  }
  return false;
}

void TestCompileResolvesAbsoluteOffsets() {
  auto blocks = fieldgate::decode::CompileLayouts(OneDeviceConfig());
  assert(blocks.size() == 1);
  assert(blocks[0].name == "DB8");
  assert(blocks[0].devices.size() == 1);

  const auto& device = blocks[0].devices[0];
  assert(device.device_name == "tt-01");
  assert(device.block_id == 8);
  assert(device.modules[0].offset == 6);
  assert(device.modules[0].fields[0].offset == 6);
  assert(device.modules[0].fields[0].type == FieldType::kInt);
  assert(device.modules[0].fields[0].scale == 1.0);
}

void TestCompileRejectsBadLayouts() {
  {
    auto config = OneDeviceConfig();
    config.mutable_blocks(0)->mutable_devices(0)->mutable_modules(0)->mutable_fields(0)->set_data_type("Float");
    assert(ThrowsInvalidConfig([&] { fieldgate::decode::CompileLayouts(config); }));
  }
  {
    auto config = OneDeviceConfig();
    config.mutable_blocks(0)->mutable_devices(0)->mutable_modules(0)->mutable_fields(0)->set_offset(9);
    assert(ThrowsInvalidConfig([&] { fieldgate::decode::CompileLayouts(config); }));
  }
  {
    auto config = OneDeviceConfig();
    config.mutable_blocks(0)->add_devices()->CopyFrom(config.blocks(0).devices(0));
    assert(ThrowsInvalidConfig([&] { fieldgate::decode::CompileLayouts(config); }));
  }
  {
    auto config = OneDeviceConfig();
    auto* field = config.mutable_blocks(0)->mutable_devices(0)->mutable_modules(0)->mutable_fields(0);
    field->set_data_type("Bool");
    field->set_bit(8);
    assert(ThrowsInvalidConfig([&] { fieldgate::decode::CompileLayouts(config); }));
  }
  {
    auto config = OneDeviceConfig();
    config.mutable_blocks(0)->set_disabled(true);
    assert(ThrowsInvalidConfig([&] { fieldgate::decode::CompileLayouts(config); }));
  }
}

FieldLayout Field(FieldType type, uint32_t offset, uint8_t bit = 0, double scale = 1.0) {
  FieldLayout field;
  field.name   = "f";
  field.type   = type;
  field.offset = offset;
  field.bit    = bit;
  field.scale  = scale;
  return field;
}

void TestBigEndianIntegers() {
  fieldgate::device::Bytes block = {0x00, 0xEB, 0xFF, 0x38, 0x12, 0x34, 0x56, 0x78, 0x05};

  assert(fieldgate::decode::DecodeField(block, Field(FieldType::kInt, 0)) == 235.0);
  assert(fieldgate::decode::DecodeField(block, Field(FieldType::kInt, 2)) == -200.0);
  assert(fieldgate::decode::DecodeField(block, Field(FieldType::kWord, 2)) == 65336.0);
  assert(fieldgate::decode::DecodeField(block, Field(FieldType::kDWord, 4)) == static_cast<double>(0x12345678u));
  assert(fieldgate::decode::DecodeField(block, Field(FieldType::kByte, 8)) == 5.0);
  assert(fieldgate::decode::DecodeField(block, Field(FieldType::kInt, 0, 0, 0.5)) == 117.5);

  fieldgate::device::Bytes negative = {0xFF, 0xFF, 0xFF, 0xFE};
  assert(fieldgate::decode::DecodeField(negative, Field(FieldType::kDInt, 0)) == -2.0);
}

void TestBoolBitsAndReal() {
  fieldgate::device::Bytes block = {0x05, 0x41, 0x20, 0x00, 0x00};
  assert(fieldgate::decode::DecodeField(block, Field(FieldType::kBool, 0, 0)) == 1.0);
  assert(fieldgate::decode::DecodeField(block, Field(FieldType::kBool, 0, 1)) == 0.0);
  assert(fieldgate::decode::DecodeField(block, Field(FieldType::kBool, 0, 2)) == 1.0);
  // 0x41200000 == 10.0f
  assert(fieldgate::decode::DecodeField(block, Field(FieldType::kReal, 1)) == 10.0);
}

void TestDecodeErrors() {
  fieldgate::device::Bytes short_block = {0x00, 0x01};
  bool                     short_read  = false;
  try {
    fieldgate::decode::DecodeField(short_block, Field(FieldType::kDInt, 0));
  } catch (const fieldgate::util::DecodeError&) {
    short_read = true;
  }
  assert(short_read);

  fieldgate::device::Bytes nan_block = {0x7F, 0xC0, 0x00, 0x00};
  bool                     nan       = false;
  try {
    fieldgate::decode::DecodeField(nan_block, Field(FieldType::kReal, 0));
  } catch (const fieldgate::util::DecodeError&) {
    nan = true;
  }
  assert(nan);
}

void TestDecodeDeviceGroupsByTag() {
  auto blocks = fieldgate::decode::CompileLayouts(OneDeviceConfig());

  fieldgate::device::Bytes block(16, 0);
  block[6] = 0x00;
  block[7] = 0xEB;

  auto raw = fieldgate::decode::DecodeDevice(block, blocks[0].devices[0]);
  assert(raw.size() == 1);
  assert(raw.at("T1").module_type == "TemperatureSensor");
  assert(raw.at("T1").values.at("Temperature") == 235.0);
}

} // namespace

int main() {
  TestCompileResolvesAbsoluteOffsets();
  TestCompileRejectsBadLayouts();
  TestBigEndianIntegers();
  TestBoolBitsAndReal();
  TestDecodeErrors();
  TestDecodeDeviceGroupsByTag();

  std::cout << "fieldgate_unit_block_decoder: pass\n";
  return 0;
}
