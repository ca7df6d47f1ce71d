#include "block_layout.hpp"

#include <set>

#include "internal/util/errors.hpp"

namespace fieldgate::decode {

using fieldgate::runtime::config::BlockConfig;
using fieldgate::runtime::config::RuntimeConfig;

std::optional<FieldType> ParseFieldType(std::string_view name) {
  if (name == "Bool") return FieldType::kBool;
  if (name == "Byte") return FieldType::kByte;
  if (name == "Word") return FieldType::kWord;
  if (name == "Int") return FieldType::kInt;
  if (name == "DWord") return FieldType::kDWord;
  if (name == "DInt") return FieldType::kDInt;
  if (name == "Real") return FieldType::kReal;
  return std::nullopt;
}

const char* ToString(FieldType type) {
  switch (type) {
    case FieldType::kBool:
      return "Bool";
    case FieldType::kByte:
      return "Byte";
    case FieldType::kWord:
      return "Word";
    case FieldType::kInt:
      return "Int";
    case FieldType::kDWord:
      return "DWord";
    case FieldType::kDInt:
      return "DInt";
    case FieldType::kReal:
      return "Real";
  }
  return "unknown";
}

uint32_t FieldSize(FieldType type) {
  switch (type) {
    case FieldType::kBool:
    case FieldType::kByte:
      return 1;
    case FieldType::kWord:
    case FieldType::kInt:
      return 2;
    case FieldType::kDWord:
    case FieldType::kDInt:
    case FieldType::kReal:
      return 4;
  }
  return 0;
}

namespace {

[[noreturn]] void Fail(const BlockConfig& block, const std::string& where, const std::string& what) {
  throw util::InvalidConfig("block " + std::to_string(block.block_id()) + " " + where + ": " + what);
}

BlockLayout CompileBlock(const BlockConfig& cfg, std::set<std::string>& device_ids) {
  BlockLayout block;
  block.block_id = cfg.block_id();
  block.name     = cfg.name().empty() ? "DB" + std::to_string(cfg.block_id()) : cfg.name();
  block.offset   = cfg.offset();
  block.size     = cfg.size();

  if (block.size == 0) Fail(cfg, "", "size must be > 0");

  for (const auto& dev_cfg : cfg.devices()) {
    if (dev_cfg.device_id().empty()) Fail(cfg, "device", "device_id is required");
    if (!device_ids.insert(dev_cfg.device_id()).second) Fail(cfg, dev_cfg.device_id(), "duplicate device_id");

    DeviceLayout device;
    device.device_id   = dev_cfg.device_id();
    device.device_name = dev_cfg.device_name().empty() ? dev_cfg.device_id() : dev_cfg.device_name();
    device.device_type = dev_cfg.device_type();
    device.block_id    = block.block_id;

    std::set<std::string> tags;
    for (const auto& mod_cfg : dev_cfg.modules()) {
      const std::string where = dev_cfg.device_id() + "/" + mod_cfg.tag();
      if (mod_cfg.tag().empty()) Fail(cfg, dev_cfg.device_id(), "module tag is required");
      if (!tags.insert(mod_cfg.tag()).second) Fail(cfg, where, "duplicate module tag");
      if (mod_cfg.fields_size() == 0) Fail(cfg, where, "module has no fields");

      ModuleLayout module;
      module.tag         = mod_cfg.tag();
      module.module_type = mod_cfg.module_type();
      module.offset      = dev_cfg.offset() + mod_cfg.offset();

      for (const auto& field_cfg : mod_cfg.fields()) {
        auto type = ParseFieldType(field_cfg.data_type());
        if (!type) Fail(cfg, where + "." + field_cfg.name(), "unknown data_type '" + field_cfg.data_type() + "'");
        if (field_cfg.name().empty()) Fail(cfg, where, "field name is required");
        if (field_cfg.bit() > 7) Fail(cfg, where + "." + field_cfg.name(), "bit must be 0..7");

        FieldLayout field;
        field.name   = field_cfg.name();
        field.type   = *type;
        field.offset = module.offset + field_cfg.offset();
        field.bit    = static_cast<uint8_t>(field_cfg.bit());
        field.scale  = field_cfg.scale() == 0.0 ? 1.0 : field_cfg.scale();

        if (field.offset + FieldSize(field.type) > block.size) {
          Fail(cfg, where + "." + field.name, "ends at byte " + std::to_string(field.offset + FieldSize(field.type)) + " past block size " + std::to_string(block.size));
        }

        module.fields.push_back(std::move(field));
      }

      device.modules.push_back(std::move(module));
    }

    block.devices.push_back(std::move(device));
  }

  if (block.devices.empty()) Fail(cfg, "", "no devices");
  return block;
}

} // namespace

std::vector<BlockLayout> CompileLayouts(const RuntimeConfig& config) {
  std::vector<BlockLayout> blocks;
  std::set<std::string>    device_ids;

  for (const auto& cfg : config.blocks()) {
    if (cfg.disabled()) continue;
    blocks.push_back(CompileBlock(cfg, device_ids));
  }

  if (blocks.empty()) throw util::InvalidConfig("no enabled blocks configured");
  return blocks;
}

} // namespace fieldgate::decode
