#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"

namespace fieldgate::decode {

enum class FieldType { kBool, kByte, kWord, kInt, kDWord, kDInt, kReal };

std::optional<FieldType> ParseFieldType(std::string_view name);
const char*              ToString(FieldType type);
uint32_t                 FieldSize(FieldType type);

/*
  Compiled layouts.

  Offsets in the config are relative (field -> module -> device -> block);
  compiled offsets are absolute within the bytes read for the block, so
  the decoder never re-derives them.
*/
struct FieldLayout {
  std::string name;
  FieldType   type   = FieldType::kWord;
  uint32_t    offset = 0;
  uint8_t     bit    = 0;
  double      scale  = 1.0;
};

struct ModuleLayout {
  std::string              tag;
  std::string              module_type;
  uint32_t                 offset = 0;
  std::vector<FieldLayout> fields;
};

struct DeviceLayout {
  std::string               device_id;
  std::string               device_name;
  std::string               device_type;
  uint32_t                  block_id = 0;
  std::vector<ModuleLayout> modules;
};

struct BlockLayout {
  uint32_t                  block_id = 0;
  std::string               name;
  uint32_t                  offset = 0;
  uint32_t                  size   = 0;
  std::vector<DeviceLayout> devices;
};

// Disabled blocks are dropped. Throws util::InvalidConfig on any layout
// that does not fit its block or names an unknown type.
std::vector<BlockLayout> CompileLayouts(const fieldgate::runtime::config::RuntimeConfig& config);

} // namespace fieldgate::decode
