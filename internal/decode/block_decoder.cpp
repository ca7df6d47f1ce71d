#include "block_decoder.hpp"

#include <cmath>
#include <cstring>

#include "internal/util/errors.hpp"

namespace fieldgate::decode {

namespace {

uint16_t ReadU16(const device::Bytes& b, uint32_t at) {
  return static_cast<uint16_t>((b[at] << 8) | b[at + 1]);
}

uint32_t ReadU32(const device::Bytes& b, uint32_t at) {
  return (static_cast<uint32_t>(b[at]) << 24) | (static_cast<uint32_t>(b[at + 1]) << 16) | (static_cast<uint32_t>(b[at + 2]) << 8) |
         static_cast<uint32_t>(b[at + 3]);
}

} // namespace

double DecodeField(const device::Bytes& block, const FieldLayout& field) {
  const uint32_t size = FieldSize(field.type);
  if (static_cast<uint64_t>(field.offset) + size > block.size()) {
    throw util::DecodeError("field " + field.name + " (" + ToString(field.type) + " @" + std::to_string(field.offset) + ") outside " +
                            std::to_string(block.size()) + "-byte block");
  }

  double raw = 0.0;
  switch (field.type) {
    case FieldType::kBool:
      return (block[field.offset] >> field.bit) & 0x1 ? 1.0 : 0.0;
    case FieldType::kByte:
      raw = block[field.offset];
      break;
    case FieldType::kWord:
      raw = ReadU16(block, field.offset);
      break;
    case FieldType::kInt:
      raw = static_cast<int16_t>(ReadU16(block, field.offset));
      break;
    case FieldType::kDWord:
      raw = ReadU32(block, field.offset);
      break;
    case FieldType::kDInt:
      raw = static_cast<int32_t>(ReadU32(block, field.offset));
      break;
    case FieldType::kReal: {
      uint32_t bits = ReadU32(block, field.offset);
      float    f;
      std::memcpy(&f, &bits, sizeof(f));
      if (!std::isfinite(f)) throw util::DecodeError("field " + field.name + " is not a finite Real");
      raw = f;
      break;
    }
  }

  return raw * field.scale;
}

FieldValues DecodeModule(const device::Bytes& block, const ModuleLayout& module) {
  FieldValues values;
  for (const auto& field : module.fields) {
    values[field.name] = DecodeField(block, field);
  }
  return values;
}

RawDevice DecodeDevice(const device::Bytes& block, const DeviceLayout& device) {
  RawDevice out;
  for (const auto& module : device.modules) {
    out[module.tag] = RawModule{module.module_type, DecodeModule(block, module)};
  }
  return out;
}

} // namespace fieldgate::decode
