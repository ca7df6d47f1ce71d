#pragma once

#include <map>
#include <string>

#include "block_layout.hpp"
#include "internal/device/transport.hpp"

namespace fieldgate::decode {

using FieldValues = std::map<std::string, double>;

struct RawModule {
  std::string module_type;
  FieldValues values;
};

// module tag -> raw values
using RawDevice = std::map<std::string, RawModule>;

/*
  Big-endian (S7 byte order) decoding of a block read against its layout.
  Bool fields decode to 0/1. Field scale is applied here.

  Throws util::DecodeError when the buffer is shorter than the layout or a
  Real decodes to a non-finite value.
*/
double      DecodeField(const device::Bytes& block, const FieldLayout& field);
FieldValues DecodeModule(const device::Bytes& block, const ModuleLayout& module);
RawDevice   DecodeDevice(const device::Bytes& block, const DeviceLayout& device);

} // namespace fieldgate::decode
