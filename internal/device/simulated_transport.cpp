#include "simulated_transport.hpp"

#include <cstring>

#include "internal/util/errors.hpp"

namespace fieldgate::device {

using decode::FieldType;

namespace {

void PutU16(Bytes& b, uint32_t at, uint16_t v) {
  b[at]     = static_cast<uint8_t>(v >> 8);
  b[at + 1] = static_cast<uint8_t>(v);
}

void PutU32(Bytes& b, uint32_t at, uint32_t v) {
  b[at]     = static_cast<uint8_t>(v >> 24);
  b[at + 1] = static_cast<uint8_t>(v >> 16);
  b[at + 2] = static_cast<uint8_t>(v >> 8);
  b[at + 3] = static_cast<uint8_t>(v);
}

} // namespace

SimulatedTransport::SimulatedTransport(std::vector<decode::BlockLayout> blocks, uint32_t seed, uint32_t fail_every)
    : fail_every_(fail_every), rng_(seed) {
  for (auto& block : blocks) {
    blocks_.emplace(block.block_id, std::move(block));
  }
}

void SimulatedTransport::Connect(const Endpoint& endpoint) {
  if (!online_) throw util::ConnectionError("simulated device " + endpoint.host + " offline");
  connected_ = true;
}

void SimulatedTransport::Disconnect() {
  connected_ = false;
}

bool SimulatedTransport::IsAlive() {
  return connected_ && online_;
}

Bytes SimulatedTransport::ReadBlock(uint32_t block_id, uint32_t offset, uint32_t size) {
  if (!IsAlive()) {
    connected_ = false;
    throw util::ConnectionError("simulated device not connected");
  }

  const uint64_t n = ++reads_;
  if (fail_every_ > 0 && n % fail_every_ == 0) {
    throw util::ReadTimeout("simulated timeout on block " + std::to_string(block_id) + " read #" + std::to_string(n));
  }

  auto it = blocks_.find(block_id);
  if (it == blocks_.end()) {
    throw util::ConnectionError("block " + std::to_string(block_id) + " does not exist");
  }

  (void)offset;
  Bytes data(size, 0);

  std::lock_guard lock(rng_mutex_);
  for (const auto& device : it->second.devices) {
    for (const auto& module : device.modules) {
      for (const auto& field : module.fields) {
        if (field.offset + decode::FieldSize(field.type) <= size) Fill(data, field);
      }
    }
  }
  return data;
}

void SimulatedTransport::Fill(Bytes& out, const decode::FieldLayout& field) {
  switch (field.type) {
    case FieldType::kBool:
      if (std::bernoulli_distribution(0.5)(rng_)) out[field.offset] |= static_cast<uint8_t>(1u << field.bit);
      break;
    case FieldType::kByte:
      out[field.offset] = static_cast<uint8_t>(std::uniform_int_distribution<int>(0, 255)(rng_));
      break;
    case FieldType::kWord:
      PutU16(out, field.offset, static_cast<uint16_t>(std::uniform_int_distribution<int>(0, 5000)(rng_)));
      break;
    case FieldType::kInt:
      PutU16(out, field.offset, static_cast<uint16_t>(static_cast<int16_t>(std::uniform_int_distribution<int>(200, 1500)(rng_))));
      break;
    case FieldType::kDWord:
      PutU32(out, field.offset, std::uniform_int_distribution<uint32_t>(0, 100000)(rng_));
      break;
    case FieldType::kDInt:
      PutU32(out, field.offset, static_cast<uint32_t>(std::uniform_int_distribution<int32_t>(-1000, 100000)(rng_)));
      break;
    case FieldType::kReal: {
      float    f = std::uniform_real_distribution<float>(0.0f, 1000.0f)(rng_);
      uint32_t bits;
      std::memcpy(&bits, &f, sizeof(bits));
      PutU32(out, field.offset, bits);
      break;
    }
  }
}

} // namespace fieldgate::device
