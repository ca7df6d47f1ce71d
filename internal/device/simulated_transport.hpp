#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <random>

#include "internal/decode/block_layout.hpp"
#include "transport.hpp"

namespace fieldgate::device {

/*
  Transport without hardware.

  Fills every configured field of a block with a bounded random value of
  its type, so decoded readings look plausible. fail_every > 0 makes
  every Nth read time out; SetOnline(false) makes connects and reads fail
  with ConnectionError until switched back.
*/
class SimulatedTransport final : public Transport {
 public:
  SimulatedTransport(std::vector<decode::BlockLayout> blocks, uint32_t seed, uint32_t fail_every = 0);

  void Connect(const Endpoint& endpoint) override;
  void Disconnect() override;
  bool IsAlive() override;

  Bytes ReadBlock(uint32_t block_id, uint32_t offset, uint32_t size) override;

  std::string Name() const override {
    return "simulated";
  }

  void SetOnline(bool online) {
    online_ = online;
  }

  uint64_t ReadCount() const {
    return reads_;
  }

 private:
  void Fill(Bytes& out, const decode::FieldLayout& field);

  std::map<uint32_t, decode::BlockLayout> blocks_;
  uint32_t                                fail_every_;

  std::mutex   rng_mutex_;
  std::mt19937 rng_;

  std::atomic<bool>     online_{true};
  std::atomic<bool>     connected_{false};
  std::atomic<uint64_t> reads_{0};
};

} // namespace fieldgate::device
