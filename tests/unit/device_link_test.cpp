#include "internal/device/device_link.hpp"

#include <cassert>
#include <deque>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/decode/block_layout.hpp"
#include "internal/device/simulated_transport.hpp"
#include "internal/util/errors.hpp"

namespace {

using fieldgate::device::Bytes;
using fieldgate::device::DeviceLink;
using fieldgate::device::Endpoint;
using fieldgate::device::LinkState;
using fieldgate::device::ReadRetryPolicy;
using fieldgate::device::ReconnectPolicy;

enum class Step { kOk, kTimeout, kDrop };

// Scripted transport; shared state survives the move into DeviceLink.
struct Script {
  std::deque<Step> reads;
  int              connects_to_fail = 0;
  int              connect_calls    = 0;
  int              disconnect_calls = 0;
  int              read_calls       = 0;
  bool             alive            = false;
};

class FakeTransport final : public fieldgate::device::Transport {
 public:
  explicit FakeTransport(std::shared_ptr<Script> script) : script_(std::move(script)) {
  }

  void Connect(const Endpoint&) override {
    ++script_->connect_calls;
    if (script_->connects_to_fail > 0) {
      --script_->connects_to_fail;
      throw fieldgate::util::ConnectionError("refused");
    }
    script_->alive = true;
  }

  void Disconnect() override {
    ++script_->disconnect_calls;
    script_->alive = false;
  }

  bool IsAlive() override {
    return script_->alive;
  }

  Bytes ReadBlock(uint32_t, uint32_t, uint32_t size) override {
    ++script_->read_calls;
    Step step = Step::kOk;
    if (!script_->reads.empty()) {
      step = script_->reads.front();
      script_->reads.pop_front();
    }
    if (step == Step::kTimeout) throw fieldgate::util::ReadTimeout("timeout");
    if (step == Step::kDrop) {
      script_->alive = false;
      throw fieldgate::util::ConnectionError("dropped");
    }
    return Bytes(size, 0x5A);
  }

  std::string Name() const override {
    return "fake";
  }

 private:
  std::shared_ptr<Script> script_;
};

struct Harness {
  std::shared_ptr<Script>                script = std::make_shared<Script>();
  std::vector<std::chrono::milliseconds> sleeps;
  std::unique_ptr<DeviceLink>            link;

  explicit Harness(ReadRetryPolicy retry = {2, std::chrono::milliseconds(2000)}, ReconnectPolicy reconnect = {3, std::chrono::milliseconds(1000), 3}) {
    link = std::make_unique<DeviceLink>(std::make_unique<FakeTransport>(script), Endpoint{"10.0.0.5", 0, 1, std::chrono::milliseconds(5000)}, retry,
                                        reconnect, [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
  }
};

void TestConnectReusesLiveSession() {
  Harness h;
  assert(h.link->Connect());
  assert(h.link->Connect());
  assert(h.script->connect_calls == 1);
  assert(h.link->Status().state == LinkState::kConnected);
  assert(h.link->Status().connect_count == 1);
}

void TestConnectReplacesStaleSession() {
  Harness h;
  assert(h.link->Connect());
  h.script->alive = false;
  assert(h.link->Connect());
  assert(h.script->connect_calls == 2);
}

void TestConnectFailureIsReportedNotThrown() {
  Harness h;
  h.script->connects_to_fail = 1;
  assert(!h.link->Connect());
  assert(h.link->Status().state == LinkState::kDisconnected);
  assert(h.link->Status().last_error == "refused");
}

void TestReadSucceedsAfterOneRetry() {
  Harness h;
  h.script->reads = {Step::kTimeout, Step::kOk};

  auto data = h.link->ReadBlock(8, 0, 4);
  assert(data.size() == 4);
  assert(h.script->read_calls == 2);
  // retry delay only, no delay before the first attempt
  assert(h.sleeps.size() == 1);
  assert(h.sleeps[0] == std::chrono::milliseconds(2000));
  assert(h.link->Status().consecutive_errors == 0);
  assert(h.link->Status().last_read_time.has_value());
}

void TestExhaustedReadsThrowTypedError() {
  Harness h;
  h.script->reads = {Step::kTimeout, Step::kTimeout};

  bool timed_out = false;
  try {
    h.link->ReadBlock(8, 0, 4);
  } catch (const fieldgate::util::ReadTimeout&) {
    timed_out = true;
  }
  assert(timed_out);
  assert(h.script->read_calls == 2);
  assert(h.link->Status().state == LinkState::kDisconnected);
  assert(h.link->Status().consecutive_errors == 2);

  Harness d;
  d.script->reads = {Step::kDrop, Step::kDrop};
  bool dropped    = false;
  try {
    d.link->ReadBlock(8, 0, 4);
  } catch (const fieldgate::util::ConnectionError&) {
    dropped = true;
  }
  assert(dropped);
}

void TestErrorThresholdForcesReconnect() {
  Harness h({1, std::chrono::milliseconds(10)}, {2, std::chrono::milliseconds(700), 2});
  h.script->reads = {Step::kTimeout, Step::kTimeout, Step::kOk};

  for (int i = 0; i < 2; ++i) {
    try {
      h.link->ReadBlock(8, 0, 4);
      assert(false && "read should have failed");
    } catch (const fieldgate::util::ReadTimeout&) {
    }
  }
  assert(h.link->Status().consecutive_errors == 2);

  const int disconnects_before = h.script->disconnect_calls;
  auto      data               = h.link->ReadBlock(8, 0, 4);
  assert(data.size() == 4);
  assert(h.script->disconnect_calls == disconnects_before + 1);
  // reconnect backoff, distinct from the read delay
  assert(!h.sleeps.empty() && h.sleeps.back() == std::chrono::milliseconds(700));
  assert(h.link->Status().consecutive_errors == 0);
}

void TestReconnectAttemptsAreCapped() {
  Harness h({1, std::chrono::milliseconds(10)}, {3, std::chrono::milliseconds(1000), 3});
  assert(h.link->Connect());
  h.script->connects_to_fail = 5;

  assert(!h.link->Reconnect());
  assert(h.script->connect_calls == 1 + 3);
  assert(h.sleeps.size() == 3);
  assert(h.link->Status().state == LinkState::kDisconnected);

  h.script->connects_to_fail = 0;
  assert(h.link->Reconnect());
  assert(h.link->Status().state == LinkState::kConnected);
}

void TestSimulatedTransportOfflineAndFailEvery() {
  fieldgate::decode::BlockLayout block;
  block.block_id = 8;
  block.size     = 4;

  auto  transport = std::make_unique<fieldgate::device::SimulatedTransport>(std::vector<fieldgate::decode::BlockLayout>{block}, 7, 3);
  auto* sim       = transport.get();

  DeviceLink link(std::move(transport), Endpoint{"sim", 0, 1, std::chrono::milliseconds(100)}, {1, std::chrono::milliseconds(0)},
                  {1, std::chrono::milliseconds(0), 100}, [](std::chrono::milliseconds) {});

  assert(link.ReadBlock(8, 0, 4).size() == 4);
  assert(link.ReadBlock(8, 0, 4).size() == 4);
  bool timed_out = false;
  try {
    link.ReadBlock(8, 0, 4);
  } catch (const fieldgate::util::ReadTimeout&) {
    timed_out = true;
  }
  assert(timed_out);

  sim->SetOnline(false);
  bool refused = false;
  try {
    link.ReadBlock(8, 0, 4);
  } catch (const fieldgate::util::ConnectionError&) {
    refused = true;
  }
  assert(refused);

  sim->SetOnline(true);
  assert(link.ReadBlock(8, 0, 4).size() == 4);
  assert(sim->ReadCount() == 4);
}

} // namespace

int main() {
  TestConnectReusesLiveSession();
  TestConnectReplacesStaleSession();
  TestConnectFailureIsReportedNotThrown();
  TestReadSucceedsAfterOneRetry();
  TestExhaustedReadsThrowTypedError();
  TestErrorThresholdForcesReconnect();
  TestReconnectAttemptsAreCapped();
  TestSimulatedTransportOfflineAndFailEvery();

  std::cout << "fieldgate_unit_device_link: pass\n";
  return 0;
}
