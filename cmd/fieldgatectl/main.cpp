#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include "fieldgate/v1.hpp"
#include "internal/util/time.hpp"

using namespace fieldgate::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fieldgatectl <addr> status\n"
            << "  fieldgatectl <addr> latest [device_id]\n"
            << "  fieldgatectl <addr> latest-type <device_type>\n"
            << "  fieldgatectl <addr> reconnect\n"
            << "  fieldgatectl <addr> watch [seconds]\n";
}

static std::string ToJson(const google::protobuf::Message& msg) {
  std::string                                 out;
  google::protobuf::util::JsonPrintOptions    options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(msg, &out, options);
  if (!status.ok()) return "<unprintable: " + std::string(status.message()) + ">";
  return out;
}

static std::string Time(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() == 0 && ts.nanos() == 0) return "never";
  return fieldgate::util::ToIso8601(fieldgate::util::FromProto(ts));
}

static const char* LinkStateName(LinkState state) {
  switch (state) {
    case LINK_STATE_CONNECTED:
      return "connected";
    case LINK_STATE_DISCONNECTED:
      return "disconnected";
    case LINK_STATE_RECONNECTING:
      return "reconnecting";
    default:
      return "unknown";
  }
}

static int Watch(const std::shared_ptr<grpc::Channel>& channel, int seconds) {
  auto stub = RealtimeService::NewStub(channel);

  grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(seconds));

  auto stream = stub->Connect(&ctx);

  ClientMessage subscribe;
  subscribe.mutable_subscribe()->set_channel("realtime");
  if (!stream->Write(subscribe)) {
    std::cerr << "failed to subscribe\n";
    return 2;
  }

  // heartbeat well inside the server's timeout
  std::mutex              mutex;
  std::condition_variable cv;
  bool                    done = false;

  std::thread heartbeat([&] {
    std::unique_lock lock(mutex);
    while (!cv.wait_for(lock, std::chrono::seconds(15), [&] { return done; })) {
      ClientMessage hb;
      *hb.mutable_heartbeat()->mutable_timestamp() = fieldgate::util::ToProto(fieldgate::util::Now());
      if (!stream->Write(hb)) break;
    }
  });

  ServerMessage msg;
  uint64_t      pushes = 0;
  while (stream->Read(&msg)) {
    switch (msg.kind_case()) {
      case ServerMessage::kRealtimeData: {
        ++pushes;
        const auto& data = msg.realtime_data();
        std::cout << Time(data.timestamp()) << " source=" << data.source() << " devices=" << data.data_size() << "\n";
        for (const auto& [device_id, reading] : data.data()) {
          std::cout << "  " << device_id;
          for (const auto& [tag, module] : reading.modules()) {
            for (const auto& [field, value] : module.fields()) {
              std::cout << " " << tag << "." << field << "=" << value;
            }
          }
          std::cout << "\n";
        }
        break;
      }
      case ServerMessage::kHeartbeat:
        std::cout << "heartbeat ack " << Time(msg.heartbeat().timestamp()) << "\n";
        break;
      case ServerMessage::kError:
        std::cerr << "error " << msg.error().code() << ": " << msg.error().message() << "\n";
        break;
      case ServerMessage::KIND_NOT_SET:
        break;
    }
  }

  {
    std::lock_guard lock(mutex);
    done = true;
  }
  cv.notify_all();
  heartbeat.join();

  auto status = stream->Finish();
  std::cout << "pushes=" << pushes << "\n";

  // the deadline is how a timed watch ends
  if (!status.ok() && status.error_code() != grpc::StatusCode::DEADLINE_EXCEEDED) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = StatusService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "status") {
    GetStatusRequest req;
    GatewayStatus    resp;

    auto status = stub->GetStatus(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    const auto& link = resp.device_link();
    const auto& d    = resp.delivery();
    std::cout << "device      " << link.endpoint() << " " << LinkStateName(link.state()) << " errors=" << link.consecutive_errors()
              << " connects=" << link.connect_count() << "\n"
              << "polling     running=" << resp.polling().running() << " cycles=" << resp.polling().total_cycles()
              << " failed=" << resp.polling().failed_cycles() << "\n"
              << "delivery    pending=" << d.pending_points() << " written=" << d.written_points() << " failed=" << d.failed_points()
              << " last_flush=" << Time(d.last_successful_flush()) << " store_healthy=" << d.store_healthy() << "\n"
              << "overflow    depth=" << d.overflow_depth() << " evicted=" << d.overflow_evicted() << " replayed=" << d.replayed_points()
              << " last_replay=" << Time(d.last_replay()) << "\n"
              << "realtime    connections=" << resp.realtime().connections() << " subscribers=" << resp.realtime().realtime_subscribers()
              << " pushes=" << resp.realtime().pushes() << "\n"
              << "snapshot    devices=" << resp.devices_in_snapshot() << " latest=" << Time(resp.latest_reading_time()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "latest" || cmd == "latest-type") {
    GetLatestRequest req;
    if (argc >= 4) {
      if (cmd == "latest") {
        req.set_device_id(argv[3]);
      } else {
        req.set_device_type(argv[3]);
      }
    } else if (cmd == "latest-type") {
      Usage();
      return 1;
    }

    GetLatestResponse resp;

    auto status = stub->GetLatest(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << ToJson(resp) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reconnect") {
    ReconnectRequest  req;
    ReconnectResponse resp;

    auto status = stub->Reconnect(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << (resp.scheduled() ? "reconnect scheduled" : "polling stopped, reconnect not scheduled") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    int seconds = argc >= 4 ? std::stoi(argv[3]) : 30;
    return Watch(channel, seconds);
  }

  Usage();
  return 1;
}
