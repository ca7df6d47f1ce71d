#pragma once

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include <memory>
#include <string>
#include <vector>

namespace fieldgate::runtime {

class Server {
 public:
  Server(std::string bind_address, std::vector<std::shared_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();

  // Cancels open streams after the deadline.
  void Stop(std::chrono::milliseconds deadline = std::chrono::seconds(2));

  const std::string& BindAddress() const {
    return bind_address_;
  }

 private:
  std::string                                   bind_address_;
  std::vector<std::shared_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
};

} // namespace fieldgate::runtime
