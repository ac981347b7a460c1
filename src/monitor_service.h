// Repository: encodewatch
// Component: EncodeMonitor gRPC Service Implementation
// Purpose: Serves progress snapshots and stop requests for one encode session.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_MONITOR_SERVICE_H_
#define ENCODEWATCH_MONITOR_SERVICE_H_

#include <memory>

#include <grpcpp/grpcpp.h>

#include "encodewatch/progress.grpc.pb.h"
#include "encodewatch/encode/EncodeSession.h"

namespace encodewatch {
namespace monitor {

// EncodeMonitorImpl implements the gRPC service defined in progress.proto.
// Handlers only read the session through copies, so any number of clients
// may poll while the pumps are writing.
class EncodeMonitorImpl final : public EncodeMonitor::Service {
 public:
  explicit EncodeMonitorImpl(std::shared_ptr<encode::EncodeSession> session);
  ~EncodeMonitorImpl() override;

  // Disable copy and move
  EncodeMonitorImpl(const EncodeMonitorImpl&) = delete;
  EncodeMonitorImpl& operator=(const EncodeMonitorImpl&) = delete;

  // RPC implementations
  grpc::Status GetProgress(grpc::ServerContext* context,
                           const ProgressRequest* request,
                           ProgressReport* response) override;

  grpc::Status StopEncode(grpc::ServerContext* context,
                          const StopEncodeRequest* request,
                          StopEncodeResponse* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const ApiVersionRequest* request,
                          ApiVersion* response) override;

 private:
  std::shared_ptr<encode::EncodeSession> session_;
};

}  // namespace monitor
}  // namespace encodewatch

#endif  // ENCODEWATCH_MONITOR_SERVICE_H_
