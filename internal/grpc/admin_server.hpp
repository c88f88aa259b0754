#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "epg/guide/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace epg::grpc {

class AdminServer final : public epg::guide::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<epg::service::AdminService> svc);

  ::grpc::Status TriggerSync(::grpc::ServerContext*, const google::protobuf::Empty*, epg::guide::v1::TriggerSyncResponse*) override;

  ::grpc::Status GetSyncStatus(::grpc::ServerContext*, const google::protobuf::Empty*,
                               epg::guide::v1::GetSyncStatusResponse*) override;

  ::grpc::Status ResetGuide(::grpc::ServerContext*, const google::protobuf::Empty*, google::protobuf::Empty*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const google::protobuf::Empty*, epg::guide::v1::StatsResponse*) override;

 private:
  std::shared_ptr<epg::service::AdminService> service_;
};

} // namespace epg::grpc
