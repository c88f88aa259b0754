#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace epg::grpc {

using namespace epg::guide::v1;

AdminServer::AdminServer(std::shared_ptr<epg::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::TriggerSync(::grpc::ServerContext*, const google::protobuf::Empty*, TriggerSyncResponse* resp) {
  try {
    *resp = service_->TriggerSync();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetSyncStatus(::grpc::ServerContext*, const google::protobuf::Empty*, GetSyncStatusResponse* resp) {
  try {
    *resp = service_->GetSyncStatus();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ResetGuide(::grpc::ServerContext*, const google::protobuf::Empty*, google::protobuf::Empty*) {
  try {
    service_->ResetGuide();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const google::protobuf::Empty*, StatsResponse* resp) {
  try {
    *resp = service_->Stats();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace epg::grpc
