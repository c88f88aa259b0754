#include "guide_server.hpp"

#include "grpc_error.hpp"

namespace epg::grpc {

using namespace epg::guide::v1;

GuideServer::GuideServer(std::shared_ptr<epg::service::GuideService> svc) : service_(std::move(svc)) {
}

::grpc::Status GuideServer::GetSchedule(::grpc::ServerContext*, const GetScheduleRequest* req, GetScheduleResponse* resp) {
  try {
    *resp = service_->GetSchedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GuideServer::GetChannel(::grpc::ServerContext*, const GetChannelRequest* req, GetChannelResponse* resp) {
  try {
    *resp = service_->GetChannel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace epg::grpc
