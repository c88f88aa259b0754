#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "epg/guide/v1/guide_service.grpc.pb.h"
#include "internal/service/guide_service.hpp"

namespace epg::grpc {

class GuideServer final : public epg::guide::v1::GuideService::Service {
 public:
  explicit GuideServer(std::shared_ptr<epg::service::GuideService> svc);

  ::grpc::Status GetSchedule(::grpc::ServerContext*, const epg::guide::v1::GetScheduleRequest*,
                             epg::guide::v1::GetScheduleResponse*) override;

  ::grpc::Status GetChannel(::grpc::ServerContext*, const epg::guide::v1::GetChannelRequest*,
                            epg::guide::v1::GetChannelResponse*) override;

 private:
  std::shared_ptr<epg::service::GuideService> service_;
};

} // namespace epg::grpc
