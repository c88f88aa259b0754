#pragma once

#include "epg/guide/v1/guide_service.pb.h"
#include "service_context.hpp"

namespace epg::service {

class GuideService {
 public:
  explicit GuideService(ServiceContext ctx);

  // Joins provider channels against the guide on epg_channel_id. Channels
  // without an EPG id or without programs in the window get a placeholder
  // when fill_placeholders is set, an empty list otherwise.
  epg::guide::v1::GetScheduleResponse GetSchedule(const epg::guide::v1::GetScheduleRequest& req);

  epg::guide::v1::GetChannelResponse GetChannel(const epg::guide::v1::GetChannelRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace epg::service
