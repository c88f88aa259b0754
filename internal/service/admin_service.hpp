#pragma once

#include "epg/guide/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace epg::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  epg::guide::v1::TriggerSyncResponse TriggerSync();

  epg::guide::v1::GetSyncStatusResponse GetSyncStatus();

  // Deletes every program and channel in one transaction.
  void ResetGuide();

  epg::guide::v1::StatsResponse Stats();

 private:
  ServiceContext ctx_;
};

} // namespace epg::service
