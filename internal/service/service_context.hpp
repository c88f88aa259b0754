#pragma once

#include <memory>

#include "internal/util/time.hpp"

namespace epg::db {
class Repository;
}
namespace epg::guide {
class ScheduleQuery;
}
namespace epg::ingest {
class SyncCoordinator;
}

namespace epg::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<epg::db::Repository>          repository;
  std::shared_ptr<epg::guide::ScheduleQuery>    schedule;
  std::shared_ptr<epg::ingest::SyncCoordinator> sync;
  util::NowFn                                   now = &util::NowMillis;
};

} // namespace epg::service
