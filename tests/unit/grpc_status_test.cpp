#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "epg/guide/v1.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/guide_server.hpp"
#include "internal/guide/schedule_query.hpp"
#include "internal/ingest/sync_coordinator.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/guide_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/support/string_feed.hpp"

namespace {

epg::service::ServiceContext BuildServiceContext() {
  epg::service::ServiceContext ctx;
  auto repository = std::make_shared<epg::db::memory::MemoryRepository>();
  auto pipeline   = std::make_shared<epg::ingest::SyncPipeline>(
      repository, std::make_shared<epg::testing::StringFeedSource>("<tv></tv>"), epg::ingest::SyncOptions{});
  ctx.repository = repository;
  ctx.schedule   = std::make_shared<epg::guide::ScheduleQuery>(repository);
  ctx.sync       = std::make_shared<epg::ingest::SyncCoordinator>(pipeline, epg::ingest::SyncCoordinatorOptions{});
  return ctx;
}

void TestErrorMapping() {
  using epg::grpc::ToStatus;
  assert(ToStatus(epg::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(epg::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(epg::util::FailedPrecondition("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(epg::util::Unavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(epg::util::StorageFailure("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(epg::util::NotFound("channel not found: a")).error_message() == "channel not found: a");
}

void TestGetChannelMissingReturnsNotFound() {
  auto ctx = BuildServiceContext();
  epg::grpc::GuideServer server(std::make_shared<epg::service::GuideService>(ctx));

  epg::guide::v1::GetChannelRequest req;
  req.set_channel_id("missing");
  epg::guide::v1::GetChannelResponse resp;
  ::grpc::ServerContext              grpc_ctx;

  const auto status = server.GetChannel(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestGetChannelEmptyIdReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  epg::grpc::GuideServer server(std::make_shared<epg::service::GuideService>(ctx));

  epg::guide::v1::GetChannelRequest  req;
  epg::guide::v1::GetChannelResponse resp;
  ::grpc::ServerContext              grpc_ctx;

  const auto status = server.GetChannel(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestInvertedWindowReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  epg::grpc::GuideServer server(std::make_shared<epg::service::GuideService>(ctx));

  epg::guide::v1::GetScheduleRequest req;
  req.add_channels()->set_epg_channel_id("ch1");
  req.set_window_start_ms(2000);
  req.set_window_end_ms(1000);
  epg::guide::v1::GetScheduleResponse resp;
  ::grpc::ServerContext               grpc_ctx;

  const auto status = server.GetSchedule(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestTriggerBeforeStartReturnsFailedPrecondition() {
  auto ctx = BuildServiceContext();
  epg::grpc::AdminServer server(std::make_shared<epg::service::AdminService>(ctx));

  google::protobuf::Empty             req;
  epg::guide::v1::TriggerSyncResponse resp;
  ::grpc::ServerContext               grpc_ctx;

  const auto status = server.TriggerSync(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

} // namespace

int main() {
  TestErrorMapping();
  TestGetChannelMissingReturnsNotFound();
  TestGetChannelEmptyIdReturnsInvalidArgument();
  TestInvertedWindowReturnsInvalidArgument();
  TestTriggerBeforeStartReturnsFailedPrecondition();

  std::cout << "epg_guide_unit_grpc_status: pass\n";
  return 0;
}
