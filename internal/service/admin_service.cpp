#include "admin_service.hpp"

#include <exception>
#include <string>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/ingest/sync_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace epg::service {

using namespace epg::guide::v1;

namespace {

SyncStatus ToProto(ingest::SyncStatus status) {
  switch (status) {
    case ingest::SyncStatus::kSuccess:
      return SYNC_STATUS_SUCCESS;
    case ingest::SyncStatus::kRetry:
      return SYNC_STATUS_RETRY;
    case ingest::SyncStatus::kFailure:
      return SYNC_STATUS_FAILURE;
  }
  return SYNC_STATUS_UNSPECIFIED;
}

TriggerResult ToProto(ingest::TriggerResult result) {
  switch (result) {
    case ingest::TriggerResult::kStarted:
      return TRIGGER_RESULT_STARTED;
    case ingest::TriggerResult::kAlreadyRunning:
      return TRIGGER_RESULT_ALREADY_RUNNING;
    case ingest::TriggerResult::kNoNetwork:
      return TRIGGER_RESULT_NO_NETWORK;
  }
  return TRIGGER_RESULT_UNSPECIFIED;
}

void ToProto(const ingest::SyncCounters& in, SyncCounters* out) {
  out->set_channels_written(in.channels_written);
  out->set_programs_written(in.programs_written);
  out->set_channels_filtered(in.channels_filtered);
  out->set_programs_filtered(in.programs_filtered);
  out->set_channels_rejected(in.channels_rejected);
  out->set_programs_rejected(in.programs_rejected);
  out->set_channel_flushes(in.channel_flushes);
  out->set_program_flushes(in.program_flushes);
  out->set_programs_pruned(in.programs_pruned);
}

void LogRpcFailure(const char* route, const std::exception& ex) {
  EPG_LOG_ERROR("RPC failed", {epg::observability::StringField("route", route), epg::observability::StringField("error", ex.what())});
}

void Require(db::Result result, const char* what) {
  if (!result) {
    throw util::StorageFailure(std::string(what) + ": " + db::ToString(result.code));
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

TriggerSyncResponse AdminService::TriggerSync() {
  try {
    TriggerSyncResponse resp;
    const auto          result = ctx_.sync->RequestSync();
    EPG_LOG_INFO("sync triggered", {epg::observability::StringField("result", ingest::ToString(result))});
    resp.set_result(ToProto(result));
    return resp;
  } catch (const std::exception& ex) {
    LogRpcFailure("AdminService.TriggerSync", ex);
    throw;
  }
}

GetSyncStatusResponse AdminService::GetSyncStatus() {
  const auto state = ctx_.sync->Status();

  GetSyncStatusResponse resp;
  resp.set_running(state.running);
  if (state.last) {
    resp.set_last_status(ToProto(state.last->status));
    resp.set_last_message(state.last->message);
    ToProto(state.last->counters, resp.mutable_last_counters());
  }
  resp.set_last_finished_ms(state.last_finished_ms);
  resp.set_next_attempt_ms(state.next_attempt_ms);
  resp.set_consecutive_retries(state.consecutive_retries);
  return resp;
}

void AdminService::ResetGuide() {
  try {
    auto tx = ctx_.repository->Begin();
    Require(ctx_.repository->DeleteAllPrograms(*tx), "delete programs");
    Require(ctx_.repository->DeleteAllChannels(*tx), "delete channels");
    tx->Commit();
    EPG_LOG_INFO("guide reset");
  } catch (const std::exception& ex) {
    LogRpcFailure("AdminService.ResetGuide", ex);
    throw;
  }
}

StatsResponse AdminService::Stats() {
  try {
    StatsResponse resp;
    auto          tx       = ctx_.repository->Begin();
    const auto    channels = ctx_.repository->CountChannels(*tx);
    const auto    programs = ctx_.repository->CountPrograms(*tx);
    tx->Commit();

    resp.set_channels(channels);
    resp.set_programs(programs);
    return resp;
  } catch (const std::exception& ex) {
    LogRpcFailure("AdminService.Stats", ex);
    throw;
  }
}

} // namespace epg::service
