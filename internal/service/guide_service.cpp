#include "guide_service.hpp"

#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/guide/schedule_query.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace epg::service {

using namespace epg::guide::v1;

namespace {

void ToProto(const epg::guide::ProgramProjection& in, Program* out) {
  out->set_channel_id(in.channel_id);
  out->set_title(in.title);
  out->set_description(in.description.value_or(""));
  out->set_category(in.category.value_or(""));
  out->set_start_time_ms(in.start_time_ms);
  out->set_end_time_ms(in.end_time_ms);
  out->set_is_live(in.is_live);
  out->set_is_catchup_available(in.is_catchup_available);
  out->set_progress(in.progress);
  out->set_placeholder(in.placeholder);
}

epg::guide::ArchivePolicy PolicyOf(const ProviderChannel& channel) {
  epg::guide::ArchivePolicy policy;
  policy.enabled       = channel.archive_enabled();
  policy.duration_days = channel.archive_duration_days();
  return policy;
}

void LogRpcFailure(const char* route, const std::exception& ex) {
  EPG_LOG_ERROR("RPC failed", {epg::observability::StringField("route", route), epg::observability::StringField("error", ex.what())});
}

} // namespace

GuideService::GuideService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetScheduleResponse GuideService::GetSchedule(const GetScheduleRequest& req) {
  try {
    const int64_t now = req.now_ms() != 0 ? req.now_ms() : ctx_.now();

    std::vector<std::string> epg_ids;
    epg_ids.reserve(req.channels_size());
    for (const auto& channel : req.channels()) {
      if (!channel.epg_channel_id().empty()) epg_ids.push_back(channel.epg_channel_id());
    }

    // Archive policy belongs to the provider channel, not the EPG id, so
    // catch-up is resolved per requested channel below.
    const auto schedules = ctx_.schedule->ProgramsForChannels(epg_ids, req.window_start_ms(), req.window_end_ms(), now);

    GetScheduleResponse resp;
    resp.set_now_ms(now);
    for (const auto& channel : req.channels()) {
      auto* out = resp.add_channels();
      out->set_stream_id(channel.stream_id());
      out->set_epg_channel_id(channel.epg_channel_id());

      const epg::guide::ArchivePolicy policy = PolicyOf(channel);

      bool any = false;
      if (!channel.epg_channel_id().empty()) {
        auto it = schedules.find(channel.epg_channel_id());
        if (it != schedules.end()) {
          for (auto projection : it->second) {
            projection.is_catchup_available =
                epg::guide::IsCatchupAvailable(projection.start_time_ms, projection.end_time_ms, now, policy);
            ToProto(projection, out->add_programs());
            any = true;
          }
        }
      }

      if (!any && req.fill_placeholders()) {
        const std::string& key = channel.epg_channel_id().empty() ? channel.stream_id() : channel.epg_channel_id();
        ToProto(epg::guide::MakePlaceholder(key, now), out->add_programs());
      }
    }
    return resp;
  } catch (const std::exception& ex) {
    LogRpcFailure("GuideService.GetSchedule", ex);
    throw;
  }
}

GetChannelResponse GuideService::GetChannel(const GetChannelRequest& req) {
  try {
    if (req.channel_id().empty()) {
      throw util::InvalidArgument("channel_id is required");
    }

    auto tx      = ctx_.repository->Begin();
    auto channel = ctx_.repository->GetChannel(*tx, req.channel_id());
    tx->Commit();

    if (!channel) {
      throw util::NotFound("channel not found: " + req.channel_id());
    }

    GetChannelResponse resp;
    auto*              out = resp.mutable_channel();
    out->set_channel_id(channel->channel_id);
    out->set_display_name(channel->display_name.value_or(""));
    out->set_icon_url(channel->icon_url.value_or(""));
    return resp;
  } catch (const std::exception& ex) {
    LogRpcFailure("GuideService.GetChannel", ex);
    throw;
  }
}

} // namespace epg::service
