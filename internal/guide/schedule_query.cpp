#include "internal/guide/schedule_query.hpp"

#include <set>
#include <utility>

#include "internal/util/errors.hpp"

namespace epg::guide {

ScheduleQuery::ScheduleQuery(std::shared_ptr<db::Repository> repo) : repo_(std::move(repo)) {
}

std::vector<ProgramProjection> ScheduleQuery::ProgramsForChannel(const std::string& channel_id, int64_t window_start_ms,
                                                                 int64_t window_end_ms, int64_t now_ms,
                                                                 const ArchivePolicy& policy) {
  auto result = ProgramsForChannels({channel_id}, window_start_ms, window_end_ms, now_ms, {{channel_id, policy}});
  return std::move(result[channel_id]);
}

ScheduleMap ScheduleQuery::ProgramsForChannels(const std::vector<std::string>& channel_ids, int64_t window_start_ms,
                                               int64_t window_end_ms, int64_t now_ms,
                                               const std::unordered_map<std::string, ArchivePolicy>& policies) {
  if (window_end_ms < window_start_ms) {
    throw util::InvalidArgument("window end precedes window start");
  }

  ScheduleMap result;
  if (channel_ids.empty()) {
    return result;
  }

  std::set<std::string> unique(channel_ids.begin(), channel_ids.end());
  for (const auto& id : unique) {
    result[id];
  }

  // empty window: nothing can overlap
  if (window_end_ms == window_start_ms) {
    return result;
  }

  std::vector<db::model::ProgramRecord> rows;
  {
    auto tx = repo_->Begin();
    rows    = repo_->QueryPrograms(*tx, std::vector<std::string>(unique.begin(), unique.end()), window_start_ms, window_end_ms);
    tx->Commit();
  }

  const ArchivePolicy no_archive;
  for (const auto& row : rows) {
    auto it = policies.find(row.channel_id);
    result[row.channel_id].push_back(Project(row, now_ms, it == policies.end() ? no_archive : it->second));
  }
  return result;
}

} // namespace epg::guide
