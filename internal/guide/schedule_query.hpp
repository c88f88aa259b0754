#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/guide/projection.hpp"

namespace epg::guide {

using ScheduleMap = std::map<std::string, std::vector<ProgramProjection>>;

/*
  Read side of the guide.

  Selects programs overlapping [window_start, window_end) and projects them
  against `now` and each channel's archive policy. Safe to call from many
  threads while a sync is writing; a reader may see a partially refreshed
  feed.
*/
class ScheduleQuery {
 public:
  explicit ScheduleQuery(std::shared_ptr<db::Repository> repo);

  std::vector<ProgramProjection> ProgramsForChannel(const std::string& channel_id, int64_t window_start_ms,
                                                    int64_t window_end_ms, int64_t now_ms,
                                                    const ArchivePolicy& policy = {});

  // Every requested id is a key of the result, ordered by start time within
  // a channel. Channels missing from `policies` get the default policy
  // (archive disabled).
  ScheduleMap ProgramsForChannels(const std::vector<std::string>& channel_ids, int64_t window_start_ms, int64_t window_end_ms,
                                  int64_t now_ms, const std::unordered_map<std::string, ArchivePolicy>& policies = {});

 private:
  std::shared_ptr<db::Repository> repo_;
};

} // namespace epg::guide
