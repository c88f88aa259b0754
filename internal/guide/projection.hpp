#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/program_record.hpp"

namespace epg::guide {

// Provider-side catch-up settings of a channel.
struct ArchivePolicy {
  bool    enabled       = false;
  int32_t duration_days = 1; // <= 0 is treated as one day
};

/*
  Query-time view of a program. Never stored.
*/
struct ProgramProjection {
  std::string                channel_id;
  std::string                title;
  std::optional<std::string> description;
  std::optional<std::string> category;
  int64_t                    start_time_ms        = 0;
  int64_t                    end_time_ms          = 0;
  bool                       is_live              = false;
  bool                       is_catchup_available = false;
  double                     progress             = 0.0; // [0, 1], live programs only
  bool                       placeholder          = false;
};

// now in [start, end)
bool IsLive(int64_t start_time_ms, int64_t end_time_ms, int64_t now_ms);

// Archive enabled, already ended (end <= now), ended no more than
// duration_days ago, and end > start.
bool IsCatchupAvailable(int64_t start_time_ms, int64_t end_time_ms, int64_t now_ms, const ArchivePolicy& policy);

// clamp((now - start) / (end - start), 0, 1) while live, 0 otherwise.
double Progress(int64_t start_time_ms, int64_t end_time_ms, int64_t now_ms);

ProgramProjection Project(const db::model::ProgramRecord& program, int64_t now_ms, const ArchivePolicy& policy);

// Stand-in shown for channels without guide data: [now - 1h, now + 1h).
ProgramProjection MakePlaceholder(const std::string& channel_id, int64_t now_ms);

} // namespace epg::guide
