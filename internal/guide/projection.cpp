#include "internal/guide/projection.hpp"

#include <algorithm>

#include "internal/util/time.hpp"

namespace epg::guide {

bool IsLive(int64_t start_time_ms, int64_t end_time_ms, int64_t now_ms) {
  return start_time_ms <= now_ms && now_ms < end_time_ms;
}

bool IsCatchupAvailable(int64_t start_time_ms, int64_t end_time_ms, int64_t now_ms, const ArchivePolicy& policy) {
  if (!policy.enabled) return false;
  if (end_time_ms <= start_time_ms) return false;
  if (end_time_ms > now_ms) return false;

  const int64_t days = policy.duration_days > 0 ? policy.duration_days : 1;
  return now_ms - end_time_ms <= days * util::kMillisPerDay;
}

double Progress(int64_t start_time_ms, int64_t end_time_ms, int64_t now_ms) {
  if (!IsLive(start_time_ms, end_time_ms, now_ms)) return 0.0;
  const double elapsed  = static_cast<double>(now_ms - start_time_ms);
  const double duration = static_cast<double>(end_time_ms - start_time_ms);
  return std::clamp(elapsed / duration, 0.0, 1.0);
}

ProgramProjection Project(const db::model::ProgramRecord& program, int64_t now_ms, const ArchivePolicy& policy) {
  ProgramProjection p;
  p.channel_id           = program.channel_id;
  p.title                = program.title;
  p.description          = program.description;
  p.category             = program.category;
  p.start_time_ms        = program.start_time_ms;
  p.end_time_ms          = program.end_time_ms;
  p.is_live              = IsLive(program.start_time_ms, program.end_time_ms, now_ms);
  p.is_catchup_available = IsCatchupAvailable(program.start_time_ms, program.end_time_ms, now_ms, policy);
  p.progress             = Progress(program.start_time_ms, program.end_time_ms, now_ms);
  return p;
}

ProgramProjection MakePlaceholder(const std::string& channel_id, int64_t now_ms) {
  ProgramProjection p;
  p.channel_id    = channel_id;
  p.title         = "No Program Info";
  p.description   = "Program information not available";
  p.start_time_ms = now_ms - util::kMillisPerHour;
  p.end_time_ms   = now_ms + util::kMillisPerHour;
  p.is_live       = true;
  p.progress      = 0.5;
  p.placeholder   = true;
  return p;
}

} // namespace epg::guide
