#include "memory_repository.hpp"

#include <algorithm>
#include <set>

#include "memory_tx.hpp"

namespace epg::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Channels
// ------------------------------------------------------------------

Result MemoryRepository::UpsertChannels(Transaction& t, const std::vector<model::ChannelRecord>& channels) {
  for (const auto& c : channels) {
    if (c.channel_id.empty()) return Result::Err(ErrorCode::InvalidArgument, "channel_id is empty");
  }

  auto& m = TX(t).MutableChannels();
  for (const auto& c : channels) {
    m[c.channel_id] = c;
  }
  return Result::Ok();
}

std::optional<model::ChannelRecord> MemoryRepository::GetChannel(Transaction& t, const std::string& channel_id) {
  const auto& channels = *TX(t).View().channels;
  auto        it       = channels.find(channel_id);
  if (it == channels.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ChannelRecord> MemoryRepository::ListChannels(Transaction& t) {
  const auto&                       channels = *TX(t).View().channels;
  std::vector<model::ChannelRecord> records;
  records.reserve(channels.size());
  for (const auto& [_, record] : channels) {
    records.push_back(record);
  }
  return records;
}

uint64_t MemoryRepository::CountChannels(Transaction& t) {
  return TX(t).View().channels->size();
}

Result MemoryRepository::DeleteAllChannels(Transaction& t) {
  auto& tx = TX(t);
  auto& m  = tx.MutableChannels();
  // cascade, as the sqlite backend does
  for (const auto& [channel_id, _] : m) {
    tx.ErasePrograms(channel_id);
  }
  m.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Programs
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPrograms(Transaction& t, const std::vector<model::ProgramRecord>& programs) {
  for (const auto& p : programs) {
    if (p.channel_id.empty()) return Result::Err(ErrorCode::InvalidArgument, "channel_id is empty");
    if (p.end_time_ms <= p.start_time_ms) {
      return Result::Err(ErrorCode::InvalidArgument, "end_time must be after start_time");
    }
  }

  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  for (const auto& p : programs) {
    auto& schedule = tx.MutablePrograms(p.channel_id);
    auto  it       = schedule.find(p.start_time_ms);
    if (it != schedule.end()) {
      const uint64_t id = it->second.id;
      it->second        = p;
      it->second.id     = id;
      continue;
    }

    model::ProgramRecord stored = p;
    stored.id                   = s.next_program_id++;
    schedule.emplace(p.start_time_ms, std::move(stored));
    ++s.program_count;
  }
  return Result::Ok();
}

std::vector<model::ProgramRecord> MemoryRepository::QueryPrograms(Transaction& t, const std::vector<std::string>& channel_ids,
                                                                   int64_t window_start_ms, int64_t window_end_ms) {
  const auto&                       s = TX(t).View();
  std::vector<model::ProgramRecord> out;

  const std::set<std::string> unique_ids(channel_ids.begin(), channel_ids.end());
  for (const auto& channel_id : unique_ids) {
    auto schedule = s.programs.find(channel_id);
    if (schedule == s.programs.end()) continue;
    for (const auto& [start, p] : *schedule->second) {
      if (start >= window_end_ms) break;
      if (p.end_time_ms > window_start_ms) out.push_back(p);
    }
  }

  std::sort(out.begin(), out.end(), [](const model::ProgramRecord& a, const model::ProgramRecord& b) {
    if (a.start_time_ms != b.start_time_ms) return a.start_time_ms < b.start_time_ms;
    return a.channel_id < b.channel_id;
  });
  return out;
}

Result MemoryRepository::DeleteProgramsOlderThan(Transaction& t, int64_t cutoff_ms, uint64_t* deleted) {
  auto&    tx    = TX(t);
  uint64_t count = 0;

  std::vector<std::string> touched;
  for (const auto& [channel_id, schedule] : tx.View().programs) {
    const bool stale = std::any_of(schedule->begin(), schedule->end(),
                                   [&](const auto& entry) { return entry.second.end_time_ms < cutoff_ms; });
    if (stale) touched.push_back(channel_id);
  }

  for (const auto& channel_id : touched) {
    auto& schedule = tx.MutablePrograms(channel_id);
    count += std::erase_if(schedule, [&](const auto& entry) { return entry.second.end_time_ms < cutoff_ms; });
    if (schedule.empty()) tx.ErasePrograms(channel_id);
  }

  if (count > 0) tx.Mutable().program_count -= count;
  if (deleted) *deleted = count;
  return Result::Ok();
}

Result MemoryRepository::DeleteAllPrograms(Transaction& t) {
  TX(t).ClearPrograms();
  return Result::Ok();
}

uint64_t MemoryRepository::CountPrograms(Transaction& t) {
  return TX(t).View().program_count;
}

} // namespace epg::db::memory
