#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace epg::db::memory {

class MemoryTransaction;

/*
  In-process schedule store.

  Committed state is immutable and shared between transactions. Programs are
  kept in one map per channel so a write transaction only clones the
  schedules it touches; readers never copy.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertChannels(Transaction&, const std::vector<model::ChannelRecord>&) override;
  std::optional<model::ChannelRecord> GetChannel(Transaction&, const std::string&) override;
  std::vector<model::ChannelRecord> ListChannels(Transaction&) override;
  uint64_t CountChannels(Transaction&) override;
  Result DeleteAllChannels(Transaction&) override;

  Result UpsertPrograms(Transaction&, const std::vector<model::ProgramRecord>&) override;
  std::vector<model::ProgramRecord> QueryPrograms(Transaction&, const std::vector<std::string>& channel_ids,
                                                  int64_t window_start_ms, int64_t window_end_ms) override;
  Result DeleteProgramsOlderThan(Transaction&, int64_t cutoff_ms, uint64_t* deleted) override;
  Result DeleteAllPrograms(Transaction&) override;
  uint64_t CountPrograms(Transaction&) override;

private:
  friend class MemoryTransaction;

  using ChannelMap = std::map<std::string, model::ChannelRecord>;
  using ProgramMap = std::map<int64_t, model::ProgramRecord>; // keyed by start_time_ms

  struct State {
    std::shared_ptr<const ChannelMap>                        channels = std::make_shared<const ChannelMap>();
    std::map<std::string, std::shared_ptr<const ProgramMap>> programs; // keyed by channel_id
    uint64_t                                                 program_count   = 0;
    uint64_t                                                 next_program_id = 1;
  };

  std::mutex                   mutex_;
  std::shared_ptr<const State> committed_ = std::make_shared<const State>();
  uint64_t                     committed_version_ = 0;
};

}
