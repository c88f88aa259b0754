#pragma once

#include <map>
#include <memory>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace epg::db::memory {

/*
  Transaction = shared snapshot + copy-on-write set

  Begin() only takes a reference to the committed state. The first write
  clones the top-level maps; a channel's schedule is cloned the first time
  it is modified. Only transactions that wrote are checked for conflicts on
  commit, so readers never fail against a concurrent writer.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using State      = MemoryRepository::State;
  using ChannelMap = MemoryRepository::ChannelMap;
  using ProgramMap = MemoryRepository::ProgramMap;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const State& View() const {
    return working_ ? *working_ : *snapshot_;
  }

  State&      Mutable();
  ChannelMap& MutableChannels();
  ProgramMap& MutablePrograms(const std::string& channel_id);

  // Drops one channel's schedule, or all of them.
  void ErasePrograms(const std::string& channel_id);
  void ClearPrograms();

 private:
  MemoryRepository&                                  repo_;
  std::shared_ptr<const State>                       snapshot_;
  std::shared_ptr<State>                             working_;
  std::shared_ptr<ChannelMap>                        owned_channels_;
  std::map<std::string, std::shared_ptr<ProgramMap>> owned_programs_;
  uint64_t                                           snapshot_version_ = 0;
  bool                                               committed_        = false;
  bool                                               rolled_back_      = false;
};

} // namespace epg::db::memory
