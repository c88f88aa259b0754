#include "memory_tx.hpp"

#include <stdexcept>

namespace epg::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_; // shared, never copied
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryTransaction::State& MemoryTransaction::Mutable() {
  if (!working_) {
    // top-level maps only; schedules stay shared until touched
    working_ = std::make_shared<State>(*snapshot_);
  }
  return *working_;
}

MemoryTransaction::ChannelMap& MemoryTransaction::MutableChannels() {
  auto& s = Mutable();
  if (!owned_channels_) {
    owned_channels_ = std::make_shared<ChannelMap>(*s.channels);
    s.channels      = owned_channels_;
  }
  return *owned_channels_;
}

MemoryTransaction::ProgramMap& MemoryTransaction::MutablePrograms(const std::string& channel_id) {
  auto owned = owned_programs_.find(channel_id);
  if (owned != owned_programs_.end()) return *owned->second;

  auto& s    = Mutable();
  auto  copy = std::make_shared<ProgramMap>();
  auto  it   = s.programs.find(channel_id);
  if (it != s.programs.end()) *copy = *it->second;

  s.programs[channel_id] = copy;
  owned_programs_.emplace(channel_id, copy);
  return *copy;
}

void MemoryTransaction::ErasePrograms(const std::string& channel_id) {
  auto& s  = Mutable();
  auto  it = s.programs.find(channel_id);
  if (it == s.programs.end()) return;
  s.program_count -= it->second->size();
  s.programs.erase(it);
  owned_programs_.erase(channel_id);
}

void MemoryTransaction::ClearPrograms() {
  auto& s = Mutable();
  s.programs.clear();
  s.program_count = 0;
  owned_programs_.clear();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }
  if (!working_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw std::runtime_error("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.reset();
  owned_channels_.reset();
  owned_programs_.clear();
  rolled_back_ = true;
}

} // namespace epg::db::memory
