#pragma once

#include <memory>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace epg::testing {

// Delegates every call to an inner repository. Tests override the calls
// they want to observe or fail.
class ForwardingRepository : public db::Repository {
 public:
  explicit ForwardingRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result UpsertChannels(db::Transaction& tx, const std::vector<db::model::ChannelRecord>& channels) override {
    return inner_->UpsertChannels(tx, channels);
  }

  std::optional<db::model::ChannelRecord> GetChannel(db::Transaction& tx, const std::string& channel_id) override {
    return inner_->GetChannel(tx, channel_id);
  }

  std::vector<db::model::ChannelRecord> ListChannels(db::Transaction& tx) override {
    return inner_->ListChannels(tx);
  }

  db::Result DeleteAllChannels(db::Transaction& tx) override {
    return inner_->DeleteAllChannels(tx);
  }

  db::Result UpsertPrograms(db::Transaction& tx, const std::vector<db::model::ProgramRecord>& programs) override {
    return inner_->UpsertPrograms(tx, programs);
  }

  std::vector<db::model::ProgramRecord> QueryPrograms(db::Transaction& tx, const std::vector<std::string>& channel_ids,
                                                      int64_t window_start_ms, int64_t window_end_ms) override {
    return inner_->QueryPrograms(tx, channel_ids, window_start_ms, window_end_ms);
  }

  db::Result DeleteProgramsOlderThan(db::Transaction& tx, int64_t cutoff_ms, uint64_t* deleted) override {
    return inner_->DeleteProgramsOlderThan(tx, cutoff_ms, deleted);
  }

  db::Result DeleteAllPrograms(db::Transaction& tx) override {
    return inner_->DeleteAllPrograms(tx);
  }

  uint64_t CountChannels(db::Transaction& tx) override {
    return inner_->CountChannels(tx);
  }

  uint64_t CountPrograms(db::Transaction& tx) override {
    return inner_->CountPrograms(tx);
  }

 protected:
  std::shared_ptr<db::Repository> inner_;
};

} // namespace epg::testing
