#include "internal/ingest/batch_writer.hpp"

#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace epg::ingest {

namespace {

template <typename WriteFn>
void WriteBatch(db::Repository& repo, const char* what, WriteFn&& write) {
  db::Result result;
  try {
    auto tx = repo.Begin();
    result  = write(*tx);
    if (result) {
      tx->Commit();
    }
  } catch (const std::exception& e) {
    throw util::StorageFailure(std::string(what) + " batch write failed: " + e.what());
  }
  if (!result) {
    throw util::StorageFailure(std::string(what) + " batch write failed: " + db::ToString(result.code) +
                               (result.message.empty() ? "" : " (" + result.message + ")"));
  }
}

} // namespace

BatchWriter::BatchWriter(std::shared_ptr<db::Repository> repo, std::size_t batch_size)
    : repo_(std::move(repo)), batch_size_(batch_size == 0 ? 1 : batch_size) {
  channels_.reserve(batch_size_);
  programs_.reserve(batch_size_);
}

void BatchWriter::AddChannel(db::model::ChannelRecord channel) {
  channels_.push_back(std::move(channel));
  if (channels_.size() >= batch_size_) FlushChannels();
}

void BatchWriter::AddProgram(db::model::ProgramRecord program) {
  programs_.push_back(std::move(program));
  if (programs_.size() >= batch_size_) FlushPrograms();
}

void BatchWriter::Finish() {
  if (!channels_.empty()) FlushChannels();
  if (!programs_.empty()) FlushPrograms();
}

void BatchWriter::FlushChannels() {
  WriteBatch(*repo_, "channel", [&](db::Transaction& tx) { return repo_->UpsertChannels(tx, channels_); });
  stats_.channels_written += channels_.size();
  ++stats_.channel_flushes;
  channels_.clear();
}

void BatchWriter::FlushPrograms() {
  WriteBatch(*repo_, "program", [&](db::Transaction& tx) { return repo_->UpsertPrograms(tx, programs_); });
  stats_.programs_written += programs_.size();
  ++stats_.program_flushes;
  programs_.clear();
}

} // namespace epg::ingest
