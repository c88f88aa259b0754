#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace epg::ingest {

struct BatchStats {
  uint64_t channels_written = 0;
  uint64_t programs_written = 0;
  uint64_t channel_flushes  = 0;
  uint64_t program_flushes  = 0;
};

/*
  Buffers parsed records and writes them in fixed-size batches.

  Channels and programs have independent buffers. Each flush is a single
  transaction, so a batch is either fully visible or not at all. A failed
  write throws util::StorageFailure; batches flushed before it stay
  committed.
*/
class BatchWriter {
 public:
  BatchWriter(std::shared_ptr<db::Repository> repo, std::size_t batch_size);

  void AddChannel(db::model::ChannelRecord channel);
  void AddProgram(db::model::ProgramRecord program);

  // Flushes whatever is buffered, channels first.
  void Finish();

  const BatchStats& Stats() const {
    return stats_;
  }

 private:
  void FlushChannels();
  void FlushPrograms();

  std::shared_ptr<db::Repository>       repo_;
  std::size_t                           batch_size_;
  std::vector<db::model::ChannelRecord> channels_;
  std::vector<db::model::ProgramRecord> programs_;
  BatchStats                            stats_;
};

} // namespace epg::ingest
