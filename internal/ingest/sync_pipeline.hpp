#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/feed/feed_stream.hpp"
#include "internal/util/time.hpp"

namespace epg::runtime::config {
class SyncConfig;
}

namespace epg::ingest {

enum class SyncStatus {
  kSuccess,
  kRetry,   // transport failure, back off and try again
  kFailure, // parse or storage failure, not retried automatically
};

const char* ToString(SyncStatus status);

struct SyncCounters {
  uint64_t channels_written  = 0;
  uint64_t programs_written  = 0;
  uint64_t channels_filtered = 0;
  uint64_t programs_filtered = 0;
  uint64_t channels_rejected = 0;
  uint64_t programs_rejected = 0;
  uint64_t channel_flushes   = 0;
  uint64_t program_flushes   = 0;
  uint64_t programs_pruned   = 0;
};

struct SyncOutcome {
  SyncStatus   status = SyncStatus::kSuccess;
  std::string  message;
  SyncCounters counters;

  bool Ok() const {
    return status == SyncStatus::kSuccess;
  }
};

struct SyncOptions {
  std::size_t              batch_size   = 100;
  int64_t                  retention_ms = util::kMillisPerDay;
  std::vector<std::string> denylist{"Adult", "XXX", "Porn"};

  static SyncOptions FromConfig(const epg::runtime::config::SyncConfig& config);
};

/*
  One XMLTV ingestion run: fetch, stream-parse, filter, batch-write, prune.

  Sync() never throws. Already committed batches are kept whatever the
  outcome, so readers may observe a partially refreshed guide.
*/
class SyncPipeline {
 public:
  SyncPipeline(std::shared_ptr<db::Repository> repo, std::shared_ptr<feed::FeedSource> source, SyncOptions options,
               util::NowFn now = &util::NowMillis);

  SyncOutcome Sync();

  feed::FeedSource& Source() {
    return *source_;
  }

 private:
  uint64_t Prune(int64_t now_ms);

  std::shared_ptr<db::Repository>   repo_;
  std::shared_ptr<feed::FeedSource> source_;
  SyncOptions                       options_;
  util::NowFn                       now_;
};

} // namespace epg::ingest
