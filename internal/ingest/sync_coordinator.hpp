#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "internal/ingest/sync_pipeline.hpp"
#include "internal/util/time.hpp"

namespace epg::runtime::config {
class SyncConfig;
}

namespace epg::ingest {

enum class TriggerResult {
  kStarted,
  kAlreadyRunning, // existing run kept, request dropped
  kNoNetwork,
};

const char* ToString(TriggerResult result);

struct SyncCoordinatorOptions {
  std::chrono::milliseconds interval{0}; // zero: on demand only
  std::chrono::milliseconds initial_backoff{30000};
  std::chrono::milliseconds max_backoff{3600000};
  bool                      run_on_start = false;

  static SyncCoordinatorOptions FromConfig(const epg::runtime::config::SyncConfig& config);
};

struct SyncState {
  bool                       running = false;
  std::optional<SyncOutcome> last;
  int64_t                    last_finished_ms    = 0;
  int64_t                    next_attempt_ms     = 0; // 0 when nothing is scheduled
  uint32_t                   consecutive_retries = 0;
};

/*
  Runs the sync pipeline on a single background worker.

  At most one run is in flight: a trigger arriving while a run is active is
  dropped. Retryable outcomes are rescheduled with exponential backoff
  (initial_backoff, doubling, capped at max_backoff); terminal failures wait
  for the next trigger or periodic tick. Stop() waits for an active run to
  finish, runs are never interrupted mid-parse.
*/
class SyncCoordinator {
 public:
  SyncCoordinator(std::shared_ptr<SyncPipeline> pipeline, SyncCoordinatorOptions options,
                  util::NowFn now = &util::NowMillis);
  ~SyncCoordinator();

  SyncCoordinator(const SyncCoordinator&)            = delete;
  SyncCoordinator& operator=(const SyncCoordinator&) = delete;

  void Start();
  void Stop();

  // Hands a run to the worker. Requires Start().
  TriggerResult RequestSync();

  // Runs on the calling thread under the same guard. nullopt when a run is
  // already active.
  std::optional<SyncOutcome> RunOnce();

  SyncState Status() const;

  std::chrono::milliseconds BackoffFor(uint32_t consecutive_retries) const;

 private:
  void        Run();
  SyncOutcome Execute(bool probe_first);
  void        Record(const SyncOutcome& outcome);

  std::shared_ptr<SyncPipeline> pipeline_;
  SyncCoordinatorOptions        options_;
  util::NowFn                   now_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  SyncState               state_;
  bool                    pending_  = false;
  bool                    started_  = false;
  bool                    shutdown_ = false;
  std::thread             thread_;
};

} // namespace epg::ingest
