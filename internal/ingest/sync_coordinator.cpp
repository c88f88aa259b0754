#include "internal/ingest/sync_coordinator.hpp"

#include <algorithm>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace epg::ingest {

using observability::IntField;
using observability::StringField;

const char* ToString(TriggerResult result) {
  switch (result) {
    case TriggerResult::kStarted:
      return "started";
    case TriggerResult::kAlreadyRunning:
      return "already_running";
    case TriggerResult::kNoNetwork:
      return "no_network";
  }
  return "unknown";
}

SyncCoordinatorOptions SyncCoordinatorOptions::FromConfig(const epg::runtime::config::SyncConfig& config) {
  SyncCoordinatorOptions options;
  if (config.has_interval()) options.interval = util::FromProto(config.interval());
  if (config.has_initial_backoff()) options.initial_backoff = util::FromProto(config.initial_backoff());
  if (config.has_max_backoff()) options.max_backoff = util::FromProto(config.max_backoff());
  options.run_on_start = config.run_on_start();
  return options;
}

SyncCoordinator::SyncCoordinator(std::shared_ptr<SyncPipeline> pipeline, SyncCoordinatorOptions options, util::NowFn now)
    : pipeline_(std::move(pipeline)), options_(options), now_(std::move(now)) {
}

SyncCoordinator::~SyncCoordinator() {
  Stop();
}

void SyncCoordinator::Start() {
  std::lock_guard lock(mutex_);
  if (started_) return;
  started_  = true;
  shutdown_ = false;
  if (options_.run_on_start) {
    state_.next_attempt_ms = now_();
  } else if (options_.interval.count() > 0) {
    state_.next_attempt_ms = now_() + options_.interval.count();
  }
  thread_ = std::thread(&SyncCoordinator::Run, this);
}

void SyncCoordinator::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!started_) return;
    shutdown_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();

  std::lock_guard lock(mutex_);
  started_ = false;
  if (pending_) {
    // accepted but never picked up by the worker
    pending_       = false;
    state_.running = false;
  }
}

TriggerResult SyncCoordinator::RequestSync() {
  {
    std::lock_guard lock(mutex_);
    if (!started_) throw util::FailedPrecondition("sync coordinator is not running");
    if (state_.running) return TriggerResult::kAlreadyRunning;
  }

  if (!pipeline_->Source().ProbeConnectivity()) {
    EPG_LOG_WARN("sync trigger rejected, feed host unreachable", {StringField("feed", pipeline_->Source().Describe())});
    return TriggerResult::kNoNetwork;
  }

  {
    std::lock_guard lock(mutex_);
    if (state_.running) return TriggerResult::kAlreadyRunning;
    state_.running = true;
    pending_       = true;
  }
  cv_.notify_all();
  return TriggerResult::kStarted;
}

std::optional<SyncOutcome> SyncCoordinator::RunOnce() {
  {
    std::lock_guard lock(mutex_);
    if (state_.running) return std::nullopt;
    state_.running = true;
  }
  return Execute(false);
}

SyncState SyncCoordinator::Status() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::chrono::milliseconds SyncCoordinator::BackoffFor(uint32_t consecutive_retries) const {
  auto backoff = options_.initial_backoff;
  for (uint32_t i = 1; i < consecutive_retries && backoff < options_.max_backoff; ++i) {
    backoff *= 2;
  }
  return std::min(backoff, options_.max_backoff);
}

void SyncCoordinator::Run() {
  std::unique_lock lock(mutex_);
  while (!shutdown_) {
    if (pending_) {
      pending_ = false;
      lock.unlock();
      Execute(false);
      lock.lock();
      continue;
    }

    if (state_.next_attempt_ms == 0) {
      cv_.wait(lock);
      continue;
    }

    const int64_t wait_ms = state_.next_attempt_ms - now_();
    if (wait_ms > 0) {
      cv_.wait_for(lock, std::chrono::milliseconds(wait_ms));
      continue;
    }

    state_.next_attempt_ms = 0;
    if (state_.running) continue;
    state_.running = true;
    lock.unlock();
    Execute(true);
    lock.lock();
  }
}

SyncOutcome SyncCoordinator::Execute(bool probe_first) {
  SyncOutcome outcome;
  try {
    if (probe_first && !pipeline_->Source().ProbeConnectivity()) {
      outcome.status  = SyncStatus::kRetry;
      outcome.message = "feed host unreachable";
    } else {
      outcome = pipeline_->Sync();
    }
  } catch (const std::exception& e) {
    outcome.status  = SyncStatus::kFailure;
    outcome.message = e.what();
  }
  Record(outcome);
  return outcome;
}

void SyncCoordinator::Record(const SyncOutcome& outcome) {
  {
    std::lock_guard lock(mutex_);
    const int64_t now       = now_();
    state_.running          = false;
    state_.last             = outcome;
    state_.last_finished_ms = now;

    if (outcome.status == SyncStatus::kRetry) {
      ++state_.consecutive_retries;
      state_.next_attempt_ms = now + BackoffFor(state_.consecutive_retries).count();
    } else {
      state_.consecutive_retries = 0;
      state_.next_attempt_ms     = options_.interval.count() > 0 ? now + options_.interval.count() : 0;
    }

    if (outcome.status == SyncStatus::kRetry) {
      EPG_LOG_INFO("epg sync rescheduled",
                   {IntField("retry", state_.consecutive_retries), IntField("next_attempt_ms", state_.next_attempt_ms)});
    }
  }
  cv_.notify_all();
}

} // namespace epg::ingest
