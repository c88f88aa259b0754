#include "internal/ingest/sync_pipeline.hpp"

#include <optional>
#include <string_view>
#include <utility>

#include "config/config.pb.h"
#include "internal/ingest/batch_writer.hpp"
#include "internal/ingest/content_filter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/xmltv/xml_pull_reader.hpp"
#include "internal/xmltv/xmltv_parser.hpp"

namespace epg::ingest {

namespace {

using observability::IntField;
using observability::StringField;

std::optional<std::string_view> View(const std::optional<std::string>& text) {
  if (!text) return std::nullopt;
  return std::string_view(*text);
}

// Applies the content filter and hands survivors to the batch writer.
class FilteringSink final : public xmltv::XmltvSink {
 public:
  FilteringSink(const ContentFilter& filter, BatchWriter& writer, SyncCounters& counters)
      : filter_(filter), writer_(writer), counters_(counters) {
  }

  void OnChannel(xmltv::ParsedChannel channel) override {
    if (filter_.IsUnsafe(View(channel.display_name))) {
      ++counters_.channels_filtered;
      return;
    }
    db::model::ChannelRecord record;
    record.channel_id   = std::move(channel.id);
    record.display_name = std::move(channel.display_name);
    record.icon_url     = std::move(channel.icon_url);
    writer_.AddChannel(std::move(record));
  }

  void OnProgramme(xmltv::ParsedProgramme programme) override {
    if (filter_.AnyUnsafe({programme.title, View(programme.description), View(programme.category)})) {
      ++counters_.programs_filtered;
      return;
    }
    db::model::ProgramRecord record;
    record.channel_id    = std::move(programme.channel_id);
    record.title         = std::move(programme.title);
    record.description   = std::move(programme.description);
    record.category      = std::move(programme.category);
    record.start_time_ms = programme.start_time_ms;
    record.end_time_ms   = programme.end_time_ms;
    writer_.AddProgram(std::move(record));
  }

 private:
  const ContentFilter& filter_;
  BatchWriter&         writer_;
  SyncCounters&        counters_;
};

void MergeWriterStats(const BatchStats& stats, SyncCounters& counters) {
  counters.channels_written = stats.channels_written;
  counters.programs_written = stats.programs_written;
  counters.channel_flushes  = stats.channel_flushes;
  counters.program_flushes  = stats.program_flushes;
}

} // namespace

const char* ToString(SyncStatus status) {
  switch (status) {
    case SyncStatus::kSuccess:
      return "success";
    case SyncStatus::kRetry:
      return "retry";
    case SyncStatus::kFailure:
      return "failure";
  }
  return "unknown";
}

SyncOptions SyncOptions::FromConfig(const epg::runtime::config::SyncConfig& config) {
  SyncOptions options;
  if (config.batch_size() > 0) {
    options.batch_size = config.batch_size();
  }
  if (config.has_retention()) {
    options.retention_ms = util::FromProto(config.retention()).count();
  }
  if (config.denylist_size() > 0) {
    options.denylist.assign(config.denylist().begin(), config.denylist().end());
  }
  return options;
}

SyncPipeline::SyncPipeline(std::shared_ptr<db::Repository> repo, std::shared_ptr<feed::FeedSource> source, SyncOptions options,
                           util::NowFn now)
    : repo_(std::move(repo)), source_(std::move(source)), options_(std::move(options)), now_(std::move(now)) {
}

uint64_t SyncPipeline::Prune(int64_t now_ms) {
  const int64_t cutoff  = now_ms - options_.retention_ms;
  uint64_t      deleted = 0;
  db::Result    result;
  try {
    auto tx = repo_->Begin();
    result  = repo_->DeleteProgramsOlderThan(*tx, cutoff, &deleted);
    if (result) tx->Commit();
  } catch (const std::exception& e) {
    throw util::StorageFailure(std::string("prune failed: ") + e.what());
  }
  if (!result) {
    throw util::StorageFailure(std::string("prune failed: ") + db::ToString(result.code));
  }
  return deleted;
}

SyncOutcome SyncPipeline::Sync() {
  SyncOutcome   outcome;
  ContentFilter filter(options_.denylist);
  BatchWriter   writer(repo_, options_.batch_size);

  EPG_LOG_INFO("epg sync started", {StringField("feed", source_->Describe())});

  try {
    auto stream = source_->Open();

    FilteringSink      sink(filter, writer, outcome.counters);
    xmltv::XmltvParser parser(*stream);
    const auto         stats = parser.Parse(sink);
    writer.Finish();

    outcome.counters.channels_rejected = stats.channels_rejected;
    outcome.counters.programs_rejected = stats.programmes_rejected;
    outcome.counters.programs_pruned   = Prune(now_());
    outcome.status                     = SyncStatus::kSuccess;
  } catch (const util::Unavailable& e) {
    outcome.status  = SyncStatus::kRetry;
    outcome.message = e.what();
  } catch (const xmltv::ParseError& e) {
    outcome.status  = SyncStatus::kFailure;
    outcome.message = std::string("parse error: ") + e.what();
  } catch (const util::StorageFailure& e) {
    outcome.status  = SyncStatus::kFailure;
    outcome.message = e.what();
  } catch (const std::exception& e) {
    outcome.status  = SyncStatus::kFailure;
    outcome.message = e.what();
  }

  MergeWriterStats(writer.Stats(), outcome.counters);
  const auto& c = outcome.counters;

  switch (outcome.status) {
    case SyncStatus::kSuccess:
      EPG_LOG_INFO("epg sync finished",
                   {IntField("channels_written", static_cast<int64_t>(c.channels_written)),
                    IntField("programs_written", static_cast<int64_t>(c.programs_written)),
                    IntField("channels_filtered", static_cast<int64_t>(c.channels_filtered)),
                    IntField("programs_filtered", static_cast<int64_t>(c.programs_filtered)),
                    IntField("channels_rejected", static_cast<int64_t>(c.channels_rejected)),
                    IntField("programs_rejected", static_cast<int64_t>(c.programs_rejected)),
                    IntField("channel_flushes", static_cast<int64_t>(c.channel_flushes)),
                    IntField("program_flushes", static_cast<int64_t>(c.program_flushes)),
                    IntField("programs_pruned", static_cast<int64_t>(c.programs_pruned))});
      break;
    case SyncStatus::kRetry:
      EPG_LOG_WARN("epg sync transport failure",
                   {StringField("error", outcome.message),
                    IntField("programs_written", static_cast<int64_t>(c.programs_written))});
      break;
    case SyncStatus::kFailure:
      EPG_LOG_ERROR("epg sync failed",
                    {StringField("error", outcome.message),
                     IntField("channels_written", static_cast<int64_t>(c.channels_written)),
                     IntField("programs_written", static_cast<int64_t>(c.programs_written))});
      break;
  }

  return outcome;
}

} // namespace epg::ingest
