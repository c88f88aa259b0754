#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/channel_record.hpp"
#include "internal/db/model/program_record.hpp"

namespace epg::db {

/*
  Schedule store abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A committed batch is visible atomically to other readers

  Only the ingestion pipeline writes; the query engine only reads.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Channels
  // ---------------------------------------------------------------------

  // Insert or replace on channel_id.
  virtual Result UpsertChannels(Transaction&, const std::vector<model::ChannelRecord>& channels) = 0;

  virtual std::optional<model::ChannelRecord> GetChannel(Transaction&, const std::string& channel_id) = 0;

  virtual std::vector<model::ChannelRecord> ListChannels(Transaction&) = 0;

  virtual uint64_t CountChannels(Transaction&) = 0;

  // Cascades to every program.
  virtual Result DeleteAllChannels(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Programs
  // ---------------------------------------------------------------------

  // Insert or replace on (channel_id, start_time_ms). Rows with
  // end_time_ms <= start_time_ms are refused with InvalidArgument.
  virtual Result UpsertPrograms(Transaction&, const std::vector<model::ProgramRecord>& programs) = 0;

  // Programs of the given channels overlapping [window_start_ms, window_end_ms),
  // ordered by start time then channel id.
  virtual std::vector<model::ProgramRecord> QueryPrograms(Transaction&, const std::vector<std::string>& channel_ids,
                                                          int64_t window_start_ms, int64_t window_end_ms) = 0;

  // Deletes programs with end_time_ms < cutoff_ms. `deleted` receives the row count.
  virtual Result DeleteProgramsOlderThan(Transaction&, int64_t cutoff_ms, uint64_t* deleted = nullptr) = 0;

  virtual Result DeleteAllPrograms(Transaction&) = 0;

  virtual uint64_t CountPrograms(Transaction&) = 0;
};

} // namespace epg::db
