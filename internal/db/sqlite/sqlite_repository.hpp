#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace epg::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertChannels(Transaction&, const std::vector<model::ChannelRecord>&) override;
  std::optional<model::ChannelRecord> GetChannel(Transaction&, const std::string&) override;
  std::vector<model::ChannelRecord> ListChannels(Transaction&) override;
  Result DeleteAllChannels(Transaction&) override;

  Result UpsertPrograms(Transaction&, const std::vector<model::ProgramRecord>&) override;
  std::vector<model::ProgramRecord> QueryPrograms(Transaction&, const std::vector<std::string>& channel_ids,
                                                  int64_t window_start_ms, int64_t window_end_ms) override;
  Result DeleteProgramsOlderThan(Transaction&, int64_t cutoff_ms, uint64_t* deleted) override;
  Result DeleteAllPrograms(Transaction&) override;
  uint64_t CountChannels(Transaction&) override;
  uint64_t CountPrograms(Transaction&) override;

  // Creates tables and indexes if missing.
  static void BootstrapSchema(SqliteDB& db);

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
