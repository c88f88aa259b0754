#include "internal/db/sql/migrations.hpp"

namespace epg::db::sql {

const std::vector<std::string>& ScheduleSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS epg_channels (channel_id TEXT PRIMARY KEY, display_name TEXT, icon_url TEXT);",
      "CREATE TABLE IF NOT EXISTS epg_programs (id INTEGER PRIMARY KEY AUTOINCREMENT, channel_id TEXT NOT NULL, title TEXT NOT NULL, "
      "description TEXT, start_time INTEGER NOT NULL, end_time INTEGER NOT NULL, category TEXT, "
      "CHECK (end_time > start_time), UNIQUE(channel_id, start_time));",
      "CREATE INDEX IF NOT EXISTS idx_epg_programs_channel_id ON epg_programs(channel_id);",
      "CREATE INDEX IF NOT EXISTS idx_epg_programs_start_time ON epg_programs(start_time);",
      "CREATE INDEX IF NOT EXISTS idx_epg_programs_end_time ON epg_programs(end_time);"};
  return kSchema;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace epg::db::sql
