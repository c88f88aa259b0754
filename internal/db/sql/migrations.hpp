#pragma once

#include <string>
#include <vector>

namespace epg::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Schema of the schedule store, in application order.

  Programs carry no enforced foreign key: channels and programs are synced
  independently and a programme may arrive before its channel. Channel
  deletes cascade to programs explicitly in the repository.
*/
const std::vector<std::string>& ScheduleSchema();

/*
  Runs migrations in order.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace epg::db::sql
