#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/channel_record.hpp"
#include "internal/db/model/program_record.hpp"

#if EPG_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using epg::db::ErrorCode;
using epg::db::Repository;
using epg::db::memory::MemoryRepository;
using epg::db::model::ChannelRecord;
using epg::db::model::ProgramRecord;

constexpr int64_t kHour = 60LL * 60 * 1000;
constexpr int64_t kBase = 1705314600000; // 2024-01-15T10:30:00Z

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

ChannelRecord Channel(const std::string& id, const std::string& name) {
  ChannelRecord c;
  c.channel_id   = id;
  c.display_name = name;
  c.icon_url     = "http://img.example/" + id + ".png";
  return c;
}

ProgramRecord Program(const std::string& channel, const std::string& title, int64_t start, int64_t end) {
  ProgramRecord p;
  p.channel_id    = channel;
  p.title         = title;
  p.start_time_ms = start;
  p.end_time_ms   = end;
  return p;
}

void Write(Repository& repo, const std::function<epg::db::Result(epg::db::Transaction&)>& fn) {
  auto tx     = repo.Begin();
  auto result = fn(*tx);
  assert(result);
  tx->Commit();
}

std::vector<ProgramRecord> Query(Repository& repo, const std::vector<std::string>& ids, int64_t start, int64_t end) {
  auto tx   = repo.Begin();
  auto rows = repo.QueryPrograms(*tx, ids, start, end);
  tx->Commit();
  return rows;
}

uint64_t Count(Repository& repo) {
  auto tx = repo.Begin();
  auto n  = repo.CountPrograms(*tx);
  tx->Commit();
  return n;
}

void Reset(Repository& repo) {
  Write(repo, [&](auto& tx) { return repo.DeleteAllPrograms(tx); });
  Write(repo, [&](auto& tx) { return repo.DeleteAllChannels(tx); });
}

void VerifyChannelUpsertReplaces(Repository& repo) {
  Reset(repo);
  Write(repo, [&](auto& tx) { return repo.UpsertChannels(tx, {Channel("bbc1", "BBC One"), Channel("itv", "ITV")}); });

  ChannelRecord renamed;
  renamed.channel_id   = "bbc1";
  renamed.display_name = "BBC One HD";
  Write(repo, [&](auto& tx) { return repo.UpsertChannels(tx, {renamed}); });

  auto tx      = repo.Begin();
  auto channel = repo.GetChannel(*tx, "bbc1");
  assert(channel.has_value());
  assert(channel->display_name == "BBC One HD");
  assert(!channel->icon_url.has_value()); // replaced wholesale
  assert(!repo.GetChannel(*tx, "missing").has_value());
  assert(repo.ListChannels(*tx).size() == 2);
  assert(repo.CountChannels(*tx) == 2);
  tx->Commit();
}

void VerifyProgramUpsertKeepsIdentity(Repository& repo) {
  Reset(repo);
  Write(repo, [&](auto& tx) { return repo.UpsertPrograms(tx, {Program("bbc1", "News", kBase, kBase + kHour)}); });

  auto first = Query(repo, {"bbc1"}, kBase, kBase + kHour);
  assert(first.size() == 1);
  const uint64_t id = first[0].id;
  assert(id != 0);

  auto replacement        = Program("bbc1", "News Special", kBase, kBase + 2 * kHour);
  replacement.description = "Extended";
  Write(repo, [&](auto& tx) { return repo.UpsertPrograms(tx, {replacement}); });

  auto second = Query(repo, {"bbc1"}, kBase, kBase + kHour);
  assert(second.size() == 1);
  assert(second[0].id == id);
  assert(second[0].title == "News Special");
  assert(second[0].description == "Extended");
  assert(second[0].end_time_ms == kBase + 2 * kHour);
  assert(Count(repo) == 1);

  Write(repo, [&](auto& tx) { return repo.UpsertPrograms(tx, {Program("bbc1", "Weather", kBase + 2 * kHour, kBase + 3 * kHour)}); });
  auto both = Query(repo, {"bbc1"}, kBase, kBase + 3 * kHour);
  assert(both.size() == 2);
  assert(both[1].id > id);
}

void VerifyInvalidProgramsAreRefused(Repository& repo) {
  Reset(repo);
  auto tx     = repo.Begin();
  auto result = repo.UpsertPrograms(*tx, {Program("bbc1", "Zero", kBase, kBase)});
  assert(!result);
  assert(result.code == ErrorCode::InvalidArgument);

  result = repo.UpsertPrograms(*tx, {Program("bbc1", "Backwards", kBase, kBase - kHour)});
  assert(result.code == ErrorCode::InvalidArgument);

  result = repo.UpsertPrograms(*tx, {Program("", "Orphan", kBase, kBase + kHour)});
  assert(result.code == ErrorCode::InvalidArgument);
  tx->Rollback();

  assert(Count(repo) == 0);
}

void VerifyWindowQuery(Repository& repo) {
  Reset(repo);
  Write(repo, [&](auto& tx) {
    return repo.UpsertPrograms(tx, {
                                       Program("bbc1", "Before", kBase - 2 * kHour, kBase - kHour),
                                       Program("bbc1", "Touching", kBase - kHour, kBase),
                                       Program("bbc1", "Straddling", kBase - 30 * 60 * 1000, kBase + 30 * 60 * 1000),
                                       Program("bbc1", "Inside", kBase + kHour, kBase + 2 * kHour),
                                       Program("bbc1", "AtEnd", kBase + 3 * kHour, kBase + 4 * kHour),
                                       Program("itv", "Other", kBase + 30 * 60 * 1000, kBase + kHour),
                                       Program("ch4", "Unrequested", kBase, kBase + kHour),
                                   });
  });

  // [kBase, kBase + 3h): overlap is end > start_window AND start < end_window
  auto rows = Query(repo, {"bbc1", "itv"}, kBase, kBase + 3 * kHour);
  assert(rows.size() == 3);
  assert(rows[0].title == "Straddling");
  assert(rows[1].title == "Other");
  assert(rows[2].title == "Inside");
  for (size_t i = 1; i < rows.size(); ++i) {
    assert(rows[i - 1].start_time_ms <= rows[i].start_time_ms);
  }

  // programs need no stored channel row to be returned
  auto orphan = Query(repo, {"ch4"}, kBase, kBase + kHour);
  assert(orphan.size() == 1);

  assert(Query(repo, {"nobody"}, kBase, kBase + kHour).empty());
}

void VerifyRetentionPrune(Repository& repo) {
  Reset(repo);
  Write(repo, [&](auto& tx) {
    return repo.UpsertPrograms(tx, {
                                       Program("bbc1", "Old", kBase - 3 * kHour, kBase - 2 * kHour),
                                       Program("bbc1", "Boundary", kBase - 2 * kHour, kBase),
                                       Program("bbc1", "Current", kBase, kBase + kHour),
                                   });
  });

  uint64_t deleted = 0;
  Write(repo, [&](auto& tx) { return repo.DeleteProgramsOlderThan(tx, kBase, &deleted); });
  assert(deleted == 1); // end == cutoff survives
  assert(Count(repo) == 2);

  Write(repo, [&](auto& tx) { return repo.DeleteProgramsOlderThan(tx, kBase, &deleted); });
  assert(deleted == 0);
}

void VerifyDeleteAllChannelsCascades(Repository& repo) {
  Reset(repo);
  Write(repo, [&](auto& tx) { return repo.UpsertChannels(tx, {Channel("bbc1", "BBC One")}); });
  Write(repo, [&](auto& tx) {
    return repo.UpsertPrograms(tx, {Program("bbc1", "News", kBase, kBase + kHour), Program("ghost", "Orphan", kBase, kBase + kHour)});
  });

  Write(repo, [&](auto& tx) { return repo.DeleteAllChannels(tx); });

  auto tx = repo.Begin();
  assert(repo.ListChannels(*tx).empty());
  assert(repo.CountChannels(*tx) == 0);
  tx->Commit();
  assert(Query(repo, {"bbc1"}, kBase, kBase + kHour).empty());
  assert(Count(repo) == 1);

  Write(repo, [&](auto& tx) { return repo.DeleteAllPrograms(tx); });
  assert(Count(repo) == 0);
}

void VerifyRollbackBehavior(Repository& repo) {
  Reset(repo);
  {
    auto tx = repo.Begin();
    assert(repo.UpsertPrograms(*tx, {Program("bbc1", "Draft", kBase, kBase + kHour)}));
    assert(repo.CountPrograms(*tx) == 1); // own writes visible
    tx->Rollback();
  }
  assert(Count(repo) == 0);

  {
    auto tx = repo.Begin();
    assert(repo.UpsertChannels(*tx, {Channel("bbc1", "BBC One")}));
    // destructor rolls back
  }
  auto tx = repo.Begin();
  assert(!repo.GetChannel(*tx, "bbc1").has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) return;

  auto repo = backend.make_repository();
  Reset(*repo);
  Write(*repo, [&](auto& tx) { return repo->UpsertChannels(tx, {Channel("bbc1", "BBC One")}); });
  Write(*repo, [&](auto& tx) { return repo->UpsertPrograms(tx, {Program("bbc1", "News", kBase, kBase + kHour)}); });

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetChannel(*tx, "bbc1").has_value());
  assert(repo->CountPrograms(*tx) == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if EPG_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("epg_guide_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<epg::db::sqlite::SqliteDB>(db_path);
    epg::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<epg::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyChannelUpsertReplaces(*repo);
    VerifyProgramUpsertKeepsIdentity(*repo);
    VerifyInvalidProgramsAreRefused(*repo);
    VerifyWindowQuery(*repo);
    VerifyRetentionPrune(*repo);
    VerifyDeleteAllChannelsCascades(*repo);
    VerifyRollbackBehavior(*repo);
  }

  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if EPG_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "epg_guide_integration_repository_parity: pass\n";
  return 0;
}
