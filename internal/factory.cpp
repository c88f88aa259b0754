#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/feed/feed_source.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/guide_server.hpp"
#include "internal/guide/schedule_query.hpp"
#include "internal/ingest/sync_pipeline.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/guide_service.hpp"
#include "internal/service/service_context.hpp"
#if EPG_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace epg::factory {

std::shared_ptr<db::Repository> BuildRepository(const epg::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if EPG_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    EPG_LOG_INFO("schedule store opened", {observability::StringField("backend", "sqlite"),
                                           observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  EPG_LOG_INFO("schedule store opened", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const epg::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Schedule store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Ingestion
  // ------------------------------------------------------------------
  std::shared_ptr<feed::FeedSource> source = feed::MakeFeedSource(config.feed());

  auto pipeline = std::make_shared<ingest::SyncPipeline>(app.repository, source, ingest::SyncOptions::FromConfig(config.sync()));
  app.sync      = std::make_shared<ingest::SyncCoordinator>(pipeline, ingest::SyncCoordinatorOptions::FromConfig(config.sync()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = app.repository;
  ctx.schedule   = std::make_shared<guide::ScheduleQuery>(app.repository);
  ctx.sync       = app.sync;

  auto guide_service = std::make_shared<service::GuideService>(ctx);
  auto admin_service = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::GuideServer>(guide_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace epg::factory
