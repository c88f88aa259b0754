#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/sync_coordinator.hpp"

namespace epg::factory {

/*
  Application

  Owns all long-lived objects used by the server. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<ingest::SyncCoordinator>      sync;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and feed types.
*/
Application Build(const epg::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const epg::runtime::config::RuntimeConfig& config);

} // namespace epg::factory
