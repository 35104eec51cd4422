#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/notification_server.hpp"
#include "internal/grpc/records_server.hpp"
#include "internal/grpc/report_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/notification_service.hpp"
#include "internal/service/records_service.hpp"
#include "internal/service/report_service.hpp"
#if REGISTRAR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace registrar::factory {

std::shared_ptr<db::Repository> BuildRepository(const registrar::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if REGISTRAR_DB_SQLITE
    auto sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    repository->BootstrapSchema();
    REGISTRAR_LOG_INFO("Using sqlite store", {registrar::observability::StringField("path", database.sqlite().path()),
                                              registrar::observability::BoolField("wal_mode", database.sqlite().wal_mode())});
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  REGISTRAR_LOG_WARN("Using in-memory store; records are lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const registrar::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store + core components
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.context    = service::BuildServiceContext(app.repository, config.identity().max_allocation_retries());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto records_service      = std::make_shared<service::RecordsService>(app.context);
  auto report_service       = std::make_shared<service::ReportService>(app.context);
  auto notification_service = std::make_shared<service::NotificationService>(app.context);
  auto admin_service        = std::make_shared<service::AdminService>(app.context);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RecordsServer>(records_service));
  app.grpc_services.push_back(std::make_unique<grpc::ReportServer>(report_service));
  app.grpc_services.push_back(std::make_unique<grpc::NotificationServer>(notification_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace registrar::factory
