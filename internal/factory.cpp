#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/integrity_guard.hpp"
#include "internal/core/product_store.hpp"
#include "internal/core/purchase_orders.hpp"
#include "internal/core/sale_processor.hpp"
#include "internal/core/shift_register.hpp"
#include "internal/core/stock_ledger.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if STOCKROOM_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if STOCKROOM_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace stockroom::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const stockroom::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if STOCKROOM_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.wal_mode        = database.sqlite().wal_mode();
    options.busy_timeout_ms = static_cast<int>(database.sqlite().busy_timeout_ms());

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    sqlite_db->EnsureSchema();
    STOCKROOM_LOG_INFO("sqlite store opened", {observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if STOCKROOM_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    pool->EnsureSchema();
    STOCKROOM_LOG_INFO("postgres store opened", {observability::IntField("max_connections", database.postgres().max_connections())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  STOCKROOM_LOG_INFO("memory store opened");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

Application Assemble(std::shared_ptr<db::Repository> repository, std::shared_ptr<identity::IdentityProvider> identity,
                     std::shared_ptr<notify::NotificationSink> sink, core::InventorySettings settings) {
  Application app;
  app.repository = std::move(repository);
  app.identity   = std::move(identity);
  app.notifier   = std::make_shared<notify::Notifier>(app.repository, std::move(sink));

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  core::CoreContext core_ctx;
  core_ctx.repository = app.repository;
  core_ctx.identity   = app.identity;
  core_ctx.notifier   = app.notifier;
  core_ctx.settings   = std::move(settings);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.products        = std::make_shared<core::ProductStore>(core_ctx);
  ctx.ledger          = std::make_shared<core::StockLedger>(core_ctx);
  ctx.sales           = std::make_shared<core::SaleProcessor>(core_ctx);
  ctx.purchase_orders = std::make_shared<core::PurchaseOrders>(core_ctx);
  ctx.shifts          = std::make_shared<core::ShiftRegister>(core_ctx);
  ctx.guard           = std::make_shared<core::IntegrityGuard>(core_ctx);
  ctx.repository      = app.repository;
  ctx.identity        = app.identity;
  ctx.notifier        = app.notifier;

  app.inventory   = std::make_shared<service::InventoryService>(ctx);
  app.sales       = std::make_shared<service::SalesService>(ctx);
  app.procurement = std::make_shared<service::ProcurementService>(ctx);
  return app;
}

/*
    Build full application dependency graph
*/
Application Build(const stockroom::runtime::config::RuntimeConfig& config) {
  auto repository = BuildRepository(config);

  const auto& tenant   = config.tenant();
  auto        provider = std::make_shared<identity::StaticIdentity>(tenant.tenant_id(), identity::Actor{tenant.actor_id(), tenant.actor_name()});

  core::InventorySettings settings;
  settings.default_low_stock_threshold = config.inventory().default_low_stock_threshold();
  settings.restored_category_name      = config.inventory().restored_category_name();

  return Assemble(std::move(repository), std::move(provider), std::make_shared<notify::LogSink>(), std::move(settings));
}

} // namespace stockroom::factory
