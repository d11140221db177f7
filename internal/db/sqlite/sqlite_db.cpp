#include "sqlite_db.hpp"

#include <stdexcept>

namespace stockroom::db::sqlite {

namespace {

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

// Aggregates are split into parent + ordered child tables. Child rows are
// owned by the parent and replaced whole on update.
constexpr const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS products (tenant_id TEXT NOT NULL, id TEXT NOT NULL, sku TEXT NOT NULL, name TEXT NOT NULL, retail_price INTEGER NOT NULL, cost_price INTEGER NOT NULL, stock INTEGER NOT NULL, low_stock_threshold INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (tenant_id, id), UNIQUE (tenant_id, sku));",
    "CREATE TABLE IF NOT EXISTS product_variants (tenant_id TEXT NOT NULL, product_id TEXT NOT NULL, position INTEGER NOT NULL, id TEXT NOT NULL, sku TEXT NOT NULL, stock INTEGER NOT NULL, cost_price INTEGER NOT NULL, retail_price INTEGER NOT NULL, PRIMARY KEY (tenant_id, product_id, position), FOREIGN KEY (tenant_id, product_id) REFERENCES products(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS variant_options (tenant_id TEXT NOT NULL, product_id TEXT NOT NULL, variant_id TEXT NOT NULL, position INTEGER NOT NULL, name TEXT NOT NULL, value TEXT NOT NULL, PRIMARY KEY (tenant_id, variant_id, position), FOREIGN KEY (tenant_id, product_id) REFERENCES products(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS price_history (tenant_id TEXT NOT NULL, product_id TEXT NOT NULL, owner_id TEXT NOT NULL, position INTEGER NOT NULL, date_ms INTEGER NOT NULL, price_type TEXT NOT NULL, old_value INTEGER NOT NULL, new_value INTEGER NOT NULL, actor_id TEXT NOT NULL, actor_name TEXT NOT NULL, PRIMARY KEY (tenant_id, owner_id, position), FOREIGN KEY (tenant_id, product_id) REFERENCES products(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS product_categories (tenant_id TEXT NOT NULL, product_id TEXT NOT NULL, position INTEGER NOT NULL, category_id TEXT NOT NULL, PRIMARY KEY (tenant_id, product_id, position), FOREIGN KEY (tenant_id, product_id) REFERENCES products(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS categories (tenant_id TEXT NOT NULL, id TEXT NOT NULL, name TEXT NOT NULL, parent_id TEXT, PRIMARY KEY (tenant_id, id));",
    "CREATE TABLE IF NOT EXISTS stock_adjustments (tenant_id TEXT NOT NULL, id TEXT NOT NULL, product_id TEXT NOT NULL, variant_id TEXT, quantity INTEGER NOT NULL, reason TEXT NOT NULL, source TEXT NOT NULL, source_id TEXT NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (tenant_id, id));",
    "CREATE INDEX IF NOT EXISTS stock_adjustments_product ON stock_adjustments(tenant_id, product_id);",
    "CREATE TABLE IF NOT EXISTS sales (tenant_id TEXT NOT NULL, id TEXT NOT NULL, public_ref TEXT NOT NULL, type TEXT NOT NULL, date_ms INTEGER NOT NULL, total INTEGER NOT NULL, cogs INTEGER NOT NULL, profit INTEGER NOT NULL, status TEXT NOT NULL, original_sale_id TEXT, original_sale_public_ref TEXT NOT NULL, cashier_id TEXT NOT NULL, PRIMARY KEY (tenant_id, id), UNIQUE (tenant_id, public_ref));",
    "CREATE TABLE IF NOT EXISTS sale_items (tenant_id TEXT NOT NULL, sale_id TEXT NOT NULL, position INTEGER NOT NULL, product_id TEXT NOT NULL, variant_id TEXT, name TEXT NOT NULL, sku TEXT NOT NULL, quantity INTEGER NOT NULL, cost_price INTEGER NOT NULL, retail_price INTEGER NOT NULL, returned_quantity INTEGER NOT NULL, original_sale_id TEXT, PRIMARY KEY (tenant_id, sale_id, position), FOREIGN KEY (tenant_id, sale_id) REFERENCES sales(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS sale_item_options (tenant_id TEXT NOT NULL, sale_id TEXT NOT NULL, item_position INTEGER NOT NULL, position INTEGER NOT NULL, name TEXT NOT NULL, value TEXT NOT NULL, PRIMARY KEY (tenant_id, sale_id, item_position, position), FOREIGN KEY (tenant_id, sale_id) REFERENCES sales(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS sale_payments (tenant_id TEXT NOT NULL, sale_id TEXT NOT NULL, position INTEGER NOT NULL, type TEXT NOT NULL, amount INTEGER NOT NULL, PRIMARY KEY (tenant_id, sale_id, position), FOREIGN KEY (tenant_id, sale_id) REFERENCES sales(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS purchase_orders (tenant_id TEXT NOT NULL, id TEXT NOT NULL, public_ref TEXT NOT NULL, supplier_id TEXT NOT NULL, supplier_name TEXT NOT NULL, date_created_ms INTEGER NOT NULL, date_expected_ms INTEGER, total_cost INTEGER NOT NULL, notes TEXT NOT NULL, status TEXT NOT NULL, PRIMARY KEY (tenant_id, id), UNIQUE (tenant_id, public_ref));",
    "CREATE TABLE IF NOT EXISTS purchase_order_items (tenant_id TEXT NOT NULL, po_id TEXT NOT NULL, position INTEGER NOT NULL, product_id TEXT NOT NULL, variant_id TEXT, name TEXT NOT NULL, quantity_ordered INTEGER NOT NULL, quantity_received INTEGER NOT NULL, cost_price INTEGER NOT NULL, PRIMARY KEY (tenant_id, po_id, position), FOREIGN KEY (tenant_id, po_id) REFERENCES purchase_orders(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS shifts (tenant_id TEXT NOT NULL, id TEXT NOT NULL, opened_by_id TEXT NOT NULL, opened_by_name TEXT NOT NULL, start_time_ms INTEGER NOT NULL, start_float INTEGER NOT NULL, cash_sales INTEGER NOT NULL, cash_refunds INTEGER NOT NULL, status TEXT NOT NULL, closed_by_id TEXT NOT NULL, closed_by_name TEXT NOT NULL, end_time_ms INTEGER, expected_cash INTEGER, actual_cash INTEGER, difference INTEGER, notes TEXT NOT NULL, PRIMARY KEY (tenant_id, id));",
    "CREATE TABLE IF NOT EXISTS notifications (tenant_id TEXT NOT NULL, id TEXT NOT NULL, timestamp_ms INTEGER NOT NULL, category TEXT NOT NULL, message TEXT NOT NULL, is_read INTEGER NOT NULL, related_id TEXT NOT NULL, PRIMARY KEY (tenant_id, id));",
    "CREATE TABLE IF NOT EXISTS deletion_records (tenant_id TEXT NOT NULL, id TEXT NOT NULL, table_name TEXT NOT NULL, deleted_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS deletion_records_entity ON deletion_records(tenant_id, id, table_name);",
};

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::EnsureSchema() {
  for (const char* sql : kSchema) {
    Exec(sql);
  }
}

void SqliteDB::Configure() {
  if (options_.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  // foreign keys are OFF by default in sqlite; child tables rely on cascade
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, options_.busy_timeout_ms), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace stockroom::db::sqlite
