#include "pg_pool.hpp"

#include <utility>

namespace stockroom::db::postgres {

namespace {

constexpr const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS products (tenant_id TEXT NOT NULL, id TEXT NOT NULL, sku TEXT NOT NULL, name TEXT NOT NULL, retail_price BIGINT NOT NULL, cost_price BIGINT NOT NULL, stock BIGINT NOT NULL, low_stock_threshold BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, PRIMARY KEY (tenant_id, id), UNIQUE (tenant_id, sku));",
    "CREATE TABLE IF NOT EXISTS product_variants (tenant_id TEXT NOT NULL, product_id TEXT NOT NULL, position INTEGER NOT NULL, id TEXT NOT NULL, sku TEXT NOT NULL, stock BIGINT NOT NULL, cost_price BIGINT NOT NULL, retail_price BIGINT NOT NULL, PRIMARY KEY (tenant_id, product_id, position), FOREIGN KEY (tenant_id, product_id) REFERENCES products(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS variant_options (tenant_id TEXT NOT NULL, product_id TEXT NOT NULL, variant_id TEXT NOT NULL, position INTEGER NOT NULL, name TEXT NOT NULL, value TEXT NOT NULL, PRIMARY KEY (tenant_id, variant_id, position), FOREIGN KEY (tenant_id, product_id) REFERENCES products(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS price_history (tenant_id TEXT NOT NULL, product_id TEXT NOT NULL, owner_id TEXT NOT NULL, position INTEGER NOT NULL, date_ms BIGINT NOT NULL, price_type TEXT NOT NULL, old_value BIGINT NOT NULL, new_value BIGINT NOT NULL, actor_id TEXT NOT NULL, actor_name TEXT NOT NULL, PRIMARY KEY (tenant_id, owner_id, position), FOREIGN KEY (tenant_id, product_id) REFERENCES products(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS product_categories (tenant_id TEXT NOT NULL, product_id TEXT NOT NULL, position INTEGER NOT NULL, category_id TEXT NOT NULL, PRIMARY KEY (tenant_id, product_id, position), FOREIGN KEY (tenant_id, product_id) REFERENCES products(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS categories (tenant_id TEXT NOT NULL, id TEXT NOT NULL, name TEXT NOT NULL, parent_id TEXT, PRIMARY KEY (tenant_id, id));",
    "CREATE TABLE IF NOT EXISTS stock_adjustments (tenant_id TEXT NOT NULL, id TEXT NOT NULL, product_id TEXT NOT NULL, variant_id TEXT, quantity BIGINT NOT NULL, reason TEXT NOT NULL, source TEXT NOT NULL, source_id TEXT NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY (tenant_id, id));",
    "CREATE INDEX IF NOT EXISTS stock_adjustments_product ON stock_adjustments(tenant_id, product_id);",
    "CREATE TABLE IF NOT EXISTS sales (tenant_id TEXT NOT NULL, id TEXT NOT NULL, public_ref TEXT NOT NULL, type TEXT NOT NULL, date_ms BIGINT NOT NULL, total BIGINT NOT NULL, cogs BIGINT NOT NULL, profit BIGINT NOT NULL, status TEXT NOT NULL, original_sale_id TEXT, original_sale_public_ref TEXT NOT NULL, cashier_id TEXT NOT NULL, PRIMARY KEY (tenant_id, id), UNIQUE (tenant_id, public_ref));",
    "CREATE TABLE IF NOT EXISTS sale_items (tenant_id TEXT NOT NULL, sale_id TEXT NOT NULL, position INTEGER NOT NULL, product_id TEXT NOT NULL, variant_id TEXT, name TEXT NOT NULL, sku TEXT NOT NULL, quantity BIGINT NOT NULL, cost_price BIGINT NOT NULL, retail_price BIGINT NOT NULL, returned_quantity BIGINT NOT NULL, original_sale_id TEXT, PRIMARY KEY (tenant_id, sale_id, position), FOREIGN KEY (tenant_id, sale_id) REFERENCES sales(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS sale_item_options (tenant_id TEXT NOT NULL, sale_id TEXT NOT NULL, item_position INTEGER NOT NULL, position INTEGER NOT NULL, name TEXT NOT NULL, value TEXT NOT NULL, PRIMARY KEY (tenant_id, sale_id, item_position, position), FOREIGN KEY (tenant_id, sale_id) REFERENCES sales(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS sale_payments (tenant_id TEXT NOT NULL, sale_id TEXT NOT NULL, position INTEGER NOT NULL, type TEXT NOT NULL, amount BIGINT NOT NULL, PRIMARY KEY (tenant_id, sale_id, position), FOREIGN KEY (tenant_id, sale_id) REFERENCES sales(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS purchase_orders (tenant_id TEXT NOT NULL, id TEXT NOT NULL, public_ref TEXT NOT NULL, supplier_id TEXT NOT NULL, supplier_name TEXT NOT NULL, date_created_ms BIGINT NOT NULL, date_expected_ms BIGINT, total_cost BIGINT NOT NULL, notes TEXT NOT NULL, status TEXT NOT NULL, PRIMARY KEY (tenant_id, id), UNIQUE (tenant_id, public_ref));",
    "CREATE TABLE IF NOT EXISTS purchase_order_items (tenant_id TEXT NOT NULL, po_id TEXT NOT NULL, position INTEGER NOT NULL, product_id TEXT NOT NULL, variant_id TEXT, name TEXT NOT NULL, quantity_ordered BIGINT NOT NULL, quantity_received BIGINT NOT NULL, cost_price BIGINT NOT NULL, PRIMARY KEY (tenant_id, po_id, position), FOREIGN KEY (tenant_id, po_id) REFERENCES purchase_orders(tenant_id, id) ON DELETE CASCADE);",
    "CREATE TABLE IF NOT EXISTS shifts (tenant_id TEXT NOT NULL, id TEXT NOT NULL, opened_by_id TEXT NOT NULL, opened_by_name TEXT NOT NULL, start_time_ms BIGINT NOT NULL, start_float BIGINT NOT NULL, cash_sales BIGINT NOT NULL, cash_refunds BIGINT NOT NULL, status TEXT NOT NULL, closed_by_id TEXT NOT NULL, closed_by_name TEXT NOT NULL, end_time_ms BIGINT, expected_cash BIGINT, actual_cash BIGINT, difference BIGINT, notes TEXT NOT NULL, PRIMARY KEY (tenant_id, id));",
    "CREATE TABLE IF NOT EXISTS notifications (tenant_id TEXT NOT NULL, id TEXT NOT NULL, timestamp_ms BIGINT NOT NULL, category TEXT NOT NULL, message TEXT NOT NULL, is_read BOOLEAN NOT NULL, related_id TEXT NOT NULL, PRIMARY KEY (tenant_id, id));",
    "CREATE TABLE IF NOT EXISTS deletion_records (seq BIGSERIAL PRIMARY KEY, tenant_id TEXT NOT NULL, id TEXT NOT NULL, table_name TEXT NOT NULL, deleted_at_ms BIGINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS deletion_records_entity ON deletion_records(tenant_id, id, table_name);",
};

struct Statement {
  const char* name;
  const char* sql;
};

#define STOCKROOM_PG_PRODUCT_COLUMNS "tenant_id,id,sku,name,retail_price,cost_price,stock,low_stock_threshold,created_at_ms,updated_at_ms"
#define STOCKROOM_PG_SALE_COLUMNS \
  "tenant_id,id,public_ref,type,date_ms,total,cogs,profit,status,original_sale_id,original_sale_public_ref,cashier_id"
#define STOCKROOM_PG_PO_COLUMNS \
  "tenant_id,id,public_ref,supplier_id,supplier_name,date_created_ms,date_expected_ms,total_cost,notes,status"
#define STOCKROOM_PG_ADJUSTMENT_COLUMNS "tenant_id,id,product_id,variant_id,quantity,reason,source,source_id,created_at_ms"
#define STOCKROOM_PG_SHIFT_COLUMNS                                                                                                \
  "tenant_id,id,opened_by_id,opened_by_name,start_time_ms,start_float,cash_sales,cash_refunds,status,closed_by_id,closed_by_name," \
  "end_time_ms,expected_cash,actual_cash,difference,notes"

// Every statement takes tenant_id as $1; keyed rows take id as $2.
constexpr Statement kStatements[] = {
    // products
    {"product_insert",
     "INSERT INTO products(" STOCKROOM_PG_PRODUCT_COLUMNS ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)"},
    {"product_update",
     "UPDATE products SET sku=$3,name=$4,retail_price=$5,cost_price=$6,stock=$7,low_stock_threshold=$8,created_at_ms=$9,updated_at_ms=$10 "
     "WHERE tenant_id=$1 AND id=$2"},
    {"product_delete", "DELETE FROM products WHERE tenant_id=$1 AND id=$2"},
    {"product_owner", "SELECT tenant_id FROM products WHERE id=$1 LIMIT 1"},
    {"product_get", "SELECT " STOCKROOM_PG_PRODUCT_COLUMNS " FROM products WHERE tenant_id=$1 AND id=$2"},
    {"product_by_sku", "SELECT " STOCKROOM_PG_PRODUCT_COLUMNS " FROM products WHERE tenant_id=$1 AND sku=$2"},
    {"product_list", "SELECT " STOCKROOM_PG_PRODUCT_COLUMNS " FROM products WHERE tenant_id=$1 ORDER BY created_at_ms, id"},

    {"price_history_insert",
     "INSERT INTO price_history(tenant_id,product_id,owner_id,position,date_ms,price_type,old_value,new_value,actor_id,actor_name) "
     "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)"},
    {"price_history_load",
     "SELECT date_ms,price_type,old_value,new_value,actor_id,actor_name FROM price_history WHERE tenant_id=$1 AND owner_id=$2 ORDER BY position"},
    {"price_history_clear", "DELETE FROM price_history WHERE tenant_id=$1 AND product_id=$2"},

    {"variant_insert",
     "INSERT INTO product_variants(tenant_id,product_id,position,id,sku,stock,cost_price,retail_price) VALUES($1,$2,$3,$4,$5,$6,$7,$8)"},
    {"variant_load",
     "SELECT id,sku,stock,cost_price,retail_price FROM product_variants WHERE tenant_id=$1 AND product_id=$2 ORDER BY position"},
    {"variant_clear", "DELETE FROM product_variants WHERE tenant_id=$1 AND product_id=$2"},

    {"variant_option_insert", "INSERT INTO variant_options(tenant_id,product_id,variant_id,position,name,value) VALUES($1,$2,$3,$4,$5,$6)"},
    {"variant_option_load", "SELECT name,value FROM variant_options WHERE tenant_id=$1 AND variant_id=$2 ORDER BY position"},
    {"variant_option_clear", "DELETE FROM variant_options WHERE tenant_id=$1 AND product_id=$2"},

    {"product_category_insert", "INSERT INTO product_categories(tenant_id,product_id,position,category_id) VALUES($1,$2,$3,$4)"},
    {"product_category_load", "SELECT category_id FROM product_categories WHERE tenant_id=$1 AND product_id=$2 ORDER BY position"},
    {"product_category_clear", "DELETE FROM product_categories WHERE tenant_id=$1 AND product_id=$2"},

    // categories
    {"category_insert", "INSERT INTO categories(tenant_id,id,name,parent_id) VALUES($1,$2,$3,$4)"},
    {"category_list", "SELECT tenant_id,id,name,parent_id FROM categories WHERE tenant_id=$1 ORDER BY name, id"},

    // stock ledger
    {"adjustment_insert", "INSERT INTO stock_adjustments(" STOCKROOM_PG_ADJUSTMENT_COLUMNS ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)"},
    {"adjustment_list", "SELECT " STOCKROOM_PG_ADJUSTMENT_COLUMNS " FROM stock_adjustments WHERE tenant_id=$1 ORDER BY created_at_ms, id"},
    {"adjustment_list_product",
     "SELECT " STOCKROOM_PG_ADJUSTMENT_COLUMNS " FROM stock_adjustments WHERE tenant_id=$1 AND product_id=$2 ORDER BY created_at_ms, id"},
    {"adjustment_delete", "DELETE FROM stock_adjustments WHERE tenant_id=$1 AND id=$2"},

    // sales
    {"sale_insert", "INSERT INTO sales(" STOCKROOM_PG_SALE_COLUMNS ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12)"},
    {"sale_update",
     "UPDATE sales SET public_ref=$3,type=$4,date_ms=$5,total=$6,cogs=$7,profit=$8,status=$9,original_sale_id=$10,"
     "original_sale_public_ref=$11,cashier_id=$12 WHERE tenant_id=$1 AND id=$2"},
    {"sale_delete", "DELETE FROM sales WHERE tenant_id=$1 AND id=$2"},
    {"sale_owner", "SELECT tenant_id FROM sales WHERE id=$1 LIMIT 1"},
    {"sale_get", "SELECT " STOCKROOM_PG_SALE_COLUMNS " FROM sales WHERE tenant_id=$1 AND id=$2"},
    {"sale_by_ref", "SELECT " STOCKROOM_PG_SALE_COLUMNS " FROM sales WHERE tenant_id=$1 AND public_ref=$2"},
    {"sale_list", "SELECT " STOCKROOM_PG_SALE_COLUMNS " FROM sales WHERE tenant_id=$1 ORDER BY date_ms DESC, id DESC"},

    {"sale_item_insert",
     "INSERT INTO sale_items(tenant_id,sale_id,position,product_id,variant_id,name,sku,quantity,cost_price,retail_price,returned_quantity,"
     "original_sale_id) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12)"},
    {"sale_item_load",
     "SELECT product_id,variant_id,name,sku,quantity,cost_price,retail_price,returned_quantity,original_sale_id FROM sale_items "
     "WHERE tenant_id=$1 AND sale_id=$2 ORDER BY position"},
    {"sale_item_clear", "DELETE FROM sale_items WHERE tenant_id=$1 AND sale_id=$2"},

    {"sale_item_option_insert",
     "INSERT INTO sale_item_options(tenant_id,sale_id,item_position,position,name,value) VALUES($1,$2,$3,$4,$5,$6)"},
    {"sale_item_option_load",
     "SELECT item_position,name,value FROM sale_item_options WHERE tenant_id=$1 AND sale_id=$2 ORDER BY item_position, position"},
    {"sale_item_option_clear", "DELETE FROM sale_item_options WHERE tenant_id=$1 AND sale_id=$2"},

    {"sale_payment_insert", "INSERT INTO sale_payments(tenant_id,sale_id,position,type,amount) VALUES($1,$2,$3,$4,$5)"},
    {"sale_payment_load", "SELECT type,amount FROM sale_payments WHERE tenant_id=$1 AND sale_id=$2 ORDER BY position"},
    {"sale_payment_clear", "DELETE FROM sale_payments WHERE tenant_id=$1 AND sale_id=$2"},

    // purchase orders
    {"po_insert", "INSERT INTO purchase_orders(" STOCKROOM_PG_PO_COLUMNS ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)"},
    {"po_update",
     "UPDATE purchase_orders SET public_ref=$3,supplier_id=$4,supplier_name=$5,date_created_ms=$6,date_expected_ms=$7,total_cost=$8,notes=$9,"
     "status=$10 WHERE tenant_id=$1 AND id=$2"},
    {"po_delete", "DELETE FROM purchase_orders WHERE tenant_id=$1 AND id=$2"},
    {"po_owner", "SELECT tenant_id FROM purchase_orders WHERE id=$1 LIMIT 1"},
    {"po_get", "SELECT " STOCKROOM_PG_PO_COLUMNS " FROM purchase_orders WHERE tenant_id=$1 AND id=$2"},
    {"po_by_ref", "SELECT " STOCKROOM_PG_PO_COLUMNS " FROM purchase_orders WHERE tenant_id=$1 AND public_ref=$2"},
    {"po_list", "SELECT " STOCKROOM_PG_PO_COLUMNS " FROM purchase_orders WHERE tenant_id=$1 ORDER BY date_created_ms DESC, id DESC"},

    {"po_item_insert",
     "INSERT INTO purchase_order_items(tenant_id,po_id,position,product_id,variant_id,name,quantity_ordered,quantity_received,cost_price) "
     "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)"},
    {"po_item_load",
     "SELECT product_id,variant_id,name,quantity_ordered,quantity_received,cost_price FROM purchase_order_items "
     "WHERE tenant_id=$1 AND po_id=$2 ORDER BY position"},
    {"po_item_clear", "DELETE FROM purchase_order_items WHERE tenant_id=$1 AND po_id=$2"},

    // shifts
    {"shift_insert", "INSERT INTO shifts(" STOCKROOM_PG_SHIFT_COLUMNS ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16)"},
    {"shift_update",
     "UPDATE shifts SET opened_by_id=$3,opened_by_name=$4,start_time_ms=$5,start_float=$6,cash_sales=$7,cash_refunds=$8,status=$9,"
     "closed_by_id=$10,closed_by_name=$11,end_time_ms=$12,expected_cash=$13,actual_cash=$14,difference=$15,notes=$16 "
     "WHERE tenant_id=$1 AND id=$2"},
    {"shift_open",
     "SELECT " STOCKROOM_PG_SHIFT_COLUMNS " FROM shifts WHERE tenant_id=$1 AND status=$2 ORDER BY start_time_ms DESC, id DESC LIMIT 1"},
    {"shift_list", "SELECT " STOCKROOM_PG_SHIFT_COLUMNS " FROM shifts WHERE tenant_id=$1 ORDER BY start_time_ms DESC, id DESC"},

    // notifications
    {"notification_insert",
     "INSERT INTO notifications(tenant_id,id,timestamp_ms,category,message,is_read,related_id) VALUES($1,$2,$3,$4,$5,$6,$7)"},
    {"notification_update",
     "UPDATE notifications SET timestamp_ms=$3,category=$4,message=$5,is_read=$6,related_id=$7 WHERE tenant_id=$1 AND id=$2"},
    {"notification_delete", "DELETE FROM notifications WHERE tenant_id=$1 AND id=$2"},
    {"notification_list",
     "SELECT tenant_id,id,timestamp_ms,category,message,is_read,related_id FROM notifications WHERE tenant_id=$1 "
     "ORDER BY timestamp_ms DESC, id DESC"},

    // deletion records
    {"deletion_insert", "INSERT INTO deletion_records(tenant_id,id,table_name,deleted_at_ms) VALUES($1,$2,$3,$4)"},
    {"deletion_list",
     "SELECT tenant_id,id,table_name,deleted_at_ms FROM deletion_records WHERE tenant_id=$1 ORDER BY deleted_at_ms, seq"},
    {"deletion_delete", "DELETE FROM deletion_records WHERE tenant_id=$1 AND id=$2 AND table_name=$3"},
};

#undef STOCKROOM_PG_PRODUCT_COLUMNS
#undef STOCKROOM_PG_SALE_COLUMNS
#undef STOCKROOM_PG_PO_COLUMNS
#undef STOCKROOM_PG_ADJUSTMENT_COLUMNS
#undef STOCKROOM_PG_SHIFT_COLUMNS

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::EnsureSchema() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  for (const char* sql : kSchema) {
    tx.exec(sql);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  for (const auto& statement : kStatements) {
    conn.prepare(statement.name, statement.sql);
  }
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released) {
    if (auto self = weak_self.lock()) {
      self->Release(released);
      return;
    }
    delete released;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    // a connection dropped mid-transaction is closed instead of reused
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
      cv_.notify_one();
      return;
    }
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace stockroom::db::postgres
