#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/names.hpp"

namespace stockroom::db::sqlite {

using stockroom::db::ErrorCode;
using stockroom::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return nullptr;
  }
  return Stmt(st);
}

// Reads have no Result channel; a statement that fails to prepare is a
// schema bug and surfaces as an exception.
Stmt PrepareRead(sqlite3* db, const char* sql) {
  auto st = Prepare(db, sql);
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindText(sqlite3_stmt* st, int idx, std::string_view s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<std::int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
  BindI64(st, idx, util::ToUnixMillis(tp));
}

void BindOptTime(sqlite3_stmt* st, int idx, const std::optional<util::TimePoint>& tp) {
  if (tp) {
    BindTime(st, idx, *tp);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::optional<std::int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColI64(st, col);
}

util::TimePoint ColTime(sqlite3_stmt* st, int col) {
  return util::FromUnixMillis(ColI64(st, col));
}

std::optional<util::TimePoint> ColOptTime(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColTime(st, col);
}

Result Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result PrepareFailed(sqlite3* db) {
  return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
}

// Runs a fully bound write statement.
Result Run(sqlite3* db, Stmt& st) {
  return Translate(db, sqlite3_step(st.get()));
}

// Like Run, but an UPDATE that matched nothing is NotFound.
Result RunUpdate(sqlite3* db, Stmt& st, const std::string& id) {
  auto result = Run(db, st);
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, id);
  }
  return result;
}

Result DeleteById(sqlite3* db, const char* sql, const std::string& tenant_id, const std::string& id) {
  auto st = Prepare(db, sql);
  if (!st) return PrepareFailed(db);
  BindText(st.get(), 1, tenant_id);
  BindText(st.get(), 2, id);
  return Run(db, st);
}

// ------------------------------------------------------------------
// Product children
// ------------------------------------------------------------------

std::optional<std::string> OwnerOf(sqlite3* db, const char* sql, const std::string& id) {
  auto st = PrepareRead(db, sql);
  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ColText(st.get(), 0);
}

Result WritePriceHistory(sqlite3* db, const std::string& tenant_id, const std::string& product_id, const std::string& owner_id,
                         const std::vector<model::PriceHistoryEntry>& history) {
  const char* sql =
      "INSERT INTO price_history(tenant_id,product_id,owner_id,position,date_ms,price_type,old_value,new_value,actor_id,actor_name) "
      "VALUES(?,?,?,?,?,?,?,?,?,?);";

  for (std::size_t i = 0; i < history.size(); ++i) {
    const auto& entry = history[i];
    auto        st    = Prepare(db, sql);
    if (!st) return PrepareFailed(db);
    BindText(st.get(), 1, tenant_id);
    BindText(st.get(), 2, product_id);
    BindText(st.get(), 3, owner_id);
    BindI64(st.get(), 4, static_cast<std::int64_t>(i));
    BindTime(st.get(), 5, entry.date);
    BindText(st.get(), 6, model::ToString(entry.price_type));
    BindI64(st.get(), 7, entry.old_value);
    BindI64(st.get(), 8, entry.new_value);
    BindText(st.get(), 9, entry.actor_id);
    BindText(st.get(), 10, entry.actor_name);
    if (auto r = Run(db, st); !r) return r;
  }
  return Result::Ok();
}

Result WriteProductChildren(sqlite3* db, const model::Product& p) {
  if (auto r = WritePriceHistory(db, p.tenant_id, p.id, p.id, p.price_history); !r) return r;

  for (std::size_t i = 0; i < p.variants.size(); ++i) {
    const auto& variant = p.variants[i];

    auto st = Prepare(db,
                      "INSERT INTO product_variants(tenant_id,product_id,position,id,sku,stock,cost_price,retail_price) "
                      "VALUES(?,?,?,?,?,?,?,?);");
    if (!st) return PrepareFailed(db);
    BindText(st.get(), 1, p.tenant_id);
    BindText(st.get(), 2, p.id);
    BindI64(st.get(), 3, static_cast<std::int64_t>(i));
    BindText(st.get(), 4, variant.id);
    BindText(st.get(), 5, variant.sku);
    BindI64(st.get(), 6, variant.stock);
    BindI64(st.get(), 7, variant.cost_price);
    BindI64(st.get(), 8, variant.retail_price);
    if (auto r = Run(db, st); !r) return r;

    for (std::size_t j = 0; j < variant.options.size(); ++j) {
      auto opt = Prepare(db, "INSERT INTO variant_options(tenant_id,product_id,variant_id,position,name,value) VALUES(?,?,?,?,?,?);");
      if (!opt) return PrepareFailed(db);
      BindText(opt.get(), 1, p.tenant_id);
      BindText(opt.get(), 2, p.id);
      BindText(opt.get(), 3, variant.id);
      BindI64(opt.get(), 4, static_cast<std::int64_t>(j));
      BindText(opt.get(), 5, variant.options[j].name);
      BindText(opt.get(), 6, variant.options[j].value);
      if (auto r = Run(db, opt); !r) return r;
    }

    if (auto r = WritePriceHistory(db, p.tenant_id, p.id, variant.id, variant.price_history); !r) return r;
  }

  for (std::size_t i = 0; i < p.category_ids.size(); ++i) {
    auto st = Prepare(db, "INSERT INTO product_categories(tenant_id,product_id,position,category_id) VALUES(?,?,?,?);");
    if (!st) return PrepareFailed(db);
    BindText(st.get(), 1, p.tenant_id);
    BindText(st.get(), 2, p.id);
    BindI64(st.get(), 3, static_cast<std::int64_t>(i));
    BindText(st.get(), 4, p.category_ids[i]);
    if (auto r = Run(db, st); !r) return r;
  }
  return Result::Ok();
}

Result ClearProductChildren(sqlite3* db, const std::string& tenant_id, const std::string& product_id) {
  static constexpr const char* kStatements[] = {
      "DELETE FROM price_history WHERE tenant_id=? AND product_id=?;",
      "DELETE FROM variant_options WHERE tenant_id=? AND product_id=?;",
      "DELETE FROM product_variants WHERE tenant_id=? AND product_id=?;",
      "DELETE FROM product_categories WHERE tenant_id=? AND product_id=?;",
  };
  for (const char* sql : kStatements) {
    if (auto r = DeleteById(db, sql, tenant_id, product_id); !r) return r;
  }
  return Result::Ok();
}

std::vector<model::PriceHistoryEntry> LoadPriceHistory(sqlite3* db, const std::string& tenant_id, const std::string& owner_id) {
  auto st = PrepareRead(db,
                        "SELECT date_ms,price_type,old_value,new_value,actor_id,actor_name FROM price_history "
                        "WHERE tenant_id=? AND owner_id=? ORDER BY position;");
  BindText(st.get(), 1, tenant_id);
  BindText(st.get(), 2, owner_id);

  std::vector<model::PriceHistoryEntry> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::PriceHistoryEntry entry;
    entry.date       = ColTime(st.get(), 0);
    entry.price_type = model::ParsePriceType(ColText(st.get(), 1));
    entry.old_value  = ColI64(st.get(), 2);
    entry.new_value  = ColI64(st.get(), 3);
    entry.actor_id   = ColText(st.get(), 4);
    entry.actor_name = ColText(st.get(), 5);
    out.push_back(std::move(entry));
  }
  return out;
}

void LoadProductChildren(sqlite3* db, model::Product& p) {
  p.price_history = LoadPriceHistory(db, p.tenant_id, p.id);

  auto st = PrepareRead(db,
                        "SELECT id,sku,stock,cost_price,retail_price FROM product_variants "
                        "WHERE tenant_id=? AND product_id=? ORDER BY position;");
  BindText(st.get(), 1, p.tenant_id);
  BindText(st.get(), 2, p.id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::Variant variant;
    variant.id           = ColText(st.get(), 0);
    variant.sku          = ColText(st.get(), 1);
    variant.stock        = ColI64(st.get(), 2);
    variant.cost_price   = ColI64(st.get(), 3);
    variant.retail_price = ColI64(st.get(), 4);
    p.variants.push_back(std::move(variant));
  }

  for (auto& variant : p.variants) {
    auto opt = PrepareRead(db, "SELECT name,value FROM variant_options WHERE tenant_id=? AND variant_id=? ORDER BY position;");
    BindText(opt.get(), 1, p.tenant_id);
    BindText(opt.get(), 2, variant.id);
    while (sqlite3_step(opt.get()) == SQLITE_ROW) {
      variant.options.push_back({ColText(opt.get(), 0), ColText(opt.get(), 1)});
    }
    variant.price_history = LoadPriceHistory(db, p.tenant_id, variant.id);
  }

  auto cat = PrepareRead(db, "SELECT category_id FROM product_categories WHERE tenant_id=? AND product_id=? ORDER BY position;");
  BindText(cat.get(), 1, p.tenant_id);
  BindText(cat.get(), 2, p.id);
  while (sqlite3_step(cat.get()) == SQLITE_ROW) {
    p.category_ids.push_back(ColText(cat.get(), 0));
  }
}

constexpr const char* kProductColumns = "tenant_id,id,sku,name,retail_price,cost_price,stock,low_stock_threshold,created_at_ms,updated_at_ms";

model::Product ReadProductRow(sqlite3_stmt* st) {
  model::Product p;
  p.tenant_id           = ColText(st, 0);
  p.id                  = ColText(st, 1);
  p.sku                 = ColText(st, 2);
  p.name                = ColText(st, 3);
  p.retail_price        = ColI64(st, 4);
  p.cost_price          = ColI64(st, 5);
  p.stock               = ColI64(st, 6);
  p.low_stock_threshold = ColI64(st, 7);
  p.created_at          = ColTime(st, 8);
  p.updated_at          = ColTime(st, 9);
  return p;
}

std::vector<model::Product> QueryProducts(sqlite3* db, const std::string& where, const std::vector<std::string>& params) {
  const auto sql = std::string("SELECT ") + kProductColumns + " FROM products WHERE " + where + " ORDER BY created_at_ms, id;";
  auto       st  = PrepareRead(db, sql.c_str());
  for (std::size_t i = 0; i < params.size(); ++i) {
    BindText(st.get(), static_cast<int>(i + 1), params[i]);
  }

  std::vector<model::Product> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadProductRow(st.get()));
  }
  for (auto& p : out) {
    LoadProductChildren(db, p);
  }
  return out;
}

// ------------------------------------------------------------------
// Sale children
// ------------------------------------------------------------------

Result WriteSaleChildren(sqlite3* db, const model::Sale& s) {
  for (std::size_t i = 0; i < s.items.size(); ++i) {
    const auto& line = s.items[i];

    auto st = Prepare(db,
                      "INSERT INTO sale_items(tenant_id,sale_id,position,product_id,variant_id,name,sku,quantity,cost_price,retail_price,"
                      "returned_quantity,original_sale_id) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");
    if (!st) return PrepareFailed(db);
    BindText(st.get(), 1, s.tenant_id);
    BindText(st.get(), 2, s.id);
    BindI64(st.get(), 3, static_cast<std::int64_t>(i));
    BindText(st.get(), 4, line.product_id);
    BindOptText(st.get(), 5, line.variant_id);
    BindText(st.get(), 6, line.name);
    BindText(st.get(), 7, line.sku);
    BindI64(st.get(), 8, line.quantity);
    BindI64(st.get(), 9, line.cost_price);
    BindI64(st.get(), 10, line.retail_price);
    BindI64(st.get(), 11, line.returned_quantity);
    BindOptText(st.get(), 12, line.original_sale_id);
    if (auto r = Run(db, st); !r) return r;

    for (std::size_t j = 0; j < line.variant_options.size(); ++j) {
      auto opt = Prepare(db, "INSERT INTO sale_item_options(tenant_id,sale_id,item_position,position,name,value) VALUES(?,?,?,?,?,?);");
      if (!opt) return PrepareFailed(db);
      BindText(opt.get(), 1, s.tenant_id);
      BindText(opt.get(), 2, s.id);
      BindI64(opt.get(), 3, static_cast<std::int64_t>(i));
      BindI64(opt.get(), 4, static_cast<std::int64_t>(j));
      BindText(opt.get(), 5, line.variant_options[j].name);
      BindText(opt.get(), 6, line.variant_options[j].value);
      if (auto r = Run(db, opt); !r) return r;
    }
  }

  for (std::size_t i = 0; i < s.payments.size(); ++i) {
    auto st = Prepare(db, "INSERT INTO sale_payments(tenant_id,sale_id,position,type,amount) VALUES(?,?,?,?,?);");
    if (!st) return PrepareFailed(db);
    BindText(st.get(), 1, s.tenant_id);
    BindText(st.get(), 2, s.id);
    BindI64(st.get(), 3, static_cast<std::int64_t>(i));
    BindText(st.get(), 4, model::ToString(s.payments[i].type));
    BindI64(st.get(), 5, s.payments[i].amount);
    if (auto r = Run(db, st); !r) return r;
  }
  return Result::Ok();
}

Result ClearSaleChildren(sqlite3* db, const std::string& tenant_id, const std::string& sale_id) {
  static constexpr const char* kStatements[] = {
      "DELETE FROM sale_item_options WHERE tenant_id=? AND sale_id=?;",
      "DELETE FROM sale_items WHERE tenant_id=? AND sale_id=?;",
      "DELETE FROM sale_payments WHERE tenant_id=? AND sale_id=?;",
  };
  for (const char* sql : kStatements) {
    if (auto r = DeleteById(db, sql, tenant_id, sale_id); !r) return r;
  }
  return Result::Ok();
}

void LoadSaleChildren(sqlite3* db, model::Sale& s) {
  auto st = PrepareRead(db,
                        "SELECT product_id,variant_id,name,sku,quantity,cost_price,retail_price,returned_quantity,original_sale_id "
                        "FROM sale_items WHERE tenant_id=? AND sale_id=? ORDER BY position;");
  BindText(st.get(), 1, s.tenant_id);
  BindText(st.get(), 2, s.id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::SaleLine line;
    line.product_id        = ColText(st.get(), 0);
    line.variant_id        = ColOptText(st.get(), 1);
    line.name              = ColText(st.get(), 2);
    line.sku               = ColText(st.get(), 3);
    line.quantity          = ColI64(st.get(), 4);
    line.cost_price        = ColI64(st.get(), 5);
    line.retail_price      = ColI64(st.get(), 6);
    line.returned_quantity = ColI64(st.get(), 7);
    line.original_sale_id  = ColOptText(st.get(), 8);
    s.items.push_back(std::move(line));
  }

  auto opt = PrepareRead(db,
                         "SELECT item_position,name,value FROM sale_item_options WHERE tenant_id=? AND sale_id=? "
                         "ORDER BY item_position, position;");
  BindText(opt.get(), 1, s.tenant_id);
  BindText(opt.get(), 2, s.id);
  while (sqlite3_step(opt.get()) == SQLITE_ROW) {
    const auto position = static_cast<std::size_t>(ColI64(opt.get(), 0));
    if (position < s.items.size()) {
      s.items[position].variant_options.push_back({ColText(opt.get(), 1), ColText(opt.get(), 2)});
    }
  }

  auto pay = PrepareRead(db, "SELECT type,amount FROM sale_payments WHERE tenant_id=? AND sale_id=? ORDER BY position;");
  BindText(pay.get(), 1, s.tenant_id);
  BindText(pay.get(), 2, s.id);
  while (sqlite3_step(pay.get()) == SQLITE_ROW) {
    s.payments.push_back({model::ParsePaymentType(ColText(pay.get(), 0)), ColI64(pay.get(), 1)});
  }
}

constexpr const char* kSaleColumns =
    "tenant_id,id,public_ref,type,date_ms,total,cogs,profit,status,original_sale_id,original_sale_public_ref,cashier_id";

std::vector<model::Sale> QuerySales(sqlite3* db, const std::string& where, const std::vector<std::string>& params) {
  const auto sql = std::string("SELECT ") + kSaleColumns + " FROM sales WHERE " + where + " ORDER BY date_ms DESC, id DESC;";
  auto       st  = PrepareRead(db, sql.c_str());
  for (std::size_t i = 0; i < params.size(); ++i) {
    BindText(st.get(), static_cast<int>(i + 1), params[i]);
  }

  std::vector<model::Sale> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::Sale s;
    s.tenant_id                = ColText(st.get(), 0);
    s.id                       = ColText(st.get(), 1);
    s.public_ref               = ColText(st.get(), 2);
    s.type                     = model::ParseSaleType(ColText(st.get(), 3));
    s.date                     = ColTime(st.get(), 4);
    s.total                    = ColI64(st.get(), 5);
    s.cogs                     = ColI64(st.get(), 6);
    s.profit                   = ColI64(st.get(), 7);
    s.status                   = model::ParseSaleStatus(ColText(st.get(), 8));
    s.original_sale_id         = ColOptText(st.get(), 9);
    s.original_sale_public_ref = ColText(st.get(), 10);
    s.cashier_id               = ColText(st.get(), 11);
    out.push_back(std::move(s));
  }
  for (auto& s : out) {
    LoadSaleChildren(db, s);
  }
  return out;
}

// ------------------------------------------------------------------
// Purchase order children
// ------------------------------------------------------------------

Result WritePurchaseOrderItems(sqlite3* db, const model::PurchaseOrder& po) {
  for (std::size_t i = 0; i < po.items.size(); ++i) {
    const auto& line = po.items[i];
    auto        st   = Prepare(db,
                               "INSERT INTO purchase_order_items(tenant_id,po_id,position,product_id,variant_id,name,quantity_ordered,"
                                        "quantity_received,cost_price) VALUES(?,?,?,?,?,?,?,?,?);");
    if (!st) return PrepareFailed(db);
    BindText(st.get(), 1, po.tenant_id);
    BindText(st.get(), 2, po.id);
    BindI64(st.get(), 3, static_cast<std::int64_t>(i));
    BindText(st.get(), 4, line.product_id);
    BindOptText(st.get(), 5, line.variant_id);
    BindText(st.get(), 6, line.name);
    BindI64(st.get(), 7, line.quantity_ordered);
    BindI64(st.get(), 8, line.quantity_received);
    BindI64(st.get(), 9, line.cost_price);
    if (auto r = Run(db, st); !r) return r;
  }
  return Result::Ok();
}

constexpr const char* kPurchaseOrderColumns =
    "tenant_id,id,public_ref,supplier_id,supplier_name,date_created_ms,date_expected_ms,total_cost,notes,status";

std::vector<model::PurchaseOrder> QueryPurchaseOrders(sqlite3* db, const std::string& where, const std::vector<std::string>& params) {
  const auto sql =
      std::string("SELECT ") + kPurchaseOrderColumns + " FROM purchase_orders WHERE " + where + " ORDER BY date_created_ms DESC, id DESC;";
  auto st = PrepareRead(db, sql.c_str());
  for (std::size_t i = 0; i < params.size(); ++i) {
    BindText(st.get(), static_cast<int>(i + 1), params[i]);
  }

  std::vector<model::PurchaseOrder> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::PurchaseOrder po;
    po.tenant_id     = ColText(st.get(), 0);
    po.id            = ColText(st.get(), 1);
    po.public_ref    = ColText(st.get(), 2);
    po.supplier_id   = ColText(st.get(), 3);
    po.supplier_name = ColText(st.get(), 4);
    po.date_created  = ColTime(st.get(), 5);
    po.date_expected = ColOptTime(st.get(), 6);
    po.total_cost    = ColI64(st.get(), 7);
    po.notes         = ColText(st.get(), 8);
    po.status        = model::ParsePurchaseOrderStatus(ColText(st.get(), 9));
    out.push_back(std::move(po));
  }

  for (auto& po : out) {
    auto items = PrepareRead(db,
                             "SELECT product_id,variant_id,name,quantity_ordered,quantity_received,cost_price FROM purchase_order_items "
                             "WHERE tenant_id=? AND po_id=? ORDER BY position;");
    BindText(items.get(), 1, po.tenant_id);
    BindText(items.get(), 2, po.id);
    while (sqlite3_step(items.get()) == SQLITE_ROW) {
      model::PurchaseOrderLine line;
      line.product_id        = ColText(items.get(), 0);
      line.variant_id        = ColOptText(items.get(), 1);
      line.name              = ColText(items.get(), 2);
      line.quantity_ordered  = ColI64(items.get(), 3);
      line.quantity_received = ColI64(items.get(), 4);
      line.cost_price        = ColI64(items.get(), 5);
      po.items.push_back(std::move(line));
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Flat rows
// ------------------------------------------------------------------

constexpr const char* kAdjustmentColumns = "tenant_id,id,product_id,variant_id,quantity,reason,source,source_id,created_at_ms";

model::StockAdjustment ReadAdjustmentRow(sqlite3_stmt* st) {
  model::StockAdjustment a;
  a.tenant_id  = ColText(st, 0);
  a.id         = ColText(st, 1);
  a.product_id = ColText(st, 2);
  a.variant_id = ColOptText(st, 3);
  a.quantity   = ColI64(st, 4);
  a.reason     = ColText(st, 5);
  a.source     = model::ParseLedgerSource(ColText(st, 6));
  a.source_id  = ColText(st, 7);
  a.created_at = ColTime(st, 8);
  return a;
}

constexpr const char* kShiftColumns =
    "tenant_id,id,opened_by_id,opened_by_name,start_time_ms,start_float,cash_sales,cash_refunds,status,closed_by_id,closed_by_name,"
    "end_time_ms,expected_cash,actual_cash,difference,notes";

model::Shift ReadShiftRow(sqlite3_stmt* st) {
  model::Shift s;
  s.tenant_id      = ColText(st, 0);
  s.id             = ColText(st, 1);
  s.opened_by_id   = ColText(st, 2);
  s.opened_by_name = ColText(st, 3);
  s.start_time     = ColTime(st, 4);
  s.start_float    = ColI64(st, 5);
  s.cash_sales     = ColI64(st, 6);
  s.cash_refunds   = ColI64(st, 7);
  s.status         = model::ParseShiftStatus(ColText(st, 8));
  s.closed_by_id   = ColText(st, 9);
  s.closed_by_name = ColText(st, 10);
  s.end_time       = ColOptTime(st, 11);
  s.expected_cash  = ColOptI64(st, 12);
  s.actual_cash    = ColOptI64(st, 13);
  s.difference     = ColOptI64(st, 14);
  s.notes          = ColText(st, 15);
  return s;
}

void BindShiftBody(sqlite3_stmt* st, const model::Shift& s) {
  BindText(st, 1, s.opened_by_id);
  BindText(st, 2, s.opened_by_name);
  BindTime(st, 3, s.start_time);
  BindI64(st, 4, s.start_float);
  BindI64(st, 5, s.cash_sales);
  BindI64(st, 6, s.cash_refunds);
  BindText(st, 7, model::ToString(s.status));
  BindText(st, 8, s.closed_by_id);
  BindText(st, 9, s.closed_by_name);
  BindOptTime(st, 10, s.end_time);
  BindOptI64(st, 11, s.expected_cash);
  BindOptI64(st, 12, s.actual_cash);
  BindOptI64(st, 13, s.difference);
  BindText(st, 14, s.notes);
  BindText(st, 15, s.tenant_id);
  BindText(st, 16, s.id);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Products
// ------------------------------------------------------------------

Result SqliteRepository::InsertProduct(Transaction& t, const model::Product& p) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO products(retail_price,cost_price,stock,low_stock_threshold,sku,name,created_at_ms,updated_at_ms,tenant_id,id) "
                    "VALUES(?,?,?,?,?,?,?,?,?,?);");
  if (!st) return PrepareFailed(db);
  BindI64(st.get(), 1, p.retail_price);
  BindI64(st.get(), 2, p.cost_price);
  BindI64(st.get(), 3, p.stock);
  BindI64(st.get(), 4, p.low_stock_threshold);
  BindText(st.get(), 5, p.sku);
  BindText(st.get(), 6, p.name);
  BindTime(st.get(), 7, p.created_at);
  BindTime(st.get(), 8, p.updated_at);
  BindText(st.get(), 9, p.tenant_id);
  BindText(st.get(), 10, p.id);
  if (auto r = Run(db, st); !r) return r;

  return WriteProductChildren(db, p);
}

std::optional<model::Product> SqliteRepository::GetProduct(Transaction& t, const std::string& tenant_id, const std::string& id) {
  auto rows = QueryProducts(TX(t).Handle(), "tenant_id=? AND id=?", {tenant_id, id});
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::optional<model::Product> SqliteRepository::FindProductBySku(Transaction& t, const std::string& tenant_id, const std::string& sku) {
  auto rows = QueryProducts(TX(t).Handle(), "tenant_id=? AND sku=?", {tenant_id, sku});
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::vector<model::Product> SqliteRepository::ListProducts(Transaction& t, const std::string& tenant_id) {
  return QueryProducts(TX(t).Handle(), "tenant_id=?", {tenant_id});
}

Result SqliteRepository::UpdateProduct(Transaction& t, const model::Product& p) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE products SET retail_price=?,cost_price=?,stock=?,low_stock_threshold=?,sku=?,name=?,created_at_ms=?,updated_at_ms=? "
                    "WHERE tenant_id=? AND id=?;");
  if (!st) return PrepareFailed(db);
  BindI64(st.get(), 1, p.retail_price);
  BindI64(st.get(), 2, p.cost_price);
  BindI64(st.get(), 3, p.stock);
  BindI64(st.get(), 4, p.low_stock_threshold);
  BindText(st.get(), 5, p.sku);
  BindText(st.get(), 6, p.name);
  BindTime(st.get(), 7, p.created_at);
  BindTime(st.get(), 8, p.updated_at);
  BindText(st.get(), 9, p.tenant_id);
  BindText(st.get(), 10, p.id);
  if (auto r = RunUpdate(db, st, p.id); !r) return r;

  if (auto r = ClearProductChildren(db, p.tenant_id, p.id); !r) return r;
  return WriteProductChildren(db, p);
}

Result SqliteRepository::DeleteProduct(Transaction& t, const std::string& tenant_id, const std::string& id) {
  return DeleteById(TX(t).Handle(), "DELETE FROM products WHERE tenant_id=? AND id=?;", tenant_id, id);
}

std::optional<std::string> SqliteRepository::ProductTenant(Transaction& t, const std::string& id) {
  return OwnerOf(TX(t).Handle(), "SELECT tenant_id FROM products WHERE id=? LIMIT 1;", id);
}

// ------------------------------------------------------------------
// Categories
// ------------------------------------------------------------------

Result SqliteRepository::InsertCategory(Transaction& t, const model::Category& c) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO categories(tenant_id,id,name,parent_id) VALUES(?,?,?,?);");
  if (!st) return PrepareFailed(db);
  BindText(st.get(), 1, c.tenant_id);
  BindText(st.get(), 2, c.id);
  BindText(st.get(), 3, c.name);
  BindOptText(st.get(), 4, c.parent_id);
  return Run(db, st);
}

std::vector<model::Category> SqliteRepository::ListCategories(Transaction& t, const std::string& tenant_id) {
  auto st = PrepareRead(TX(t).Handle(), "SELECT tenant_id,id,name,parent_id FROM categories WHERE tenant_id=? ORDER BY name, id;");
  BindText(st.get(), 1, tenant_id);

  std::vector<model::Category> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::Category c;
    c.tenant_id = ColText(st.get(), 0);
    c.id        = ColText(st.get(), 1);
    c.name      = ColText(st.get(), 2);
    c.parent_id = ColOptText(st.get(), 3);
    out.push_back(std::move(c));
  }
  return out;
}

// ------------------------------------------------------------------
// Stock ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertAdjustment(Transaction& t, const model::StockAdjustment& a) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO stock_adjustments(tenant_id,id,product_id,variant_id,quantity,reason,source,source_id,created_at_ms) "
                      "VALUES(?,?,?,?,?,?,?,?,?);");
  if (!st) return PrepareFailed(db);
  BindText(st.get(), 1, a.tenant_id);
  BindText(st.get(), 2, a.id);
  BindText(st.get(), 3, a.product_id);
  BindOptText(st.get(), 4, a.variant_id);
  BindI64(st.get(), 5, a.quantity);
  BindText(st.get(), 6, a.reason);
  BindText(st.get(), 7, model::ToString(a.source));
  BindText(st.get(), 8, a.source_id);
  BindTime(st.get(), 9, a.created_at);
  return Run(db, st);
}

std::vector<model::StockAdjustment> SqliteRepository::ListAdjustments(Transaction& t, const std::string& tenant_id) {
  const auto sql = std::string("SELECT ") + kAdjustmentColumns + " FROM stock_adjustments WHERE tenant_id=? ORDER BY created_at_ms, id;";
  auto       st  = PrepareRead(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, tenant_id);

  std::vector<model::StockAdjustment> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadAdjustmentRow(st.get()));
  }
  return out;
}

std::vector<model::StockAdjustment> SqliteRepository::ListAdjustmentsForProduct(Transaction& t, const std::string& tenant_id,
                                                                               const std::string& product_id) {
  const auto sql =
      std::string("SELECT ") + kAdjustmentColumns + " FROM stock_adjustments WHERE tenant_id=? AND product_id=? ORDER BY created_at_ms, id;";
  auto st = PrepareRead(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, tenant_id);
  BindText(st.get(), 2, product_id);

  std::vector<model::StockAdjustment> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadAdjustmentRow(st.get()));
  }
  return out;
}

Result SqliteRepository::DeleteAdjustments(Transaction& t, const std::string& tenant_id, const std::vector<std::string>& ids) {
  auto* db = TX(t).Handle();
  for (const auto& id : ids) {
    if (auto r = DeleteById(db, "DELETE FROM stock_adjustments WHERE tenant_id=? AND id=?;", tenant_id, id); !r) return r;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sales
// ------------------------------------------------------------------

Result SqliteRepository::InsertSale(Transaction& t, const model::Sale& s) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO sales(public_ref,type,date_ms,total,cogs,profit,status,original_sale_id,original_sale_public_ref,cashier_id,"
                      "tenant_id,id) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!st) return PrepareFailed(db);
  BindText(st.get(), 1, s.public_ref);
  BindText(st.get(), 2, model::ToString(s.type));
  BindTime(st.get(), 3, s.date);
  BindI64(st.get(), 4, s.total);
  BindI64(st.get(), 5, s.cogs);
  BindI64(st.get(), 6, s.profit);
  BindText(st.get(), 7, model::ToString(s.status));
  BindOptText(st.get(), 8, s.original_sale_id);
  BindText(st.get(), 9, s.original_sale_public_ref);
  BindText(st.get(), 10, s.cashier_id);
  BindText(st.get(), 11, s.tenant_id);
  BindText(st.get(), 12, s.id);
  if (auto r = Run(db, st); !r) return r;

  return WriteSaleChildren(db, s);
}

std::optional<model::Sale> SqliteRepository::GetSale(Transaction& t, const std::string& tenant_id, const std::string& id) {
  auto rows = QuerySales(TX(t).Handle(), "tenant_id=? AND id=?", {tenant_id, id});
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::optional<model::Sale> SqliteRepository::FindSaleByPublicRef(Transaction& t, const std::string& tenant_id, const std::string& public_ref) {
  auto rows = QuerySales(TX(t).Handle(), "tenant_id=? AND public_ref=?", {tenant_id, public_ref});
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::vector<model::Sale> SqliteRepository::ListSales(Transaction& t, const std::string& tenant_id) {
  return QuerySales(TX(t).Handle(), "tenant_id=?", {tenant_id});
}

Result SqliteRepository::UpdateSale(Transaction& t, const model::Sale& s) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE sales SET public_ref=?,type=?,date_ms=?,total=?,cogs=?,profit=?,status=?,original_sale_id=?,"
                      "original_sale_public_ref=?,cashier_id=? WHERE tenant_id=? AND id=?;");
  if (!st) return PrepareFailed(db);
  BindText(st.get(), 1, s.public_ref);
  BindText(st.get(), 2, model::ToString(s.type));
  BindTime(st.get(), 3, s.date);
  BindI64(st.get(), 4, s.total);
  BindI64(st.get(), 5, s.cogs);
  BindI64(st.get(), 6, s.profit);
  BindText(st.get(), 7, model::ToString(s.status));
  BindOptText(st.get(), 8, s.original_sale_id);
  BindText(st.get(), 9, s.original_sale_public_ref);
  BindText(st.get(), 10, s.cashier_id);
  BindText(st.get(), 11, s.tenant_id);
  BindText(st.get(), 12, s.id);
  if (auto r = RunUpdate(db, st, s.id); !r) return r;

  if (auto r = ClearSaleChildren(db, s.tenant_id, s.id); !r) return r;
  return WriteSaleChildren(db, s);
}

Result SqliteRepository::DeleteSales(Transaction& t, const std::string& tenant_id, const std::vector<std::string>& ids) {
  auto* db = TX(t).Handle();
  for (const auto& id : ids) {
    if (auto r = DeleteById(db, "DELETE FROM sales WHERE tenant_id=? AND id=?;", tenant_id, id); !r) return r;
  }
  return Result::Ok();
}

std::optional<std::string> SqliteRepository::SaleTenant(Transaction& t, const std::string& id) {
  return OwnerOf(TX(t).Handle(), "SELECT tenant_id FROM sales WHERE id=? LIMIT 1;", id);
}

// ------------------------------------------------------------------
// Purchase orders
// ------------------------------------------------------------------

Result SqliteRepository::InsertPurchaseOrder(Transaction& t, const model::PurchaseOrder& po) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO purchase_orders(public_ref,supplier_id,supplier_name,date_created_ms,date_expected_ms,total_cost,notes,status,"
                      "tenant_id,id) VALUES(?,?,?,?,?,?,?,?,?,?);");
  if (!st) return PrepareFailed(db);
  BindText(st.get(), 1, po.public_ref);
  BindText(st.get(), 2, po.supplier_id);
  BindText(st.get(), 3, po.supplier_name);
  BindTime(st.get(), 4, po.date_created);
  BindOptTime(st.get(), 5, po.date_expected);
  BindI64(st.get(), 6, po.total_cost);
  BindText(st.get(), 7, po.notes);
  BindText(st.get(), 8, model::ToString(po.status));
  BindText(st.get(), 9, po.tenant_id);
  BindText(st.get(), 10, po.id);
  if (auto r = Run(db, st); !r) return r;

  return WritePurchaseOrderItems(db, po);
}

std::optional<model::PurchaseOrder> SqliteRepository::GetPurchaseOrder(Transaction& t, const std::string& tenant_id, const std::string& id) {
  auto rows = QueryPurchaseOrders(TX(t).Handle(), "tenant_id=? AND id=?", {tenant_id, id});
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::optional<model::PurchaseOrder> SqliteRepository::FindPurchaseOrderByPublicRef(Transaction& t, const std::string& tenant_id,
                                                                                    const std::string& public_ref) {
  auto rows = QueryPurchaseOrders(TX(t).Handle(), "tenant_id=? AND public_ref=?", {tenant_id, public_ref});
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::vector<model::PurchaseOrder> SqliteRepository::ListPurchaseOrders(Transaction& t, const std::string& tenant_id) {
  return QueryPurchaseOrders(TX(t).Handle(), "tenant_id=?", {tenant_id});
}

Result SqliteRepository::UpdatePurchaseOrder(Transaction& t, const model::PurchaseOrder& po) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE purchase_orders SET public_ref=?,supplier_id=?,supplier_name=?,date_created_ms=?,date_expected_ms=?,total_cost=?,"
                      "notes=?,status=? WHERE tenant_id=? AND id=?;");
  if (!st) return PrepareFailed(db);
  BindText(st.get(), 1, po.public_ref);
  BindText(st.get(), 2, po.supplier_id);
  BindText(st.get(), 3, po.supplier_name);
  BindTime(st.get(), 4, po.date_created);
  BindOptTime(st.get(), 5, po.date_expected);
  BindI64(st.get(), 6, po.total_cost);
  BindText(st.get(), 7, po.notes);
  BindText(st.get(), 8, model::ToString(po.status));
  BindText(st.get(), 9, po.tenant_id);
  BindText(st.get(), 10, po.id);
  if (auto r = RunUpdate(db, st, po.id); !r) return r;

  if (auto r = DeleteById(db, "DELETE FROM purchase_order_items WHERE tenant_id=? AND po_id=?;", po.tenant_id, po.id); !r) return r;
  return WritePurchaseOrderItems(db, po);
}

Result SqliteRepository::DeletePurchaseOrder(Transaction& t, const std::string& tenant_id, const std::string& id) {
  return DeleteById(TX(t).Handle(), "DELETE FROM purchase_orders WHERE tenant_id=? AND id=?;", tenant_id, id);
}

std::optional<std::string> SqliteRepository::PurchaseOrderTenant(Transaction& t, const std::string& id) {
  return OwnerOf(TX(t).Handle(), "SELECT tenant_id FROM purchase_orders WHERE id=? LIMIT 1;", id);
}

// ------------------------------------------------------------------
// Shifts
// ------------------------------------------------------------------

Result SqliteRepository::InsertShift(Transaction& t, const model::Shift& s) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO shifts(opened_by_id,opened_by_name,start_time_ms,start_float,cash_sales,cash_refunds,status,closed_by_id,"
                      "closed_by_name,end_time_ms,expected_cash,actual_cash,difference,notes,tenant_id,id) "
                      "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!st) return PrepareFailed(db);
  BindShiftBody(st.get(), s);
  return Run(db, st);
}

std::optional<model::Shift> SqliteRepository::FindOpenShift(Transaction& t, const std::string& tenant_id) {
  const auto sql =
      std::string("SELECT ") + kShiftColumns + " FROM shifts WHERE tenant_id=? AND status=? ORDER BY start_time_ms DESC, id DESC LIMIT 1;";
  auto st = PrepareRead(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, tenant_id);
  BindText(st.get(), 2, model::ToString(model::ShiftStatus::kOpen));
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadShiftRow(st.get());
}

std::vector<model::Shift> SqliteRepository::ListShifts(Transaction& t, const std::string& tenant_id) {
  const auto sql = std::string("SELECT ") + kShiftColumns + " FROM shifts WHERE tenant_id=? ORDER BY start_time_ms DESC, id DESC;";
  auto       st  = PrepareRead(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, tenant_id);

  std::vector<model::Shift> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadShiftRow(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateShift(Transaction& t, const model::Shift& s) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE shifts SET opened_by_id=?,opened_by_name=?,start_time_ms=?,start_float=?,cash_sales=?,cash_refunds=?,status=?,"
                      "closed_by_id=?,closed_by_name=?,end_time_ms=?,expected_cash=?,actual_cash=?,difference=?,notes=? "
                      "WHERE tenant_id=? AND id=?;");
  if (!st) return PrepareFailed(db);
  BindShiftBody(st.get(), s);
  return RunUpdate(db, st, s.id);
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

Result SqliteRepository::InsertNotification(Transaction& t, const model::Notification& n) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO notifications(timestamp_ms,category,message,is_read,related_id,tenant_id,id) VALUES(?,?,?,?,?,?,?);");
  if (!st) return PrepareFailed(db);
  BindTime(st.get(), 1, n.timestamp);
  BindText(st.get(), 2, model::ToString(n.category));
  BindText(st.get(), 3, n.message);
  BindI64(st.get(), 4, n.is_read ? 1 : 0);
  BindText(st.get(), 5, n.related_id);
  BindText(st.get(), 6, n.tenant_id);
  BindText(st.get(), 7, n.id);
  return Run(db, st);
}

std::vector<model::Notification> SqliteRepository::ListNotifications(Transaction& t, const std::string& tenant_id) {
  auto st = PrepareRead(TX(t).Handle(),
                        "SELECT tenant_id,id,timestamp_ms,category,message,is_read,related_id FROM notifications WHERE tenant_id=? "
                        "ORDER BY timestamp_ms DESC, id DESC;");
  BindText(st.get(), 1, tenant_id);

  std::vector<model::Notification> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::Notification n;
    n.tenant_id  = ColText(st.get(), 0);
    n.id         = ColText(st.get(), 1);
    n.timestamp  = ColTime(st.get(), 2);
    n.category   = model::ParseNotificationCategory(ColText(st.get(), 3));
    n.message    = ColText(st.get(), 4);
    n.is_read    = ColI64(st.get(), 5) != 0;
    n.related_id = ColText(st.get(), 6);
    out.push_back(std::move(n));
  }
  return out;
}

Result SqliteRepository::UpdateNotification(Transaction& t, const model::Notification& n) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE notifications SET timestamp_ms=?,category=?,message=?,is_read=?,related_id=? WHERE tenant_id=? AND id=?;");
  if (!st) return PrepareFailed(db);
  BindTime(st.get(), 1, n.timestamp);
  BindText(st.get(), 2, model::ToString(n.category));
  BindText(st.get(), 3, n.message);
  BindI64(st.get(), 4, n.is_read ? 1 : 0);
  BindText(st.get(), 5, n.related_id);
  BindText(st.get(), 6, n.tenant_id);
  BindText(st.get(), 7, n.id);
  return RunUpdate(db, st, n.id);
}

Result SqliteRepository::DeleteNotifications(Transaction& t, const std::string& tenant_id, const std::vector<std::string>& ids) {
  auto* db = TX(t).Handle();
  for (const auto& id : ids) {
    if (auto r = DeleteById(db, "DELETE FROM notifications WHERE tenant_id=? AND id=?;", tenant_id, id); !r) return r;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Deletion records
// ------------------------------------------------------------------

Result SqliteRepository::InsertDeletionRecord(Transaction& t, const model::DeletionRecord& d) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO deletion_records(tenant_id,id,table_name,deleted_at_ms) VALUES(?,?,?,?);");
  if (!st) return PrepareFailed(db);
  BindText(st.get(), 1, d.tenant_id);
  BindText(st.get(), 2, d.id);
  BindText(st.get(), 3, d.table);
  BindTime(st.get(), 4, d.deleted_at);
  return Run(db, st);
}

std::vector<model::DeletionRecord> SqliteRepository::ListDeletionRecords(Transaction& t, const std::string& tenant_id) {
  auto st = PrepareRead(TX(t).Handle(),
                        "SELECT tenant_id,id,table_name,deleted_at_ms FROM deletion_records WHERE tenant_id=? ORDER BY deleted_at_ms, rowid;");
  BindText(st.get(), 1, tenant_id);

  std::vector<model::DeletionRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::DeletionRecord d;
    d.tenant_id  = ColText(st.get(), 0);
    d.id         = ColText(st.get(), 1);
    d.table      = ColText(st.get(), 2);
    d.deleted_at = ColTime(st.get(), 3);
    out.push_back(std::move(d));
  }
  return out;
}

Result SqliteRepository::DeleteDeletionRecord(Transaction& t, const std::string& tenant_id, const std::string& id, const std::string& table) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM deletion_records WHERE tenant_id=? AND id=? AND table_name=?;");
  if (!st) return PrepareFailed(db);
  BindText(st.get(), 1, tenant_id);
  BindText(st.get(), 2, id);
  BindText(st.get(), 3, table);
  return Run(db, st);
}

} // namespace stockroom::db::sqlite
