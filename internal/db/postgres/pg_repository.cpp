#include "pg_repository.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/names.hpp"
#include "internal/util/errors.hpp"

namespace stockroom::db::postgres {

using stockroom::db::ErrorCode;
using stockroom::db::Result;

namespace {

std::int64_t Millis(util::TimePoint tp) {
  return util::ToUnixMillis(tp);
}

std::optional<std::int64_t> OptMillis(const std::optional<util::TimePoint>& tp) {
  if (!tp) return std::nullopt;
  return util::ToUnixMillis(*tp);
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string{} : f.as<std::string>();
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<std::string>();
}

std::int64_t I64(const pqxx::field& f) {
  return f.as<std::int64_t>();
}

std::optional<std::int64_t> OptI64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<std::int64_t>();
}

util::TimePoint Time(const pqxx::field& f) {
  return util::FromUnixMillis(I64(f));
}

std::optional<util::TimePoint> OptTime(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return Time(f);
}

// Runs a write and folds libpqxx exceptions into a Result. Postgres names
// primary keys <table>_pkey, which separates a duplicate row from a
// duplicate sku or public_ref.
template <typename Fn>
Result Write(Fn&& fn) {
  try {
    fn();
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    const std::string message = e.what();
    if (message.find("_pkey") != std::string::npos) {
      return Result::Err(ErrorCode::AlreadyExists, message);
    }
    return Result::Err(ErrorCode::ConstraintViolation, message);
  } catch (const pqxx::integrity_constraint_violation& e) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  } catch (const pqxx::transaction_rollback& e) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  } catch (const pqxx::broken_connection& e) {
    return Result::Err(ErrorCode::IOError, e.what());
  } catch (const pqxx::sql_error& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

// Like Write, but an UPDATE that matched nothing is NotFound.
template <typename Fn>
Result WriteUpdate(const std::string& id, Fn&& fn) {
  pqxx::result::size_type affected = 0;
  auto                    result   = Write([&] { affected = fn().affected_rows(); });
  if (result && affected == 0) {
    return Result::Err(ErrorCode::NotFound, id);
  }
  return result;
}

template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::transaction_rollback& e) {
    throw util::Conflict(std::string("transaction conflict: ") + e.what());
  }
}

std::optional<std::string> Owner(Work& tx, const char* statement, const std::string& id) {
  return Read([&]() -> std::optional<std::string> {
    const auto rows = tx.exec_prepared(statement, id);
    if (rows.empty()) return std::nullopt;
    return Text(rows[0][0]);
  });
}

// ------------------------------------------------------------------
// Product children
// ------------------------------------------------------------------

void WritePriceHistory(Work& tx, const std::string& tenant_id, const std::string& product_id, const std::string& owner_id,
                       const std::vector<model::PriceHistoryEntry>& history) {
  for (std::size_t i = 0; i < history.size(); ++i) {
    const auto& entry = history[i];
    tx.exec_prepared("price_history_insert", tenant_id, product_id, owner_id, static_cast<int>(i), Millis(entry.date),
                     std::string(model::ToString(entry.price_type)), entry.old_value, entry.new_value, entry.actor_id, entry.actor_name);
  }
}

void WriteProductChildren(Work& tx, const model::Product& p) {
  WritePriceHistory(tx, p.tenant_id, p.id, p.id, p.price_history);

  for (std::size_t i = 0; i < p.variants.size(); ++i) {
    const auto& variant = p.variants[i];
    tx.exec_prepared("variant_insert", p.tenant_id, p.id, static_cast<int>(i), variant.id, variant.sku, variant.stock, variant.cost_price,
                     variant.retail_price);

    for (std::size_t j = 0; j < variant.options.size(); ++j) {
      tx.exec_prepared("variant_option_insert", p.tenant_id, p.id, variant.id, static_cast<int>(j), variant.options[j].name,
                       variant.options[j].value);
    }
    WritePriceHistory(tx, p.tenant_id, p.id, variant.id, variant.price_history);
  }

  for (std::size_t i = 0; i < p.category_ids.size(); ++i) {
    tx.exec_prepared("product_category_insert", p.tenant_id, p.id, static_cast<int>(i), p.category_ids[i]);
  }
}

void ClearProductChildren(Work& tx, const std::string& tenant_id, const std::string& product_id) {
  for (const char* name : {"price_history_clear", "variant_option_clear", "variant_clear", "product_category_clear"}) {
    tx.exec_prepared(name, tenant_id, product_id);
  }
}

std::vector<model::PriceHistoryEntry> LoadPriceHistory(Work& tx, const std::string& tenant_id, const std::string& owner_id) {
  std::vector<model::PriceHistoryEntry> out;
  for (const auto& row : tx.exec_prepared("price_history_load", tenant_id, owner_id)) {
    model::PriceHistoryEntry entry;
    entry.date       = Time(row[0]);
    entry.price_type = model::ParsePriceType(Text(row[1]));
    entry.old_value  = I64(row[2]);
    entry.new_value  = I64(row[3]);
    entry.actor_id   = Text(row[4]);
    entry.actor_name = Text(row[5]);
    out.push_back(std::move(entry));
  }
  return out;
}

std::vector<model::Product> LoadProducts(Work& tx, const pqxx::result& rows) {
  std::vector<model::Product> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    model::Product p;
    p.tenant_id           = Text(row[0]);
    p.id                  = Text(row[1]);
    p.sku                 = Text(row[2]);
    p.name                = Text(row[3]);
    p.retail_price        = I64(row[4]);
    p.cost_price          = I64(row[5]);
    p.stock               = I64(row[6]);
    p.low_stock_threshold = I64(row[7]);
    p.created_at          = Time(row[8]);
    p.updated_at          = Time(row[9]);
    out.push_back(std::move(p));
  }

  for (auto& p : out) {
    p.price_history = LoadPriceHistory(tx, p.tenant_id, p.id);

    for (const auto& row : tx.exec_prepared("variant_load", p.tenant_id, p.id)) {
      model::Variant variant;
      variant.id           = Text(row[0]);
      variant.sku          = Text(row[1]);
      variant.stock        = I64(row[2]);
      variant.cost_price   = I64(row[3]);
      variant.retail_price = I64(row[4]);
      p.variants.push_back(std::move(variant));
    }
    for (auto& variant : p.variants) {
      for (const auto& row : tx.exec_prepared("variant_option_load", p.tenant_id, variant.id)) {
        variant.options.push_back({Text(row[0]), Text(row[1])});
      }
      variant.price_history = LoadPriceHistory(tx, p.tenant_id, variant.id);
    }

    for (const auto& row : tx.exec_prepared("product_category_load", p.tenant_id, p.id)) {
      p.category_ids.push_back(Text(row[0]));
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Sale children
// ------------------------------------------------------------------

void WriteSaleChildren(Work& tx, const model::Sale& s) {
  for (std::size_t i = 0; i < s.items.size(); ++i) {
    const auto& line = s.items[i];
    tx.exec_prepared("sale_item_insert", s.tenant_id, s.id, static_cast<int>(i), line.product_id, line.variant_id, line.name, line.sku,
                     line.quantity, line.cost_price, line.retail_price, line.returned_quantity, line.original_sale_id);

    for (std::size_t j = 0; j < line.variant_options.size(); ++j) {
      tx.exec_prepared("sale_item_option_insert", s.tenant_id, s.id, static_cast<int>(i), static_cast<int>(j), line.variant_options[j].name,
                       line.variant_options[j].value);
    }
  }

  for (std::size_t i = 0; i < s.payments.size(); ++i) {
    tx.exec_prepared("sale_payment_insert", s.tenant_id, s.id, static_cast<int>(i), std::string(model::ToString(s.payments[i].type)),
                     s.payments[i].amount);
  }
}

void ClearSaleChildren(Work& tx, const std::string& tenant_id, const std::string& sale_id) {
  for (const char* name : {"sale_item_option_clear", "sale_item_clear", "sale_payment_clear"}) {
    tx.exec_prepared(name, tenant_id, sale_id);
  }
}

std::vector<model::Sale> LoadSales(Work& tx, const pqxx::result& rows) {
  std::vector<model::Sale> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    model::Sale s;
    s.tenant_id                = Text(row[0]);
    s.id                       = Text(row[1]);
    s.public_ref               = Text(row[2]);
    s.type                     = model::ParseSaleType(Text(row[3]));
    s.date                     = Time(row[4]);
    s.total                    = I64(row[5]);
    s.cogs                     = I64(row[6]);
    s.profit                   = I64(row[7]);
    s.status                   = model::ParseSaleStatus(Text(row[8]));
    s.original_sale_id         = OptText(row[9]);
    s.original_sale_public_ref = Text(row[10]);
    s.cashier_id               = Text(row[11]);
    out.push_back(std::move(s));
  }

  for (auto& s : out) {
    for (const auto& row : tx.exec_prepared("sale_item_load", s.tenant_id, s.id)) {
      model::SaleLine line;
      line.product_id        = Text(row[0]);
      line.variant_id        = OptText(row[1]);
      line.name              = Text(row[2]);
      line.sku               = Text(row[3]);
      line.quantity          = I64(row[4]);
      line.cost_price        = I64(row[5]);
      line.retail_price      = I64(row[6]);
      line.returned_quantity = I64(row[7]);
      line.original_sale_id  = OptText(row[8]);
      s.items.push_back(std::move(line));
    }
    for (const auto& row : tx.exec_prepared("sale_item_option_load", s.tenant_id, s.id)) {
      const auto position = static_cast<std::size_t>(I64(row[0]));
      if (position < s.items.size()) {
        s.items[position].variant_options.push_back({Text(row[1]), Text(row[2])});
      }
    }
    for (const auto& row : tx.exec_prepared("sale_payment_load", s.tenant_id, s.id)) {
      s.payments.push_back({model::ParsePaymentType(Text(row[0])), I64(row[1])});
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Purchase order children
// ------------------------------------------------------------------

void WritePurchaseOrderItems(Work& tx, const model::PurchaseOrder& po) {
  for (std::size_t i = 0; i < po.items.size(); ++i) {
    const auto& line = po.items[i];
    tx.exec_prepared("po_item_insert", po.tenant_id, po.id, static_cast<int>(i), line.product_id, line.variant_id, line.name,
                     line.quantity_ordered, line.quantity_received, line.cost_price);
  }
}

std::vector<model::PurchaseOrder> LoadPurchaseOrders(Work& tx, const pqxx::result& rows) {
  std::vector<model::PurchaseOrder> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    model::PurchaseOrder po;
    po.tenant_id     = Text(row[0]);
    po.id            = Text(row[1]);
    po.public_ref    = Text(row[2]);
    po.supplier_id   = Text(row[3]);
    po.supplier_name = Text(row[4]);
    po.date_created  = Time(row[5]);
    po.date_expected = OptTime(row[6]);
    po.total_cost    = I64(row[7]);
    po.notes         = Text(row[8]);
    po.status        = model::ParsePurchaseOrderStatus(Text(row[9]));
    out.push_back(std::move(po));
  }

  for (auto& po : out) {
    for (const auto& row : tx.exec_prepared("po_item_load", po.tenant_id, po.id)) {
      model::PurchaseOrderLine line;
      line.product_id        = Text(row[0]);
      line.variant_id        = OptText(row[1]);
      line.name              = Text(row[2]);
      line.quantity_ordered  = I64(row[3]);
      line.quantity_received = I64(row[4]);
      line.cost_price        = I64(row[5]);
      po.items.push_back(std::move(line));
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Flat rows
// ------------------------------------------------------------------

std::vector<model::StockAdjustment> LoadAdjustments(const pqxx::result& rows) {
  std::vector<model::StockAdjustment> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    model::StockAdjustment a;
    a.tenant_id  = Text(row[0]);
    a.id         = Text(row[1]);
    a.product_id = Text(row[2]);
    a.variant_id = OptText(row[3]);
    a.quantity   = I64(row[4]);
    a.reason     = Text(row[5]);
    a.source     = model::ParseLedgerSource(Text(row[6]));
    a.source_id  = Text(row[7]);
    a.created_at = Time(row[8]);
    out.push_back(std::move(a));
  }
  return out;
}

std::vector<model::Shift> LoadShifts(const pqxx::result& rows) {
  std::vector<model::Shift> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    model::Shift s;
    s.tenant_id      = Text(row[0]);
    s.id             = Text(row[1]);
    s.opened_by_id   = Text(row[2]);
    s.opened_by_name = Text(row[3]);
    s.start_time     = Time(row[4]);
    s.start_float    = I64(row[5]);
    s.cash_sales     = I64(row[6]);
    s.cash_refunds   = I64(row[7]);
    s.status         = model::ParseShiftStatus(Text(row[8]));
    s.closed_by_id   = Text(row[9]);
    s.closed_by_name = Text(row[10]);
    s.end_time       = OptTime(row[11]);
    s.expected_cash  = OptI64(row[12]);
    s.actual_cash    = OptI64(row[13]);
    s.difference     = OptI64(row[14]);
    s.notes          = Text(row[15]);
    out.push_back(std::move(s));
  }
  return out;
}

pqxx::result ExecShift(Work& tx, const char* statement, const model::Shift& s) {
  return tx.exec_prepared(statement, s.tenant_id, s.id, s.opened_by_id, s.opened_by_name, Millis(s.start_time), s.start_float, s.cash_sales,
                          s.cash_refunds, std::string(model::ToString(s.status)), s.closed_by_id, s.closed_by_name, OptMillis(s.end_time),
                          s.expected_cash, s.actual_cash, s.difference, s.notes);
}

template <typename T>
std::optional<T> First(std::vector<T> rows) {
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

// ------------------------------------------------------------------
// Products
// ------------------------------------------------------------------

Result PgRepository::InsertProduct(Transaction& t, const model::Product& p) {
  auto& tx = TX(t).Tx();
  return Write([&] {
    tx.exec_prepared("product_insert", p.tenant_id, p.id, p.sku, p.name, p.retail_price, p.cost_price, p.stock, p.low_stock_threshold,
                     Millis(p.created_at), Millis(p.updated_at));
    WriteProductChildren(tx, p);
  });
}

std::optional<model::Product> PgRepository::GetProduct(Transaction& t, const std::string& tenant_id, const std::string& id) {
  auto& tx = TX(t).Tx();
  return Read([&] { return First(LoadProducts(tx, tx.exec_prepared("product_get", tenant_id, id))); });
}

std::optional<model::Product> PgRepository::FindProductBySku(Transaction& t, const std::string& tenant_id, const std::string& sku) {
  auto& tx = TX(t).Tx();
  return Read([&] { return First(LoadProducts(tx, tx.exec_prepared("product_by_sku", tenant_id, sku))); });
}

std::vector<model::Product> PgRepository::ListProducts(Transaction& t, const std::string& tenant_id) {
  auto& tx = TX(t).Tx();
  return Read([&] { return LoadProducts(tx, tx.exec_prepared("product_list", tenant_id)); });
}

Result PgRepository::UpdateProduct(Transaction& t, const model::Product& p) {
  auto& tx = TX(t).Tx();
  auto  r  = WriteUpdate(p.id, [&] {
    return tx.exec_prepared("product_update", p.tenant_id, p.id, p.sku, p.name, p.retail_price, p.cost_price, p.stock,
                              p.low_stock_threshold, Millis(p.created_at), Millis(p.updated_at));
  });
  if (!r) return r;

  return Write([&] {
    ClearProductChildren(tx, p.tenant_id, p.id);
    WriteProductChildren(tx, p);
  });
}

Result PgRepository::DeleteProduct(Transaction& t, const std::string& tenant_id, const std::string& id) {
  auto& tx = TX(t).Tx();
  return Write([&] { tx.exec_prepared("product_delete", tenant_id, id); });
}

std::optional<std::string> PgRepository::ProductTenant(Transaction& t, const std::string& id) {
  return Owner(TX(t).Tx(), "product_owner", id);
}

// ------------------------------------------------------------------
// Categories
// ------------------------------------------------------------------

Result PgRepository::InsertCategory(Transaction& t, const model::Category& c) {
  auto& tx = TX(t).Tx();
  return Write([&] { tx.exec_prepared("category_insert", c.tenant_id, c.id, c.name, c.parent_id); });
}

std::vector<model::Category> PgRepository::ListCategories(Transaction& t, const std::string& tenant_id) {
  auto& tx = TX(t).Tx();
  return Read([&] {
    std::vector<model::Category> out;
    for (const auto& row : tx.exec_prepared("category_list", tenant_id)) {
      model::Category c;
      c.tenant_id = Text(row[0]);
      c.id        = Text(row[1]);
      c.name      = Text(row[2]);
      c.parent_id = OptText(row[3]);
      out.push_back(std::move(c));
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Stock ledger
// ------------------------------------------------------------------

Result PgRepository::InsertAdjustment(Transaction& t, const model::StockAdjustment& a) {
  auto& tx = TX(t).Tx();
  return Write([&] {
    tx.exec_prepared("adjustment_insert", a.tenant_id, a.id, a.product_id, a.variant_id, a.quantity, a.reason,
                     std::string(model::ToString(a.source)), a.source_id, Millis(a.created_at));
  });
}

std::vector<model::StockAdjustment> PgRepository::ListAdjustments(Transaction& t, const std::string& tenant_id) {
  auto& tx = TX(t).Tx();
  return Read([&] { return LoadAdjustments(tx.exec_prepared("adjustment_list", tenant_id)); });
}

std::vector<model::StockAdjustment> PgRepository::ListAdjustmentsForProduct(Transaction& t, const std::string& tenant_id,
                                                                           const std::string& product_id) {
  auto& tx = TX(t).Tx();
  return Read([&] { return LoadAdjustments(tx.exec_prepared("adjustment_list_product", tenant_id, product_id)); });
}

Result PgRepository::DeleteAdjustments(Transaction& t, const std::string& tenant_id, const std::vector<std::string>& ids) {
  auto& tx = TX(t).Tx();
  return Write([&] {
    for (const auto& id : ids) {
      tx.exec_prepared("adjustment_delete", tenant_id, id);
    }
  });
}

// ------------------------------------------------------------------
// Sales
// ------------------------------------------------------------------

Result PgRepository::InsertSale(Transaction& t, const model::Sale& s) {
  auto& tx = TX(t).Tx();
  return Write([&] {
    tx.exec_prepared("sale_insert", s.tenant_id, s.id, s.public_ref, std::string(model::ToString(s.type)), Millis(s.date), s.total, s.cogs,
                     s.profit, std::string(model::ToString(s.status)), s.original_sale_id, s.original_sale_public_ref, s.cashier_id);
    WriteSaleChildren(tx, s);
  });
}

std::optional<model::Sale> PgRepository::GetSale(Transaction& t, const std::string& tenant_id, const std::string& id) {
  auto& tx = TX(t).Tx();
  return Read([&] { return First(LoadSales(tx, tx.exec_prepared("sale_get", tenant_id, id))); });
}

std::optional<model::Sale> PgRepository::FindSaleByPublicRef(Transaction& t, const std::string& tenant_id, const std::string& public_ref) {
  auto& tx = TX(t).Tx();
  return Read([&] { return First(LoadSales(tx, tx.exec_prepared("sale_by_ref", tenant_id, public_ref))); });
}

std::vector<model::Sale> PgRepository::ListSales(Transaction& t, const std::string& tenant_id) {
  auto& tx = TX(t).Tx();
  return Read([&] { return LoadSales(tx, tx.exec_prepared("sale_list", tenant_id)); });
}

Result PgRepository::UpdateSale(Transaction& t, const model::Sale& s) {
  auto& tx = TX(t).Tx();
  auto  r  = WriteUpdate(s.id, [&] {
    return tx.exec_prepared("sale_update", s.tenant_id, s.id, s.public_ref, std::string(model::ToString(s.type)), Millis(s.date), s.total,
                              s.cogs, s.profit, std::string(model::ToString(s.status)), s.original_sale_id, s.original_sale_public_ref,
                              s.cashier_id);
  });
  if (!r) return r;

  return Write([&] {
    ClearSaleChildren(tx, s.tenant_id, s.id);
    WriteSaleChildren(tx, s);
  });
}

Result PgRepository::DeleteSales(Transaction& t, const std::string& tenant_id, const std::vector<std::string>& ids) {
  auto& tx = TX(t).Tx();
  return Write([&] {
    for (const auto& id : ids) {
      tx.exec_prepared("sale_delete", tenant_id, id);
    }
  });
}

std::optional<std::string> PgRepository::SaleTenant(Transaction& t, const std::string& id) {
  return Owner(TX(t).Tx(), "sale_owner", id);
}

// ------------------------------------------------------------------
// Purchase orders
// ------------------------------------------------------------------

Result PgRepository::InsertPurchaseOrder(Transaction& t, const model::PurchaseOrder& po) {
  auto& tx = TX(t).Tx();
  return Write([&] {
    tx.exec_prepared("po_insert", po.tenant_id, po.id, po.public_ref, po.supplier_id, po.supplier_name, Millis(po.date_created),
                     OptMillis(po.date_expected), po.total_cost, po.notes, std::string(model::ToString(po.status)));
    WritePurchaseOrderItems(tx, po);
  });
}

std::optional<model::PurchaseOrder> PgRepository::GetPurchaseOrder(Transaction& t, const std::string& tenant_id, const std::string& id) {
  auto& tx = TX(t).Tx();
  return Read([&] { return First(LoadPurchaseOrders(tx, tx.exec_prepared("po_get", tenant_id, id))); });
}

std::optional<model::PurchaseOrder> PgRepository::FindPurchaseOrderByPublicRef(Transaction& t, const std::string& tenant_id,
                                                                                const std::string& public_ref) {
  auto& tx = TX(t).Tx();
  return Read([&] { return First(LoadPurchaseOrders(tx, tx.exec_prepared("po_by_ref", tenant_id, public_ref))); });
}

std::vector<model::PurchaseOrder> PgRepository::ListPurchaseOrders(Transaction& t, const std::string& tenant_id) {
  auto& tx = TX(t).Tx();
  return Read([&] { return LoadPurchaseOrders(tx, tx.exec_prepared("po_list", tenant_id)); });
}

Result PgRepository::UpdatePurchaseOrder(Transaction& t, const model::PurchaseOrder& po) {
  auto& tx = TX(t).Tx();
  auto  r  = WriteUpdate(po.id, [&] {
    return tx.exec_prepared("po_update", po.tenant_id, po.id, po.public_ref, po.supplier_id, po.supplier_name, Millis(po.date_created),
                              OptMillis(po.date_expected), po.total_cost, po.notes, std::string(model::ToString(po.status)));
  });
  if (!r) return r;

  return Write([&] {
    tx.exec_prepared("po_item_clear", po.tenant_id, po.id);
    WritePurchaseOrderItems(tx, po);
  });
}

Result PgRepository::DeletePurchaseOrder(Transaction& t, const std::string& tenant_id, const std::string& id) {
  auto& tx = TX(t).Tx();
  return Write([&] { tx.exec_prepared("po_delete", tenant_id, id); });
}

std::optional<std::string> PgRepository::PurchaseOrderTenant(Transaction& t, const std::string& id) {
  return Owner(TX(t).Tx(), "po_owner", id);
}

// ------------------------------------------------------------------
// Shifts
// ------------------------------------------------------------------

Result PgRepository::InsertShift(Transaction& t, const model::Shift& s) {
  auto& tx = TX(t).Tx();
  return Write([&] { ExecShift(tx, "shift_insert", s); });
}

std::optional<model::Shift> PgRepository::FindOpenShift(Transaction& t, const std::string& tenant_id) {
  auto& tx = TX(t).Tx();
  return Read([&] {
    return First(LoadShifts(tx.exec_prepared("shift_open", tenant_id, std::string(model::ToString(model::ShiftStatus::kOpen)))));
  });
}

std::vector<model::Shift> PgRepository::ListShifts(Transaction& t, const std::string& tenant_id) {
  auto& tx = TX(t).Tx();
  return Read([&] { return LoadShifts(tx.exec_prepared("shift_list", tenant_id)); });
}

Result PgRepository::UpdateShift(Transaction& t, const model::Shift& s) {
  auto& tx = TX(t).Tx();
  return WriteUpdate(s.id, [&] { return ExecShift(tx, "shift_update", s); });
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

Result PgRepository::InsertNotification(Transaction& t, const model::Notification& n) {
  auto& tx = TX(t).Tx();
  return Write([&] {
    tx.exec_prepared("notification_insert", n.tenant_id, n.id, Millis(n.timestamp), std::string(model::ToString(n.category)), n.message,
                     n.is_read, n.related_id);
  });
}

std::vector<model::Notification> PgRepository::ListNotifications(Transaction& t, const std::string& tenant_id) {
  auto& tx = TX(t).Tx();
  return Read([&] {
    std::vector<model::Notification> out;
    for (const auto& row : tx.exec_prepared("notification_list", tenant_id)) {
      model::Notification n;
      n.tenant_id  = Text(row[0]);
      n.id         = Text(row[1]);
      n.timestamp  = Time(row[2]);
      n.category   = model::ParseNotificationCategory(Text(row[3]));
      n.message    = Text(row[4]);
      n.is_read    = row[5].as<bool>();
      n.related_id = Text(row[6]);
      out.push_back(std::move(n));
    }
    return out;
  });
}

Result PgRepository::UpdateNotification(Transaction& t, const model::Notification& n) {
  auto& tx = TX(t).Tx();
  return WriteUpdate(n.id, [&] {
    return tx.exec_prepared("notification_update", n.tenant_id, n.id, Millis(n.timestamp), std::string(model::ToString(n.category)),
                            n.message, n.is_read, n.related_id);
  });
}

Result PgRepository::DeleteNotifications(Transaction& t, const std::string& tenant_id, const std::vector<std::string>& ids) {
  auto& tx = TX(t).Tx();
  return Write([&] {
    for (const auto& id : ids) {
      tx.exec_prepared("notification_delete", tenant_id, id);
    }
  });
}

// ------------------------------------------------------------------
// Deletion records
// ------------------------------------------------------------------

Result PgRepository::InsertDeletionRecord(Transaction& t, const model::DeletionRecord& d) {
  auto& tx = TX(t).Tx();
  return Write([&] { tx.exec_prepared("deletion_insert", d.tenant_id, d.id, d.table, Millis(d.deleted_at)); });
}

std::vector<model::DeletionRecord> PgRepository::ListDeletionRecords(Transaction& t, const std::string& tenant_id) {
  auto& tx = TX(t).Tx();
  return Read([&] {
    std::vector<model::DeletionRecord> out;
    for (const auto& row : tx.exec_prepared("deletion_list", tenant_id)) {
      model::DeletionRecord d;
      d.tenant_id  = Text(row[0]);
      d.id         = Text(row[1]);
      d.table      = Text(row[2]);
      d.deleted_at = Time(row[3]);
      out.push_back(std::move(d));
    }
    return out;
  });
}

Result PgRepository::DeleteDeletionRecord(Transaction& t, const std::string& tenant_id, const std::string& id, const std::string& table) {
  auto& tx = TX(t).Tx();
  return Write([&] { tx.exec_prepared("deletion_delete", tenant_id, id, table); });
}

} // namespace stockroom::db::postgres
