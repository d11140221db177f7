#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace stockroom::db::memory {

namespace {

template <typename T>
std::vector<T> ForTenant(const std::map<std::pair<std::string, std::string>, T>& table, const std::string& tenant_id) {
  std::vector<T> out;
  for (auto it = table.lower_bound({tenant_id, std::string{}}); it != table.end() && it->first.first == tenant_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

template <typename T>
std::optional<T> Find(const std::map<std::pair<std::string, std::string>, T>& table, const std::string& tenant_id, const std::string& id) {
  auto it = table.find({tenant_id, id});
  if (it == table.end()) return std::nullopt;
  return it->second;
}

template <typename T>
std::optional<std::string> OwnerOf(const std::map<std::pair<std::string, std::string>, T>& table, const std::string& id) {
  for (const auto& [key, _] : table) {
    if (key.second == id) return key.first;
  }
  return std::nullopt;
}

template <typename T>
Result Insert(std::map<std::pair<std::string, std::string>, T>& table, const T& record) {
  auto [_, inserted] = table.try_emplace({record.tenant_id, record.id}, record);
  if (!inserted) return Result::Err(ErrorCode::AlreadyExists, record.id);
  return Result::Ok();
}

template <typename T>
Result Replace(std::map<std::pair<std::string, std::string>, T>& table, const T& record) {
  auto it = table.find({record.tenant_id, record.id});
  if (it == table.end()) return Result::Err(ErrorCode::NotFound, record.id);
  it->second = record;
  return Result::Ok();
}

template <typename T>
Result EraseAll(std::map<std::pair<std::string, std::string>, T>& table, const std::string& tenant_id, const std::vector<std::string>& ids) {
  for (const auto& id : ids) {
    table.erase({tenant_id, id});
  }
  return Result::Ok();
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Products
// ------------------------------------------------------------------

Result MemoryRepository::InsertProduct(Transaction& t, const model::Product& r) {
  auto& s = TX(t).Mutable();
  for (auto it = s.products.lower_bound({r.tenant_id, std::string{}}); it != s.products.end() && it->first.first == r.tenant_id; ++it) {
    if (it->second.sku == r.sku) return Result::Err(ErrorCode::ConstraintViolation, "duplicate sku " + r.sku);
  }
  return Insert(s.products, r);
}

std::optional<model::Product> MemoryRepository::GetProduct(Transaction& t, const std::string& tenant_id, const std::string& id) {
  return Find(TX(t).View().products, tenant_id, id);
}

std::optional<model::Product> MemoryRepository::FindProductBySku(Transaction& t, const std::string& tenant_id, const std::string& sku) {
  for (auto& product : ForTenant(TX(t).View().products, tenant_id)) {
    if (product.sku == sku) return product;
  }
  return std::nullopt;
}

std::vector<model::Product> MemoryRepository::ListProducts(Transaction& t, const std::string& tenant_id) {
  auto products = ForTenant(TX(t).View().products, tenant_id);
  std::stable_sort(products.begin(), products.end(), [](const auto& a, const auto& b) {
    return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
  });
  return products;
}

Result MemoryRepository::UpdateProduct(Transaction& t, const model::Product& r) {
  return Replace(TX(t).Mutable().products, r);
}

Result MemoryRepository::DeleteProduct(Transaction& t, const std::string& tenant_id, const std::string& id) {
  TX(t).Mutable().products.erase({tenant_id, id});
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::ProductTenant(Transaction& t, const std::string& id) {
  return OwnerOf(TX(t).View().products, id);
}

// ------------------------------------------------------------------
// Categories
// ------------------------------------------------------------------

Result MemoryRepository::InsertCategory(Transaction& t, const model::Category& r) {
  return Insert(TX(t).Mutable().categories, r);
}

std::vector<model::Category> MemoryRepository::ListCategories(Transaction& t, const std::string& tenant_id) {
  auto categories = ForTenant(TX(t).View().categories, tenant_id);
  std::stable_sort(categories.begin(), categories.end(), [](const auto& a, const auto& b) {
    return a.name != b.name ? a.name < b.name : a.id < b.id;
  });
  return categories;
}

// ------------------------------------------------------------------
// Stock ledger
// ------------------------------------------------------------------

Result MemoryRepository::InsertAdjustment(Transaction& t, const model::StockAdjustment& r) {
  return Insert(TX(t).Mutable().adjustments, r);
}

std::vector<model::StockAdjustment> MemoryRepository::ListAdjustments(Transaction& t, const std::string& tenant_id) {
  auto rows = ForTenant(TX(t).View().adjustments, tenant_id);
  std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
  });
  return rows;
}

std::vector<model::StockAdjustment> MemoryRepository::ListAdjustmentsForProduct(Transaction& t, const std::string& tenant_id, const std::string& product_id) {
  auto rows = ListAdjustments(t, tenant_id);
  rows.erase(std::remove_if(rows.begin(), rows.end(), [&](const auto& row) { return row.product_id != product_id; }), rows.end());
  return rows;
}

Result MemoryRepository::DeleteAdjustments(Transaction& t, const std::string& tenant_id, const std::vector<std::string>& ids) {
  return EraseAll(TX(t).Mutable().adjustments, tenant_id, ids);
}

// ------------------------------------------------------------------
// Sales
// ------------------------------------------------------------------

Result MemoryRepository::InsertSale(Transaction& t, const model::Sale& r) {
  return Insert(TX(t).Mutable().sales, r);
}

std::optional<model::Sale> MemoryRepository::GetSale(Transaction& t, const std::string& tenant_id, const std::string& id) {
  return Find(TX(t).View().sales, tenant_id, id);
}

std::optional<model::Sale> MemoryRepository::FindSaleByPublicRef(Transaction& t, const std::string& tenant_id, const std::string& public_ref) {
  for (auto& sale : ForTenant(TX(t).View().sales, tenant_id)) {
    if (sale.public_ref == public_ref) return sale;
  }
  return std::nullopt;
}

std::vector<model::Sale> MemoryRepository::ListSales(Transaction& t, const std::string& tenant_id) {
  auto sales = ForTenant(TX(t).View().sales, tenant_id);
  std::stable_sort(sales.begin(), sales.end(), [](const auto& a, const auto& b) {
    return a.date != b.date ? a.date > b.date : a.id > b.id;
  });
  return sales;
}

Result MemoryRepository::UpdateSale(Transaction& t, const model::Sale& r) {
  return Replace(TX(t).Mutable().sales, r);
}

Result MemoryRepository::DeleteSales(Transaction& t, const std::string& tenant_id, const std::vector<std::string>& ids) {
  return EraseAll(TX(t).Mutable().sales, tenant_id, ids);
}

std::optional<std::string> MemoryRepository::SaleTenant(Transaction& t, const std::string& id) {
  return OwnerOf(TX(t).View().sales, id);
}

// ------------------------------------------------------------------
// Purchase orders
// ------------------------------------------------------------------

Result MemoryRepository::InsertPurchaseOrder(Transaction& t, const model::PurchaseOrder& r) {
  return Insert(TX(t).Mutable().purchase_orders, r);
}

std::optional<model::PurchaseOrder> MemoryRepository::GetPurchaseOrder(Transaction& t, const std::string& tenant_id, const std::string& id) {
  return Find(TX(t).View().purchase_orders, tenant_id, id);
}

std::optional<model::PurchaseOrder> MemoryRepository::FindPurchaseOrderByPublicRef(Transaction& t, const std::string& tenant_id, const std::string& public_ref) {
  for (auto& po : ForTenant(TX(t).View().purchase_orders, tenant_id)) {
    if (po.public_ref == public_ref) return po;
  }
  return std::nullopt;
}

std::vector<model::PurchaseOrder> MemoryRepository::ListPurchaseOrders(Transaction& t, const std::string& tenant_id) {
  auto orders = ForTenant(TX(t).View().purchase_orders, tenant_id);
  std::stable_sort(orders.begin(), orders.end(), [](const auto& a, const auto& b) {
    return a.date_created != b.date_created ? a.date_created > b.date_created : a.id > b.id;
  });
  return orders;
}

Result MemoryRepository::UpdatePurchaseOrder(Transaction& t, const model::PurchaseOrder& r) {
  return Replace(TX(t).Mutable().purchase_orders, r);
}

Result MemoryRepository::DeletePurchaseOrder(Transaction& t, const std::string& tenant_id, const std::string& id) {
  TX(t).Mutable().purchase_orders.erase({tenant_id, id});
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::PurchaseOrderTenant(Transaction& t, const std::string& id) {
  return OwnerOf(TX(t).View().purchase_orders, id);
}

// ------------------------------------------------------------------
// Shifts
// ------------------------------------------------------------------

Result MemoryRepository::InsertShift(Transaction& t, const model::Shift& r) {
  return Insert(TX(t).Mutable().shifts, r);
}

std::optional<model::Shift> MemoryRepository::FindOpenShift(Transaction& t, const std::string& tenant_id) {
  for (auto& shift : ListShifts(t, tenant_id)) {
    if (shift.status == model::ShiftStatus::kOpen) return shift;
  }
  return std::nullopt;
}

std::vector<model::Shift> MemoryRepository::ListShifts(Transaction& t, const std::string& tenant_id) {
  auto shifts = ForTenant(TX(t).View().shifts, tenant_id);
  std::stable_sort(shifts.begin(), shifts.end(), [](const auto& a, const auto& b) {
    return a.start_time != b.start_time ? a.start_time > b.start_time : a.id > b.id;
  });
  return shifts;
}

Result MemoryRepository::UpdateShift(Transaction& t, const model::Shift& r) {
  return Replace(TX(t).Mutable().shifts, r);
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

Result MemoryRepository::InsertNotification(Transaction& t, const model::Notification& r) {
  return Insert(TX(t).Mutable().notifications, r);
}

std::vector<model::Notification> MemoryRepository::ListNotifications(Transaction& t, const std::string& tenant_id) {
  auto rows = ForTenant(TX(t).View().notifications, tenant_id);
  std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    return a.timestamp != b.timestamp ? a.timestamp > b.timestamp : a.id > b.id;
  });
  return rows;
}

Result MemoryRepository::UpdateNotification(Transaction& t, const model::Notification& r) {
  return Replace(TX(t).Mutable().notifications, r);
}

Result MemoryRepository::DeleteNotifications(Transaction& t, const std::string& tenant_id, const std::vector<std::string>& ids) {
  return EraseAll(TX(t).Mutable().notifications, tenant_id, ids);
}

// ------------------------------------------------------------------
// Deletion records
// ------------------------------------------------------------------

Result MemoryRepository::InsertDeletionRecord(Transaction& t, const model::DeletionRecord& r) {
  TX(t).Mutable().deletion_records.push_back(r);
  return Result::Ok();
}

std::vector<model::DeletionRecord> MemoryRepository::ListDeletionRecords(Transaction& t, const std::string& tenant_id) {
  std::vector<model::DeletionRecord> out;
  for (const auto& record : TX(t).View().deletion_records) {
    if (record.tenant_id == tenant_id) out.push_back(record);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.deleted_at < b.deleted_at; });
  return out;
}

Result MemoryRepository::DeleteDeletionRecord(Transaction& t, const std::string& tenant_id, const std::string& id, const std::string& table) {
  auto& records = TX(t).Mutable().deletion_records;
  records.erase(std::remove_if(records.begin(), records.end(),
                               [&](const model::DeletionRecord& r) { return r.tenant_id == tenant_id && r.id == id && r.table == table; }),
                records.end());
  return Result::Ok();
}

} // namespace stockroom::db::memory
