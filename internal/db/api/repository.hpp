#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/deletion_record.hpp"
#include "internal/model/notification.hpp"
#include "internal/model/product.hpp"
#include "internal/model/purchase_order.hpp"
#include "internal/model/sale.hpp"
#include "internal/model/shift.hpp"
#include "internal/model/stock_adjustment.hpp"

namespace stockroom::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Every query is scoped to one tenant; records of other tenants are
    invisible even when ids collide
  - The only exception are the *Tenant lookups below, which resolve the
    owner of an id so callers can tell "foreign" from "missing"
  - Aggregates (product + variants, sale + lines + payments, PO + lines) are
    read and written whole

  Listing order is part of the contract so that backends are
  interchangeable:
    products, categories     created order (created_at, id) / name
    adjustments              oldest first
    sales, POs, shifts,
    notifications            newest first
    deletion records         oldest first
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Products
  // ---------------------------------------------------------------------

  virtual Result InsertProduct(Transaction&, const model::Product&) = 0;

  virtual std::optional<model::Product> GetProduct(Transaction&, const std::string& tenant_id, const std::string& id) = 0;

  virtual std::optional<model::Product> FindProductBySku(Transaction&, const std::string& tenant_id, const std::string& sku) = 0;

  virtual std::vector<model::Product> ListProducts(Transaction&, const std::string& tenant_id) = 0;

  // Replaces the stored aggregate, variants included.
  virtual Result UpdateProduct(Transaction&, const model::Product&) = 0;

  virtual Result DeleteProduct(Transaction&, const std::string& tenant_id, const std::string& id) = 0;

  // Owning tenant of a product id, across all tenants.
  virtual std::optional<std::string> ProductTenant(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Categories
  // ---------------------------------------------------------------------

  virtual Result InsertCategory(Transaction&, const model::Category&) = 0;

  virtual std::vector<model::Category> ListCategories(Transaction&, const std::string& tenant_id) = 0;

  // ---------------------------------------------------------------------
  // Stock ledger
  // ---------------------------------------------------------------------

  virtual Result InsertAdjustment(Transaction&, const model::StockAdjustment&) = 0;

  virtual std::vector<model::StockAdjustment> ListAdjustments(Transaction&, const std::string& tenant_id) = 0;

  virtual std::vector<model::StockAdjustment> ListAdjustmentsForProduct(Transaction&, const std::string& tenant_id, const std::string& product_id) = 0;

  virtual Result DeleteAdjustments(Transaction&, const std::string& tenant_id, const std::vector<std::string>& ids) = 0;

  // ---------------------------------------------------------------------
  // Sales
  // ---------------------------------------------------------------------

  virtual Result InsertSale(Transaction&, const model::Sale&) = 0;

  virtual std::optional<model::Sale> GetSale(Transaction&, const std::string& tenant_id, const std::string& id) = 0;

  virtual std::optional<model::Sale> FindSaleByPublicRef(Transaction&, const std::string& tenant_id, const std::string& public_ref) = 0;

  virtual std::vector<model::Sale> ListSales(Transaction&, const std::string& tenant_id) = 0;

  virtual Result UpdateSale(Transaction&, const model::Sale&) = 0;

  virtual Result DeleteSales(Transaction&, const std::string& tenant_id, const std::vector<std::string>& ids) = 0;

  virtual std::optional<std::string> SaleTenant(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Purchase orders
  // ---------------------------------------------------------------------

  virtual Result InsertPurchaseOrder(Transaction&, const model::PurchaseOrder&) = 0;

  virtual std::optional<model::PurchaseOrder> GetPurchaseOrder(Transaction&, const std::string& tenant_id, const std::string& id) = 0;

  virtual std::optional<model::PurchaseOrder> FindPurchaseOrderByPublicRef(Transaction&, const std::string& tenant_id, const std::string& public_ref) = 0;

  virtual std::vector<model::PurchaseOrder> ListPurchaseOrders(Transaction&, const std::string& tenant_id) = 0;

  virtual Result UpdatePurchaseOrder(Transaction&, const model::PurchaseOrder&) = 0;

  virtual Result DeletePurchaseOrder(Transaction&, const std::string& tenant_id, const std::string& id) = 0;

  virtual std::optional<std::string> PurchaseOrderTenant(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Shifts
  // ---------------------------------------------------------------------

  virtual Result InsertShift(Transaction&, const model::Shift&) = 0;

  virtual std::optional<model::Shift> FindOpenShift(Transaction&, const std::string& tenant_id) = 0;

  virtual std::vector<model::Shift> ListShifts(Transaction&, const std::string& tenant_id) = 0;

  virtual Result UpdateShift(Transaction&, const model::Shift&) = 0;

  // ---------------------------------------------------------------------
  // Notifications
  // ---------------------------------------------------------------------

  virtual Result InsertNotification(Transaction&, const model::Notification&) = 0;

  virtual std::vector<model::Notification> ListNotifications(Transaction&, const std::string& tenant_id) = 0;

  virtual Result UpdateNotification(Transaction&, const model::Notification&) = 0;

  virtual Result DeleteNotifications(Transaction&, const std::string& tenant_id, const std::vector<std::string>& ids) = 0;

  // ---------------------------------------------------------------------
  // Deletion records (tombstones)
  // ---------------------------------------------------------------------

  virtual Result InsertDeletionRecord(Transaction&, const model::DeletionRecord&) = 0;

  virtual std::vector<model::DeletionRecord> ListDeletionRecords(Transaction&, const std::string& tenant_id) = 0;

  virtual Result DeleteDeletionRecord(Transaction&, const std::string& tenant_id, const std::string& id, const std::string& table) = 0;
};

} // namespace stockroom::db
