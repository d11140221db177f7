#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace stockroom::db::postgres {

/*
  PostgreSQL-backed repository.

  Same table layout as the SQLite backend. All statements are prepared per
  connection by PgPool. Write failures come back as Result; a read that
  loses a serialization race throws util::Conflict.
*/
class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertProduct(Transaction&, const model::Product&) override;
  std::optional<model::Product> GetProduct(Transaction&, const std::string& tenant_id, const std::string& id) override;
  std::optional<model::Product> FindProductBySku(Transaction&, const std::string& tenant_id, const std::string& sku) override;
  std::vector<model::Product> ListProducts(Transaction&, const std::string& tenant_id) override;
  Result UpdateProduct(Transaction&, const model::Product&) override;
  Result DeleteProduct(Transaction&, const std::string& tenant_id, const std::string& id) override;
  std::optional<std::string> ProductTenant(Transaction&, const std::string& id) override;

  Result InsertCategory(Transaction&, const model::Category&) override;
  std::vector<model::Category> ListCategories(Transaction&, const std::string& tenant_id) override;

  Result InsertAdjustment(Transaction&, const model::StockAdjustment&) override;
  std::vector<model::StockAdjustment> ListAdjustments(Transaction&, const std::string& tenant_id) override;
  std::vector<model::StockAdjustment> ListAdjustmentsForProduct(Transaction&, const std::string& tenant_id, const std::string& product_id) override;
  Result DeleteAdjustments(Transaction&, const std::string& tenant_id, const std::vector<std::string>& ids) override;

  Result InsertSale(Transaction&, const model::Sale&) override;
  std::optional<model::Sale> GetSale(Transaction&, const std::string& tenant_id, const std::string& id) override;
  std::optional<model::Sale> FindSaleByPublicRef(Transaction&, const std::string& tenant_id, const std::string& public_ref) override;
  std::vector<model::Sale> ListSales(Transaction&, const std::string& tenant_id) override;
  Result UpdateSale(Transaction&, const model::Sale&) override;
  Result DeleteSales(Transaction&, const std::string& tenant_id, const std::vector<std::string>& ids) override;
  std::optional<std::string> SaleTenant(Transaction&, const std::string& id) override;

  Result InsertPurchaseOrder(Transaction&, const model::PurchaseOrder&) override;
  std::optional<model::PurchaseOrder> GetPurchaseOrder(Transaction&, const std::string& tenant_id, const std::string& id) override;
  std::optional<model::PurchaseOrder> FindPurchaseOrderByPublicRef(Transaction&, const std::string& tenant_id, const std::string& public_ref) override;
  std::vector<model::PurchaseOrder> ListPurchaseOrders(Transaction&, const std::string& tenant_id) override;
  Result UpdatePurchaseOrder(Transaction&, const model::PurchaseOrder&) override;
  Result DeletePurchaseOrder(Transaction&, const std::string& tenant_id, const std::string& id) override;
  std::optional<std::string> PurchaseOrderTenant(Transaction&, const std::string& id) override;

  Result InsertShift(Transaction&, const model::Shift&) override;
  std::optional<model::Shift> FindOpenShift(Transaction&, const std::string& tenant_id) override;
  std::vector<model::Shift> ListShifts(Transaction&, const std::string& tenant_id) override;
  Result UpdateShift(Transaction&, const model::Shift&) override;

  Result InsertNotification(Transaction&, const model::Notification&) override;
  std::vector<model::Notification> ListNotifications(Transaction&, const std::string& tenant_id) override;
  Result UpdateNotification(Transaction&, const model::Notification&) override;
  Result DeleteNotifications(Transaction&, const std::string& tenant_id, const std::vector<std::string>& ids) override;

  Result InsertDeletionRecord(Transaction&, const model::DeletionRecord&) override;
  std::vector<model::DeletionRecord> ListDeletionRecords(Transaction&, const std::string& tenant_id) override;
  Result DeleteDeletionRecord(Transaction&, const std::string& tenant_id, const std::string& id, const std::string& table) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
};

} // namespace stockroom::db::postgres
