#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/core/integrity_guard.hpp"
#include "internal/core/product_store.hpp"
#include "internal/core/stock_ledger.hpp"
#include "internal/model/notification.hpp"
#include "internal/util/outcome.hpp"
#include "service_context.hpp"

namespace stockroom::service {

/*
  Catalogue, stock ledger, deletion guard and notification inbox.
*/
class InventoryService {
 public:
  explicit InventoryService(ServiceContext ctx);

  // Products
  util::OutcomeOf<model::Product>               AddProduct(const core::ProductDraft& draft);
  util::OutcomeOf<model::Product>               UpdateProduct(const model::Product& product);
  util::OutcomeOf<core::ImportResult>           ImportProducts(const std::vector<core::ProductDraft>& drafts);
  util::OutcomeOf<std::size_t>                  BulkUpdateCategories(const std::vector<std::string>& product_ids,
                                                                     const std::vector<std::string>& category_ids, core::CategoryUpdateMode mode);
  util::OutcomeOf<std::vector<model::Product>>  ListProducts();
  util::OutcomeOf<model::Product>               GetProduct(const std::string& product_id);
  util::OutcomeOf<std::vector<model::Category>> ListCategories();

  // Stock
  util::Outcome AdjustStock(const std::string& product_id, const std::optional<std::string>& variant_id, model::Quantity new_level,
                            const std::string& reason);
  util::Outcome ReceiveStock(const std::string& product_id, const std::optional<std::string>& variant_id, model::Quantity quantity);
  util::OutcomeOf<std::vector<model::StockAdjustment>> ListAdjustments(const std::optional<std::string>& product_id);

  // Deletion
  util::Outcome                                       DeleteProduct(const std::string& product_id, bool force);
  util::OutcomeOf<model::Product>                     DeleteVariant(const std::string& product_id, const std::string& variant_id, bool force);
  util::OutcomeOf<core::BulkDeleteResult>             BulkDeleteProducts(const std::vector<std::string>& product_ids);
  util::OutcomeOf<core::RestoreResult>                RestoreDeletedProducts(const std::vector<model::SaleLine>& lines);
  util::OutcomeOf<std::vector<model::DeletionRecord>> ListDeletionRecords();

  // Notifications
  util::OutcomeOf<std::vector<model::Notification>> ListNotifications();
  util::Outcome                                     MarkNotificationRead(const std::string& notification_id);
  util::OutcomeOf<std::size_t>                      MarkAllNotificationsRead();
  util::OutcomeOf<std::size_t>                      PruneNotifications(int days);

 private:
  ServiceContext ctx_;
};

} // namespace stockroom::service
