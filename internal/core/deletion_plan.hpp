#pragma once

#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/model/product.hpp"

namespace stockroom::db {
class Repository;
class Transaction;
} // namespace stockroom::db

namespace stockroom::core {

/*
  Unit of work for cascading deletes.

  Removals are collected first and executed together by Execute(), inside
  the caller's transaction. Every removed row gets exactly one DeletionRecord;
  repeated planning of the same row is ignored.

  Execution order:
    1. product rewrites (variant removal)
    2. ledger rows, notifications
    3. sales, purchase orders, products
    4. tombstones
*/
class DeletionPlan {
 public:
  DeletionPlan(std::shared_ptr<db::Repository> repository, std::string tenant_id);

  // Variant rows go with the product; each gets its own tombstone.
  void RemoveProduct(const model::Product& product);
  void RemoveVariant(model::Product parent_after_removal, const std::string& variant_id);
  void RemoveAdjustment(const std::string& id);
  void RemoveNotification(const std::string& id);
  void RemoveSale(const std::string& id);
  void RemovePurchaseOrder(const std::string& id);

  bool        Empty() const;
  std::size_t Count(std::string_view table) const;

  void Execute(db::Transaction& tx);

 private:
  bool Plan(std::string_view table, const std::string& id);
  std::vector<std::string> IdsFor(std::string_view table) const;

  std::shared_ptr<db::Repository> repository_;
  std::string                     tenant_id_;

  std::vector<std::pair<std::string, std::string>> planned_; // (table, id) in planning order
  std::set<std::pair<std::string, std::string>>    seen_;
  std::vector<model::Product>                      rewrites_;
};

} // namespace stockroom::core
