#include "purchase_orders.hpp"

#include <algorithm>

#include "internal/core/db_errors.hpp"
#include "internal/core/deletion_plan.hpp"
#include "internal/core/ledger_reason.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/identity.hpp"
#include "internal/model/deletion_record.hpp"
#include "internal/model/names.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"
#include "internal/util/time.hpp"

namespace stockroom::core {

namespace {

constexpr std::size_t kPurchaseOrderRefSize = 6;

void ValidateDraft(const PurchaseOrderDraft& draft) {
  if (draft.supplier_name.empty()) {
    throw util::ValidationError("supplier name is required");
  }
  if (draft.items.empty()) {
    throw util::ValidationError("purchase order needs at least one line");
  }
  for (const auto& line : draft.items) {
    if (line.product_id.empty()) {
      throw util::ValidationError("purchase order line without product id");
    }
    if (line.quantity_ordered <= 0) {
      throw util::ValidationError("ordered quantity for " + line.product_id + " must be > 0");
    }
    if (line.cost_price < 0) {
      throw util::ValidationError("cost price for " + line.product_id + " must be >= 0");
    }
  }
}

} // namespace

PurchaseOrders::PurchaseOrders(CoreContext ctx) : ctx_(ctx), ledger_(ctx) {
}

model::PurchaseOrder PurchaseOrders::AddPurchaseOrder(const PurchaseOrderDraft& draft) {
  ValidateDraft(draft);
  const auto tenant = ctx_.identity->TenantId();

  auto tx = ctx_.repository->Begin();

  model::PurchaseOrder po;
  po.id            = util::PrefixedId("po");
  po.tenant_id     = tenant;
  po.supplier_id   = draft.supplier_id;
  po.supplier_name = draft.supplier_name;
  po.date_created  = util::Now();
  po.date_expected = draft.date_expected;
  po.items         = draft.items;
  po.notes         = draft.notes;
  for (auto& line : po.items) {
    line.quantity_received = 0;
  }
  po.total_cost = model::ComputeTotalCost(po);
  po.status     = model::PurchaseOrderStatus::kPending;
  po.public_ref = util::GenerateUniquePublicRef("PO-", kPurchaseOrderRefSize, [&](const std::string& ref) {
    return ctx_.repository->FindPurchaseOrderByPublicRef(*tx, tenant, ref).has_value();
  });

  ThrowIfDbError(ctx_.repository->InsertPurchaseOrder(*tx, po), "insert purchase order");
  if (ctx_.notifier) {
    ctx_.notifier->Emit(*tx, tenant, model::NotificationCategory::kPurchaseOrder,
                        "New PO #" + po.public_ref + " created for " + po.supplier_name + ".", po.id);
  }
  tx->Commit();

  STOCKROOM_LOG_INFO("purchase order created", {observability::StringField("po_id", po.id), observability::StringField("po_ref", po.public_ref),
                                                observability::IntField("total_cost", po.total_cost)});
  return po;
}

model::PurchaseOrder PurchaseOrders::ReceiveItems(const std::string& po_id, const std::vector<ReceiptLine>& receipts) {
  const auto tenant = ctx_.identity->TenantId();

  auto tx = ctx_.repository->Begin();
  auto po = LoadPurchaseOrder(*ctx_.repository, *tx, tenant, po_id);

  // Sum per line before touching anything.
  std::vector<model::Quantity> increments(po.items.size(), 0);
  for (const auto& receipt : receipts) {
    if (receipt.quantity < 0) {
      throw util::ValidationError("received quantity for " + receipt.product_id + " must be >= 0");
    }
    auto it = std::find_if(po.items.begin(), po.items.end(), [&](const model::PurchaseOrderLine& line) {
      return line.product_id == receipt.product_id && line.variant_id == receipt.variant_id;
    });
    if (it == po.items.end()) {
      throw util::ValidationError("product " + receipt.product_id + " is not on purchase order " + po_id);
    }
    increments[static_cast<std::size_t>(it - po.items.begin())] += receipt.quantity;
  }

  for (std::size_t i = 0; i < po.items.size(); ++i) {
    if (increments[i] == 0) continue;
    auto& line = po.items[i];
    line.quantity_received += increments[i];

    auto product = ctx_.repository->GetProduct(*tx, tenant, line.product_id);
    if (!product || !StockLedger::LevelOf(*product, line.variant_id)) {
      STOCKROOM_LOG_WARN("purchase order line for unknown product; stock unchanged",
                         {observability::StringField("po_ref", po.public_ref), observability::StringField("product_id", line.product_id),
                          observability::StringField("variant_id", line.variant_id.value_or(""))});
      continue;
    }
    ledger_.Move(*tx, tenant, line.product_id, line.variant_id, increments[i], PurchaseOrderReason(po.public_ref),
                 model::LedgerSource::kPurchaseOrder, po.id);
  }

  const auto before = po.status;
  po.status         = model::DerivePurchaseOrderStatus(po);
  ThrowIfDbError(ctx_.repository->UpdatePurchaseOrder(*tx, po), "update purchase order");

  if (po.status != before && ctx_.notifier) {
    ctx_.notifier->Emit(*tx, tenant, model::NotificationCategory::kPurchaseOrder,
                        "PO #" + po.public_ref + " is now " + std::string(model::ToString(po.status)) + ".", po.id);
  }
  tx->Commit();

  STOCKROOM_LOG_INFO("purchase order received", {observability::StringField("po_id", po.id),
                                                 observability::StringField("status", model::ToString(po.status))});
  return po;
}

void PurchaseOrders::DeletePurchaseOrder(const std::string& po_id) {
  const auto tenant = ctx_.identity->TenantId();

  auto       tx = ctx_.repository->Begin();
  const auto po = LoadPurchaseOrder(*ctx_.repository, *tx, tenant, po_id);
  if (po.status != model::PurchaseOrderStatus::kPending) {
    throw util::PreconditionFailed("Only POs with Pending status can be deleted.");
  }

  DeletionPlan plan(ctx_.repository, tenant);
  plan.RemovePurchaseOrder(po.id);
  plan.Execute(*tx);
  tx->Commit();

  STOCKROOM_LOG_INFO("purchase order deleted", {observability::StringField("po_id", po_id)});
}

std::size_t PurchaseOrders::PrunePurchaseOrders(int days) {
  if (days < 0) {
    throw util::ValidationError("days must be >= 0");
  }
  const auto tenant = ctx_.identity->TenantId();
  const auto cutoff = util::DaysBefore(util::Now(), days);

  auto         tx = ctx_.repository->Begin();
  DeletionPlan plan(ctx_.repository, tenant);
  for (const auto& po : ctx_.repository->ListPurchaseOrders(*tx, tenant)) {
    if (po.date_created < cutoff) plan.RemovePurchaseOrder(po.id);
  }
  if (plan.Empty()) return 0;

  plan.Execute(*tx);
  tx->Commit();
  return plan.Count(model::tables::kPurchaseOrders);
}

std::vector<model::PurchaseOrder> PurchaseOrders::ListPurchaseOrders() {
  auto tx = ctx_.repository->Begin();
  return ctx_.repository->ListPurchaseOrders(*tx, ctx_.identity->TenantId());
}

model::PurchaseOrder PurchaseOrders::GetPurchaseOrder(const std::string& po_id) {
  auto tx = ctx_.repository->Begin();
  return LoadPurchaseOrder(*ctx_.repository, *tx, ctx_.identity->TenantId(), po_id);
}

} // namespace stockroom::core
