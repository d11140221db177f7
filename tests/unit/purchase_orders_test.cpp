#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/core/purchase_orders.hpp"
#include "internal/model/deletion_record.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using stockroom::core::PurchaseOrderDraft;
using stockroom::core::PurchaseOrders;
using stockroom::core::ReceiptLine;
using stockroom::model::LedgerSource;
using stockroom::model::NotificationCategory;
using stockroom::model::PurchaseOrderLine;
using stockroom::model::PurchaseOrderStatus;
using stockroom::testing::Fixture;
using stockroom::testing::Throws;

PurchaseOrderLine OrderLine(const std::string& product_id, stockroom::model::Quantity quantity, stockroom::model::Money cost) {
  PurchaseOrderLine line;
  line.product_id       = product_id;
  line.name             = "Line " + product_id;
  line.quantity_ordered = quantity;
  line.cost_price       = cost;
  return line;
}

PurchaseOrderDraft Draft(std::vector<PurchaseOrderLine> lines) {
  PurchaseOrderDraft draft;
  draft.supplier_id   = "sup-1";
  draft.supplier_name = "Acme";
  draft.items         = std::move(lines);
  return draft;
}

std::size_t PurchaseOrderNotifications(Fixture& fx) {
  std::size_t count = 0;
  for (const auto& notification : fx.sink->delivered) {
    if (notification.category == NotificationCategory::kPurchaseOrder) ++count;
  }
  return count;
}

void TestAddComputesTotalsAndNotifies() {
  Fixture        fx;
  PurchaseOrders orders(fx.ctx);
  const auto     a = fx.AddProduct("A");
  const auto     b = fx.AddProduct("B");

  const auto po = orders.AddPurchaseOrder(Draft({OrderLine(a.id, 10, 250), OrderLine(b.id, 4, 1000)}));
  assert(po.total_cost == 6500);
  assert(po.status == PurchaseOrderStatus::kPending);
  assert(po.public_ref.rfind("PO-", 0) == 0 && po.public_ref.size() == 9);

  assert(fx.sink->delivered.size() == 1);
  assert(fx.sink->delivered[0].message == "New PO #" + po.public_ref + " created for Acme.");
  assert(fx.sink->delivered[0].related_id == po.id);
}

void TestDraftValidation() {
  Fixture        fx;
  PurchaseOrders orders(fx.ctx);
  const auto     a = fx.AddProduct("A");

  assert(Throws<stockroom::util::ValidationError>([&] { orders.AddPurchaseOrder(Draft({})); }));
  assert(Throws<stockroom::util::ValidationError>([&] { orders.AddPurchaseOrder(Draft({OrderLine(a.id, 0, 100)})); }));
  assert(Throws<stockroom::util::ValidationError>([&] { orders.AddPurchaseOrder(Draft({OrderLine(a.id, 1, -1)})); }));

  auto anonymous          = Draft({OrderLine(a.id, 1, 100)});
  anonymous.supplier_name = "";
  assert(Throws<stockroom::util::ValidationError>([&] { orders.AddPurchaseOrder(anonymous); }));

  assert(orders.ListPurchaseOrders().empty());
}

void TestReceiptLifecycle() {
  Fixture        fx;
  PurchaseOrders orders(fx.ctx);
  const auto     a  = fx.AddProduct("A", 2);
  const auto     b  = fx.AddProduct("B");
  const auto     po = orders.AddPurchaseOrder(Draft({OrderLine(a.id, 10, 250), OrderLine(b.id, 4, 1000)}));

  // Zero receipts change nothing.
  auto unchanged = orders.ReceiveItems(po.id, {{a.id, std::nullopt, 0}});
  assert(unchanged.status == PurchaseOrderStatus::kPending);
  assert(PurchaseOrderNotifications(fx) == 1);

  // Entries for the same line are summed.
  auto partial = orders.ReceiveItems(po.id, {{a.id, std::nullopt, 3}, {a.id, std::nullopt, 2}});
  assert(partial.status == PurchaseOrderStatus::kPartial);
  assert(partial.items[0].quantity_received == 5);
  assert(fx.Product(a.id).stock == 7);
  assert(PurchaseOrderNotifications(fx) == 2);
  assert(fx.sink->delivered.back().message == "PO #" + po.public_ref + " is now Partial.");

  const auto rows = fx.Ledger(a.id);
  assert(rows.back().quantity == 5);
  assert(rows.back().reason == "Received from PO #" + po.public_ref);
  assert(rows.back().source == LedgerSource::kPurchaseOrder);
  assert(rows.back().source_id == po.id);

  // Still partial: no status change, no notification.
  orders.ReceiveItems(po.id, {{a.id, std::nullopt, 5}});
  assert(PurchaseOrderNotifications(fx) == 2);
  assert(orders.GetPurchaseOrder(po.id).status == PurchaseOrderStatus::kPartial);

  auto done = orders.ReceiveItems(po.id, {{b.id, std::nullopt, 4}});
  assert(done.status == PurchaseOrderStatus::kReceived);
  assert(fx.Product(b.id).stock == 4);
  assert(PurchaseOrderNotifications(fx) == 3);
  assert(fx.sink->delivered.back().message == "PO #" + po.public_ref + " is now Received.");
}

void TestBadReceiptsAreRejectedWhole() {
  Fixture        fx;
  PurchaseOrders orders(fx.ctx);
  const auto     a     = fx.AddProduct("A");
  const auto     other = fx.AddProduct("Z");
  const auto     po    = orders.AddPurchaseOrder(Draft({OrderLine(a.id, 10, 250)}));

  assert(Throws<stockroom::util::ValidationError>([&] { orders.ReceiveItems(po.id, {{a.id, std::nullopt, 2}, {a.id, std::nullopt, -1}}); }));
  assert(Throws<stockroom::util::ValidationError>([&] { orders.ReceiveItems(po.id, {{a.id, std::nullopt, 2}, {other.id, std::nullopt, 1}}); }));
  assert(Throws<stockroom::util::NotFound>([&] { orders.ReceiveItems("po_missing", {{a.id, std::nullopt, 1}}); }));

  assert(orders.GetPurchaseOrder(po.id).items[0].quantity_received == 0);
  assert(fx.Product(a.id).stock == 0);
}

void TestReceiptsAreNotClamped() {
  Fixture        fx;
  PurchaseOrders orders(fx.ctx);
  const auto     a  = fx.AddProduct("A");
  const auto     po = orders.AddPurchaseOrder(Draft({OrderLine(a.id, 2, 250)}));

  const auto over = orders.ReceiveItems(po.id, {{a.id, std::nullopt, 5}});
  assert(over.items[0].quantity_received == 5);
  assert(over.status == PurchaseOrderStatus::kReceived);
  assert(fx.Product(a.id).stock == 5);
}

void TestDeleteOnlyWhilePending() {
  Fixture        fx;
  PurchaseOrders orders(fx.ctx);
  const auto     a       = fx.AddProduct("A");
  const auto     pending = orders.AddPurchaseOrder(Draft({OrderLine(a.id, 2, 250)}));
  const auto     started = orders.AddPurchaseOrder(Draft({OrderLine(a.id, 2, 250)}));
  orders.ReceiveItems(started.id, {{a.id, std::nullopt, 1}});

  bool threw = false;
  try {
    orders.DeletePurchaseOrder(started.id);
  } catch (const stockroom::util::PreconditionFailed& ex) {
    threw = std::string(ex.what()) == "Only POs with Pending status can be deleted.";
  }
  assert(threw);

  orders.DeletePurchaseOrder(pending.id);
  const auto remaining = orders.ListPurchaseOrders();
  assert(remaining.size() == 1 && remaining[0].id == started.id);
  assert(fx.TombstoneCount(stockroom::model::tables::kPurchaseOrders) == 1);

  assert(orders.PrunePurchaseOrders(30) == 0);
  assert(Throws<stockroom::util::ValidationError>([&] { orders.PrunePurchaseOrders(-1); }));
}

void TestForeignPurchaseOrderIsAccessDenied() {
  Fixture        fx;
  const auto     a  = fx.AddProduct("A");
  const auto     po = PurchaseOrders(fx.ctx).AddPurchaseOrder(Draft({OrderLine(a.id, 2, 250)}));
  PurchaseOrders foreign(fx.TenantContext("shop-2"));

  assert(Throws<stockroom::util::AccessDenied>([&] { foreign.GetPurchaseOrder(po.id); }));
  assert(Throws<stockroom::util::AccessDenied>([&] { foreign.ReceiveItems(po.id, {{a.id, std::nullopt, 2}}); }));
  assert(Throws<stockroom::util::AccessDenied>([&] { foreign.DeletePurchaseOrder(po.id); }));
  assert(Throws<stockroom::util::NotFound>([&] { foreign.GetPurchaseOrder("po_missing"); }));

  assert(PurchaseOrders(fx.ctx).GetPurchaseOrder(po.id).status == PurchaseOrderStatus::kPending);
  assert(fx.Product(a.id).stock == 0);
}

} // namespace

int main() {
  TestAddComputesTotalsAndNotifies();
  TestDraftValidation();
  TestReceiptLifecycle();
  TestBadReceiptsAreRejectedWhole();
  TestReceiptsAreNotClamped();
  TestDeleteOnlyWhilePending();
  TestForeignPurchaseOrderIsAccessDenied();

  std::cout << "stockroom_unit_purchase_orders: pass\n";
  return 0;
}
