#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/service/error_mapping.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/outcome.hpp"
#include "test_support.hpp"

namespace {

using stockroom::util::OutcomeCode;

stockroom::factory::Application MakeApp(std::shared_ptr<stockroom::testing::RecordingSink> sink = nullptr) {
  auto repository = std::make_shared<stockroom::db::memory::MemoryRepository>();
  auto identity   = std::make_shared<stockroom::identity::StaticIdentity>("shop-1", stockroom::identity::Actor{"user-1", "Alex"});
  if (!sink) sink = std::make_shared<stockroom::testing::RecordingSink>();
  return stockroom::factory::Assemble(repository, identity, sink, stockroom::core::InventorySettings{});
}

stockroom::core::ProductDraft Draft(const std::string& sku) {
  stockroom::core::ProductDraft draft;
  draft.sku          = sku;
  draft.name         = "Item " + sku;
  draft.retail_price = 500;
  draft.cost_price   = 200;
  return draft;
}

void TestSuccessCarriesValue() {
  auto app     = MakeApp();
  auto created = app.inventory->AddProduct(Draft("A-1"));
  assert(created.code == OutcomeCode::OK);
  assert(created.value && created.value->id.rfind("prod", 0) == 0);
  assert(created.value->low_stock_threshold == 5);

  auto adjusted = app.inventory->AdjustStock(created.value->id, std::nullopt, 12, "Count");
  assert(adjusted);

  auto listed = app.inventory->ListAdjustments(created.value->id);
  assert(listed.code == OutcomeCode::OK && listed.value->size() == 1);
  assert(listed.value->front().quantity == 12);
}

void TestValidationAndNotFound() {
  auto app = MakeApp();

  auto empty_sku = app.inventory->AddProduct(Draft(""));
  assert(empty_sku.code == OutcomeCode::Validation);
  assert(!empty_sku.value);

  assert(app.inventory->AddProduct(Draft("DUP")));
  assert(app.inventory->AddProduct(Draft("DUP")).code == OutcomeCode::Validation);

  assert(app.inventory->GetProduct("prod_missing").code == OutcomeCode::NotFound);
  assert(app.inventory->AdjustStock("prod_missing", std::nullopt, 3, "Count").code == OutcomeCode::NotFound);
  assert(app.sales->GetSale("sale_missing").code == OutcomeCode::NotFound);
  assert(app.procurement->ReceiveItems("po_missing", {}).code == OutcomeCode::NotFound);
  assert(app.inventory->MarkNotificationRead("notif_missing").code == OutcomeCode::NotFound);
}

void TestPreconditionFailed() {
  auto app     = MakeApp();
  auto product = app.inventory->AddProduct(Draft("STOCKED")).value;
  assert(app.inventory->AdjustStock(product->id, std::nullopt, 2, "Count"));

  auto refused = app.inventory->DeleteProduct(product->id, false);
  assert(refused.code == OutcomeCode::PreconditionFailed);
  assert(refused.message.find("still has stock") != std::string::npos);

  assert(app.inventory->DeleteProduct(product->id, true));
  assert(app.inventory->GetProduct(product->id).code == OutcomeCode::NotFound);
}

void TestShiftOutcomes() {
  auto sink = std::make_shared<stockroom::testing::RecordingSink>();
  auto app  = MakeApp(sink);

  auto current = app.sales->CurrentShift();
  assert(current.code == OutcomeCode::OK && current.value && !current.value->has_value());

  assert(app.sales->CloseShift(0, "").code == OutcomeCode::NoActiveShift);
  assert(app.sales->OpenShift(-1).code == OutcomeCode::Validation);

  auto opened = app.sales->OpenShift(5000);
  assert(opened.code == OutcomeCode::OK);
  assert(sink->delivered.size() == 1);

  auto closed = app.sales->CloseShift(5000, "quiet day");
  assert(closed.code == OutcomeCode::OK);
  assert(closed.value->difference == 0);
  assert(sink->delivered.size() == 2);
}

void TestForeignTenantDenied() {
  auto app       = MakeApp();
  auto draft     = Draft("X-1");
  draft.tenant_id = "shop-2";
  assert(app.inventory->AddProduct(draft).code == OutcomeCode::AccessDenied);

  auto mine = app.inventory->AddProduct(Draft("X-2")).value;
  mine->tenant_id = "shop-2";
  assert(app.inventory->UpdateProduct(*mine).code == OutcomeCode::AccessDenied);
}

void TestErrorMapping() {
  using stockroom::service::ToOutcomeCode;
  assert(ToOutcomeCode(stockroom::util::InvariantViolation("stock diverged")) == OutcomeCode::Internal);
  assert(ToOutcomeCode(stockroom::util::AccessDenied("foreign")) == OutcomeCode::AccessDenied);
  assert(ToOutcomeCode(stockroom::util::AlreadyExists("dup")) == OutcomeCode::Validation);
  assert(ToOutcomeCode(stockroom::util::Conflict("race")) == OutcomeCode::Conflict);
  assert(stockroom::util::OutcomeCodeName(OutcomeCode::Internal) == "internal");
}

void TestCodeNames() {
  assert(stockroom::util::OutcomeCodeName(OutcomeCode::NoActiveShift) == "no_active_shift");
  assert(stockroom::util::OutcomeCodeName(OutcomeCode::PreconditionFailed) == "precondition_failed");
}

} // namespace

int main() {
  TestSuccessCarriesValue();
  TestValidationAndNotFound();
  TestPreconditionFailed();
  TestShiftOutcomes();
  TestForeignTenantDenied();
  TestErrorMapping();
  TestCodeNames();

  std::cout << "stockroom_unit_service_outcome: pass\n";
  return 0;
}
