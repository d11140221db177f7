#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/core_context.hpp"
#include "internal/core/integrity_guard.hpp"
#include "internal/core/product_store.hpp"
#include "internal/core/purchase_orders.hpp"
#include "internal/core/sale_processor.hpp"
#include "internal/core/shift_register.hpp"
#include "internal/core/stock_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/identity/identity.hpp"
#include "internal/model/names.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/util/errors.hpp"

#if STOCKROOM_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if STOCKROOM_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using stockroom::db::Repository;
namespace core  = stockroom::core;
namespace model = stockroom::model;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<void(std::shared_ptr<Repository>&)> restart; // empty when the backend is volatile
  std::function<void()>                             cleanup;
};

core::CoreContext MakeContext(std::shared_ptr<Repository> repository, const std::string& tenant = "shop-1") {
  core::CoreContext ctx;
  ctx.repository = repository;
  ctx.identity   = std::make_shared<stockroom::identity::StaticIdentity>(tenant, stockroom::identity::Actor{"user-1", "Alex"});
  ctx.notifier   = std::make_shared<stockroom::notify::Notifier>(repository, nullptr);
  return ctx;
}

// Everything observable after the scenario, with generated ids left out.
struct Snapshot {
  std::vector<std::string> products;
  std::vector<std::string> ledger;
  std::vector<std::string> sales;
  std::vector<std::string> purchase_orders;
  std::vector<std::string> shifts;
  std::vector<std::string> notifications;
  std::vector<std::string> tombstones;

  bool operator==(const Snapshot&) const = default;
};

Snapshot Capture(const core::CoreContext& ctx) {
  Snapshot   snapshot;
  auto       tx     = ctx.repository->Begin();
  const auto tenant = ctx.identity->TenantId();

  for (const auto& product : ctx.repository->ListProducts(*tx, tenant)) {
    std::string row = product.sku + " stock=" + std::to_string(product.stock) + " prices=" + std::to_string(product.price_history.size());
    for (const auto& variant : product.variants) {
      row += " " + variant.sku + "=" + std::to_string(variant.stock);
    }
    row += " categories=" + std::to_string(product.category_ids.size());
    snapshot.products.push_back(row);
  }
  for (const auto& row : ctx.repository->ListAdjustments(*tx, tenant)) {
    // Sale and purchase order reasons embed the random public ref.
    snapshot.ledger.push_back(std::to_string(row.quantity) + " " + std::string(model::ToString(row.source)) +
                              (row.variant_id ? " variant" : ""));
  }
  for (const auto& sale : ctx.repository->ListSales(*tx, tenant)) {
    std::string row = sale.public_ref.substr(0, 4) + std::string(model::ToString(sale.status)) + " total=" + std::to_string(sale.total) +
                      " profit=" + std::to_string(sale.profit);
    for (const auto& line : sale.items) {
      row += " " + line.sku + "x" + std::to_string(line.quantity) + "/" + std::to_string(line.returned_quantity);
    }
    snapshot.sales.push_back(row);
  }
  for (const auto& po : ctx.repository->ListPurchaseOrders(*tx, tenant)) {
    std::string row = po.supplier_name + " " + std::string(model::ToString(po.status)) + " total=" + std::to_string(po.total_cost);
    for (const auto& line : po.items) {
      row += " " + std::to_string(line.quantity_received) + "/" + std::to_string(line.quantity_ordered);
    }
    snapshot.purchase_orders.push_back(row);
  }
  for (const auto& shift : ctx.repository->ListShifts(*tx, tenant)) {
    snapshot.shifts.push_back(std::string(model::ToString(shift.status)) + " sales=" + std::to_string(shift.cash_sales) +
                              " refunds=" + std::to_string(shift.cash_refunds) + " diff=" + std::to_string(shift.difference.value_or(0)));
  }
  for (const auto& notification : ctx.repository->ListNotifications(*tx, tenant)) {
    // Refs are random; keep the category and read flag.
    snapshot.notifications.push_back(std::string(model::ToString(notification.category)) + (notification.is_read ? " read" : " unread"));
  }
  for (const auto& record : ctx.repository->ListDeletionRecords(*tx, tenant)) {
    snapshot.tombstones.push_back(record.table);
  }

  // List order ties on created_at and falls back to random ids.
  for (auto* rows : {&snapshot.products, &snapshot.ledger, &snapshot.sales, &snapshot.purchase_orders, &snapshot.shifts,
                     &snapshot.notifications, &snapshot.tombstones}) {
    std::sort(rows->begin(), rows->end());
  }
  return snapshot;
}

model::Payment Cash(model::Money amount) {
  model::Payment payment;
  payment.type   = model::PaymentType::kCash;
  payment.amount = amount;
  return payment;
}

void RunScenario(const core::CoreContext& ctx) {
  core::ProductStore   products(ctx);
  core::StockLedger    ledger(ctx);
  core::SaleProcessor  sales(ctx);
  core::PurchaseOrders orders(ctx);
  core::ShiftRegister  shifts(ctx);
  core::IntegrityGuard guard(ctx);

  core::ProductDraft mug;
  mug.sku          = "MUG";
  mug.name         = "Mug";
  mug.retail_price = 900;
  mug.cost_price   = 300;
  auto mug_product = products.AddProduct(mug);

  core::ProductDraft tee;
  tee.sku          = "TEE";
  tee.name         = "Tee";
  tee.retail_price = 2000;
  tee.cost_price   = 800;
  for (const char* size : {"S", "M"}) {
    model::Variant variant;
    variant.options      = {{"Size", size}};
    variant.sku          = std::string("TEE-") + size;
    variant.stock        = 4;
    variant.retail_price = 2000;
    variant.cost_price   = 800;
    tee.variants.push_back(variant);
  }
  {
    auto tx          = ctx.repository->Begin();
    tee.category_ids = {products.EnsureCategory(*tx, ctx.identity->TenantId(), "Apparel")};
    tx->Commit();
  }
  auto tee_product = products.AddProduct(tee);

  core::StockChange opening;
  opening.product_id = mug_product.id;
  opening.new_level  = 10;
  opening.reason     = "Opening stock";
  ledger.AdjustStock(opening);

  auto repriced         = products.GetProduct(mug_product.id);
  repriced.retail_price = 1000;
  products.UpdateProduct(repriced);

  shifts.OpenShift(5000);

  core::CartLine mug_line;
  mug_line.product_id   = mug_product.id;
  mug_line.quantity     = 3;
  mug_line.retail_price = 1000;
  core::CartLine tee_line;
  tee_line.product_id   = tee_product.id;
  tee_line.variant_id   = tee_product.variants[0].id;
  tee_line.quantity     = 2;
  tee_line.retail_price = 2000;
  auto sale             = sales.ProcessSale({{mug_line, tee_line}, {Cash(7000)}});

  auto refund             = mug_line;
  refund.quantity         = -1;
  refund.original_sale_id = sale.id;
  sales.ProcessSale({{refund}, {Cash(-1000)}});

  core::PurchaseOrderDraft draft;
  draft.supplier_name = "Acme";
  model::PurchaseOrderLine po_line;
  po_line.product_id = tee_product.id;
  po_line.variant_id = tee_product.variants[1].id;
  po_line.quantity_ordered = 6;
  po_line.cost_price       = 700;
  draft.items              = {po_line};
  auto po                  = orders.AddPurchaseOrder(draft);
  orders.ReceiveItems(po.id, {{tee_product.id, tee_product.variants[1].id, 2}});

  shifts.CloseShift(11000, "");

  core::ProductDraft cup;
  cup.sku           = "CUP";
  cup.name          = "Cup";
  cup.retail_price  = 500;
  cup.opening_stock = 7;
  products.ImportProducts({cup, mug});

  guard.DeleteVariant(tee_product.id, tee_product.variants[0].id, /*force=*/true);
  guard.DeleteProduct(mug_product.id, /*force=*/true);
  guard.RestoreDeletedProducts(sales.GetSale(sale.id).items);
}

bool Denied(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const stockroom::util::AccessDenied&) {
    return true;
  }
  return false;
}

void VerifyTenantIsolation(const std::shared_ptr<Repository>& repository) {
  auto other = MakeContext(repository, "shop-2");
  assert(core::ProductStore(other).ListProducts().empty());
  assert(core::SaleProcessor(other).ListSales().empty());

  auto ctx      = MakeContext(repository);
  auto products = core::ProductStore(ctx).ListProducts();
  assert(!products.empty());
  assert(Denied([&] { core::ProductStore(other).GetProduct(products.front().id); }));
  assert(Denied([&] { core::SaleProcessor(other).GetSale(core::SaleProcessor(ctx).ListSales().front().id); }));
  assert(Denied([&] { core::PurchaseOrders(other).GetPurchaseOrder(core::PurchaseOrders(ctx).ListPurchaseOrders().front().id); }));

  bool missing = false;
  try {
    core::ProductStore(other).GetProduct("prod_missing");
  } catch (const stockroom::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void VerifyRollbackLeavesNothing(const std::shared_ptr<Repository>& repository) {
  auto ctx    = MakeContext(repository);
  auto before = Capture(ctx);

  core::CartLine line;
  line.product_id       = "prod_unknown";
  line.quantity         = -1;
  line.original_sale_id = "sale_missing";
  bool threw            = false;
  try {
    core::SaleProcessor(ctx).ProcessSale({{line}, {Cash(-100)}});
  } catch (const stockroom::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(Capture(ctx) == before);
}

std::vector<BackendFactory> Backends() {
  std::vector<BackendFactory> backends;
  backends.push_back({"memory", [] { return std::make_shared<stockroom::db::memory::MemoryRepository>(); }, nullptr, [] {}});

#if STOCKROOM_DB_SQLITE
  const auto path = std::filesystem::temp_directory_path() / "stockroom_repository_parity.db";
  std::filesystem::remove(path);
  auto open = [path] {
    auto db = std::make_shared<stockroom::db::sqlite::SqliteDB>(path.string());
    db->EnsureSchema();
    return std::static_pointer_cast<Repository>(std::make_shared<stockroom::db::sqlite::SqliteRepository>(db));
  };
  backends.push_back({"sqlite", open,
                      [open](std::shared_ptr<Repository>& repository) {
                        repository.reset();
                        repository = open();
                      },
                      [path] {
                        std::filesystem::remove(path);
                        std::filesystem::remove(path.string() + "-wal");
                        std::filesystem::remove(path.string() + "-shm");
                      }});
#endif

#if STOCKROOM_DB_POSTGRES
  const char* uri = std::getenv("STOCKROOM_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    std::cout << "skipping postgres parity: STOCKROOM_TEST_POSTGRES_URI is not set\n";
  } else {
    const std::string conninfo = uri;
    auto              open     = [conninfo] {
      auto pool = std::make_shared<stockroom::db::postgres::PgPool>(conninfo, 4);
      pool->EnsureSchema();
      return pool;
    };
    auto wipe = [open] {
      auto       pool = open();
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      tx.exec(
          "TRUNCATE products, product_variants, variant_options, price_history, product_categories, categories, stock_adjustments, sales, "
          "sale_items, sale_item_options, sale_payments, purchase_orders, purchase_order_items, shifts, notifications, deletion_records;");
      tx.commit();
      return pool;
    };
    backends.push_back({"postgres",
                        [wipe] { return std::static_pointer_cast<Repository>(std::make_shared<stockroom::db::postgres::PgRepository>(wipe())); },
                        [open](std::shared_ptr<Repository>& repository) {
                          repository.reset();
                          repository = std::make_shared<stockroom::db::postgres::PgRepository>(open());
                        },
                        [] {}});
  }
#endif
  return backends;
}

} // namespace

int main() {
  std::optional<Snapshot> reference;

  for (const auto& backend : Backends()) {
    auto repository = backend.make_repository();
    auto ctx        = MakeContext(repository);

    RunScenario(ctx);
    const auto snapshot = Capture(ctx);

    assert(snapshot.products.size() == 2);
    assert(snapshot.sales.size() == 2);
    assert(snapshot.shifts.size() == 1);
    assert(snapshot.tombstones.size() >= 3);

    if (!reference) {
      reference = snapshot;
    } else {
      assert(snapshot == *reference && "backends disagree");
    }

    VerifyTenantIsolation(repository);
    VerifyRollbackLeavesNothing(repository);

    if (backend.restart) {
      backend.restart(repository);
      assert(Capture(MakeContext(repository)) == snapshot);
    }

    backend.cleanup();
    std::cout << "stockroom_integration_repository_parity[" << backend.name << "]: pass\n";
  }
  return 0;
}
