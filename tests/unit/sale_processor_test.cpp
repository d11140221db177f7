#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/core/sale_processor.hpp"
#include "internal/core/shift_register.hpp"
#include "internal/core/stock_ledger.hpp"
#include "internal/model/deletion_record.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using stockroom::core::CartLine;
using stockroom::core::SaleProcessor;
using stockroom::core::SaleRequest;
using stockroom::core::ShiftRegister;
using stockroom::core::StockChange;
using stockroom::core::StockLedger;
using stockroom::model::LedgerSource;
using stockroom::model::Payment;
using stockroom::model::PaymentType;
using stockroom::model::SaleStatus;
using stockroom::model::SaleType;
using stockroom::testing::Fixture;
using stockroom::testing::Throws;
namespace tables = stockroom::model::tables;

CartLine Line(const stockroom::model::Product& product, stockroom::model::Quantity quantity,
              std::optional<std::string> original_sale_id = std::nullopt) {
  CartLine line;
  line.product_id       = product.id;
  line.quantity         = quantity;
  line.retail_price     = product.retail_price;
  line.original_sale_id = std::move(original_sale_id);
  return line;
}

SaleRequest Cart(std::vector<CartLine> lines, stockroom::model::Money cash = 0) {
  SaleRequest request;
  request.items = std::move(lines);
  if (cash != 0) request.payments.push_back(Payment{PaymentType::kCash, cash});
  return request;
}

void TestSaleMovesStockThroughLedger() {
  Fixture       fx;
  SaleProcessor sales(fx.ctx);
  const auto    product = fx.AddProduct("A-1", 10, 2, /*retail=*/1000, /*cost=*/600);

  const auto sale = sales.ProcessSale(Cart({Line(product, 3)}));
  assert(sale.type == SaleType::kSale);
  assert(sale.status == SaleStatus::kCompleted);
  assert(sale.public_ref.rfind("TRX-", 0) == 0 && sale.public_ref.size() == 12);
  assert(sale.total == 3000);
  assert(sale.cogs == 1800);
  assert(sale.profit == 1200);
  assert(sale.items[0].name == "Product A-1");
  assert(sale.items[0].cost_price == 600);
  assert(sale.cashier_id == "user-1");

  assert(fx.Product(product.id).stock == 7);

  std::vector<stockroom::model::StockAdjustment> sale_rows;
  for (const auto& row : fx.Ledger(product.id)) {
    if (row.source == LedgerSource::kSale) sale_rows.push_back(row);
  }
  assert(sale_rows.size() == 1);
  assert(sale_rows[0].quantity == -3);
  assert(sale_rows[0].source_id == sale.id);
  assert(sale_rows[0].reason == "Sale #" + sale.public_ref);

  assert(sales.ListSales().front().id == sale.id);
}

void TestPartialThenFullReturn() {
  Fixture       fx;
  SaleProcessor sales(fx.ctx);
  const auto    product = fx.AddProduct("A-1", 10);
  const auto    sale    = sales.ProcessSale(Cart({Line(product, 3)}));

  const auto first = sales.ProcessSale(Cart({Line(product, -2, sale.id)}));
  assert(first.type == SaleType::kReturn);
  assert(first.public_ref.rfind("RET-", 0) == 0);
  assert(first.original_sale_id == sale.id);
  assert(first.original_sale_public_ref == sale.public_ref);

  auto original = sales.GetSale(sale.id);
  assert(original.items[0].returned_quantity == 2);
  assert(original.status == SaleStatus::kPartiallyRefunded);

  sales.ProcessSale(Cart({Line(product, -1, sale.id)}));
  original = sales.GetSale(sale.id);
  assert(original.items[0].returned_quantity == 3);
  assert(original.status == SaleStatus::kRefunded);

  assert(fx.Product(product.id).stock == 10);

  const auto listed = sales.ListSales();
  assert(listed.size() == 3);
  assert(listed.back().id == sale.id);
}

void TestExchangeWithPositiveTotalIsSale() {
  Fixture       fx;
  SaleProcessor sales(fx.ctx);
  const auto    cheap  = fx.AddProduct("CHEAP", 10, 2, 500, 200);
  const auto    pricey = fx.AddProduct("PRICEY", 10, 2, 2000, 900);
  const auto    sale   = sales.ProcessSale(Cart({Line(cheap, 2)}));

  const auto exchange = sales.ProcessSale(Cart({Line(cheap, -1, sale.id), Line(pricey, 1)}));
  assert(exchange.type == SaleType::kSale);
  assert(exchange.total == 1500);
  assert(sales.GetSale(sale.id).status == SaleStatus::kPartiallyRefunded);
  assert(fx.Product(cheap.id).stock == 9);
  assert(fx.Product(pricey.id).stock == 9);
}

void TestCashIsRoutedToOpenShift() {
  Fixture       fx;
  SaleProcessor sales(fx.ctx);
  ShiftRegister shifts(fx.ctx);
  const auto    product = fx.AddProduct("A-1", 10);

  // Without an open shift nothing is tracked.
  const auto early = sales.ProcessSale(Cart({Line(product, 1)}, 1000));

  shifts.OpenShift(5000);
  const auto sale = sales.ProcessSale(Cart({Line(product, 2)}, 2000));
  sales.ProcessSale(Cart({Line(product, -1, sale.id)}, -1000));

  SaleRequest by_card = Cart({Line(product, 1)});
  by_card.payments.push_back(Payment{PaymentType::kCard, 1000});
  sales.ProcessSale(by_card);

  const auto shift = shifts.CurrentShift();
  assert(shift.has_value());
  assert(shift->cash_sales == 2000);
  assert(shift->cash_refunds == 1000);
  assert(early.status == SaleStatus::kCompleted);
}

void TestRejectedCartsChangeNothing() {
  Fixture       fx;
  SaleProcessor sales(fx.ctx);
  const auto    product = fx.AddProduct("A-1", 10);

  assert(Throws<stockroom::util::ValidationError>([&] { sales.ProcessSale(Cart({})); }));
  assert(Throws<stockroom::util::ValidationError>([&] { sales.ProcessSale(Cart({Line(product, 0)})); }));

  auto no_id       = Line(product, 1);
  no_id.product_id = "";
  assert(Throws<stockroom::util::ValidationError>([&] { sales.ProcessSale(Cart({no_id})); }));

  assert(Throws<stockroom::util::NotFound>([&] { sales.ProcessSale(Cart({Line(product, 2), Line(product, -1, std::string("sale_missing"))})); }));

  const auto other = fx.AddProduct("B-1", 10);
  const auto sale  = sales.ProcessSale(Cart({Line(product, 1)}));
  assert(Throws<stockroom::util::ValidationError>([&] { sales.ProcessSale(Cart({Line(other, -1, sale.id)})); }));
  assert(fx.Product(product.id).stock == 9);
  assert(sales.GetSale(sale.id).status == SaleStatus::kCompleted);

  // A return cannot itself be refunded.
  const auto refund = sales.ProcessSale(Cart({Line(product, -1, sale.id)}));
  assert(Throws<stockroom::util::ValidationError>([&] { sales.ProcessSale(Cart({Line(product, -1, refund.id)})); }));

  assert(fx.Product(product.id).stock == 10);
  assert(fx.Product(other.id).stock == 10);
  assert(sales.ListSales().size() == 2);
  assert(sales.GetSale(sale.id).status == SaleStatus::kRefunded);
}

void TestUnknownProductIsSoldWithoutStockMove() {
  Fixture       fx;
  SaleProcessor sales(fx.ctx);

  CartLine gone;
  gone.product_id   = "prod_gone";
  gone.name         = "Old Mug";
  gone.sku          = "OLD";
  gone.cost_price   = 300;
  gone.quantity     = 2;
  gone.retail_price = 800;

  const auto sale = sales.ProcessSale(Cart({gone}));
  assert(sale.total == 1600);
  assert(sale.cogs == 600);
  assert(sale.items[0].name == "Old Mug");
  assert(fx.Ledger().empty());
}

void TestDeleteSaleCascades() {
  Fixture       fx;
  SaleProcessor sales(fx.ctx);
  StockLedger   ledger(fx.ctx);
  const auto    product = fx.AddProduct("A-1", 20);

  const auto sale   = sales.ProcessSale(Cart({Line(product, 3)}));
  const auto refund = sales.ProcessSale(Cart({Line(product, -1, sale.id)}));
  const auto other  = sales.ProcessSale(Cart({Line(product, 1)}));

  // Legacy rows identify their sale by reason text only.
  for (const auto& reason : {"Sale #" + sale.public_ref, "Sale #" + sale.id, std::string("Sale #TRX-UNRELATED")}) {
    StockChange change;
    change.product_id = product.id;
    change.new_level  = fx.Product(product.id).stock - 1;
    change.reason     = reason;
    ledger.AdjustStock(change);
  }
  const auto rows_before = fx.Ledger(product.id).size(); // opening + 3 sales + 3 legacy
  assert(rows_before == 7);

  bool threw = false;
  try {
    sales.DeleteSale(refund.id);
  } catch (const stockroom::util::PreconditionFailed& ex) {
    threw = std::string(ex.what()) == "Delete the original sale transaction, not the return.";
  }
  assert(threw);

  assert(sales.DeleteSale(sale.id) == 2);

  const auto remaining = sales.ListSales();
  assert(remaining.size() == 1 && remaining[0].id == other.id);

  const auto rows = fx.Ledger(product.id);
  assert(rows.size() == 3);
  for (const auto& row : rows) {
    assert(row.source_id != sale.id && row.source_id != refund.id);
  }

  assert(fx.TombstoneCount(tables::kSales) == 2);
  assert(fx.TombstoneCount(tables::kStockAdjustments) == 4);
  assert(Throws<stockroom::util::NotFound>([&] { sales.DeleteSale(sale.id); }));
}

void TestForeignSaleIsAccessDenied() {
  Fixture       fx;
  const auto    product = fx.AddProduct("A-1", 5);
  const auto    sale    = SaleProcessor(fx.ctx).ProcessSale(Cart({Line(product, 2)}));
  SaleProcessor foreign(fx.TenantContext("shop-2"));

  assert(Throws<stockroom::util::AccessDenied>([&] { foreign.GetSale(sale.id); }));
  assert(Throws<stockroom::util::AccessDenied>([&] { foreign.DeleteSale(sale.id); }));
  assert(Throws<stockroom::util::AccessDenied>([&] { foreign.ProcessSale(Cart({Line(product, -1, sale.id)})); }));
  assert(Throws<stockroom::util::NotFound>([&] { foreign.GetSale("sale_missing"); }));

  assert(foreign.ListSales().empty());
  const auto stored = SaleProcessor(fx.ctx).GetSale(sale.id);
  assert(stored.status == SaleStatus::kCompleted && stored.items[0].returned_quantity == 0);
  assert(fx.Product(product.id).stock == 3);
}

void TestClearAndPruneSales() {
  Fixture       fx;
  SaleProcessor sales(fx.ctx);
  const auto    product = fx.AddProduct("A-1", 20);

  const auto refunded = sales.ProcessSale(Cart({Line(product, 1)}));
  sales.ProcessSale(Cart({Line(product, -1, refunded.id)}));
  const auto kept = sales.ProcessSale(Cart({Line(product, 1)}));

  assert(sales.PruneSales(1, std::nullopt) == 0);
  assert(Throws<stockroom::util::ValidationError>([&] { sales.PruneSales(-1, std::nullopt); }));

  assert(sales.ClearSales(std::vector<SaleStatus>{SaleStatus::kRefunded}) == 1);
  const auto remaining = sales.ListSales();
  assert(remaining.size() == 1 && remaining[0].id == kept.id);

  assert(sales.ClearSales(std::nullopt) == 1);
  assert(sales.ListSales().empty());
  assert(fx.TombstoneCount(tables::kSales) == 3);
}

} // namespace

int main() {
  TestSaleMovesStockThroughLedger();
  TestPartialThenFullReturn();
  TestExchangeWithPositiveTotalIsSale();
  TestCashIsRoutedToOpenShift();
  TestRejectedCartsChangeNothing();
  TestUnknownProductIsSoldWithoutStockMove();
  TestDeleteSaleCascades();
  TestForeignSaleIsAccessDenied();
  TestClearAndPruneSales();

  std::cout << "stockroom_unit_sale_processor: pass\n";
  return 0;
}
