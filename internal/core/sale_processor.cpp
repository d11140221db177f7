#include "sale_processor.hpp"

#include <algorithm>
#include <iterator>
#include <map>

#include "internal/core/db_errors.hpp"
#include "internal/core/deletion_plan.hpp"
#include "internal/core/ledger_reason.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/identity.hpp"
#include "internal/model/deletion_record.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"
#include "internal/util/time.hpp"

namespace stockroom::core {

namespace {

constexpr std::size_t kSaleRefSize = 8;

// Snapshot of the line as the store knows it now. `product` is empty when
// the product was deleted; the cart's own description is kept then.
model::SaleLine Snapshot(const CartLine& line, const std::optional<model::Product>& product) {
  model::SaleLine out;
  out.product_id       = line.product_id;
  out.variant_id       = line.variant_id;
  out.name             = line.name;
  out.sku              = line.sku;
  out.quantity         = line.quantity;
  out.cost_price       = line.cost_price;
  out.retail_price     = line.retail_price;
  out.original_sale_id = line.original_sale_id;

  if (!product) return out;

  out.name       = product->name;
  out.sku        = product->sku;
  out.cost_price = product->cost_price;
  if (line.variant_id) {
    if (const auto* variant = model::FindVariant(*product, *line.variant_id)) {
      if (!variant->sku.empty()) out.sku = variant->sku;
      out.cost_price      = variant->cost_price;
      out.variant_options = variant->options;
    }
  }
  return out;
}

bool Tracked(const CartLine& line, const std::optional<model::Product>& product) {
  if (!product) return false;
  return !line.variant_id || model::FindVariant(*product, *line.variant_id) != nullptr;
}

bool StatusSelected(const model::Sale& sale, const std::optional<std::vector<model::SaleStatus>>& statuses) {
  if (sale.type != model::SaleType::kSale) return false;
  if (!statuses) return true;
  return std::find(statuses->begin(), statuses->end(), sale.status) != statuses->end();
}

} // namespace

SaleProcessor::SaleProcessor(CoreContext ctx) : ctx_(ctx), ledger_(ctx), shifts_(ctx) {
}

void SaleProcessor::Validate(const SaleRequest& request) const {
  if (request.items.empty()) {
    throw util::ValidationError("cart is empty");
  }
  for (const auto& line : request.items) {
    if (line.product_id.empty()) {
      throw util::ValidationError("cart line without product id");
    }
    if (line.quantity == 0) {
      throw util::ValidationError("cart line for " + line.product_id + " has quantity 0");
    }
    if (line.retail_price < 0 || line.cost_price < 0) {
      throw util::ValidationError("cart line for " + line.product_id + " has a negative price");
    }
    if (line.original_sale_id && line.quantity > 0) {
      throw util::ValidationError("only return lines may reference an original sale");
    }
  }
}

model::Sale SaleProcessor::ProcessSale(const SaleRequest& request) {
  Validate(request);

  const auto tenant = ctx_.identity->TenantId();
  const auto actor  = ctx_.identity->CurrentActor();

  auto tx = ctx_.repository->Begin();

  model::Sale sale;
  sale.id         = util::PrefixedId("sale");
  sale.tenant_id  = tenant;
  sale.date       = util::Now();
  sale.payments   = request.payments;
  sale.cashier_id = actor.id;
  sale.status     = model::SaleStatus::kCompleted;

  std::vector<bool> tracked;
  for (const auto& line : request.items) {
    auto product = ctx_.repository->GetProduct(*tx, tenant, line.product_id);
    tracked.push_back(Tracked(line, product));
    sale.items.push_back(Snapshot(line, product));
  }

  for (const auto& item : sale.items) {
    sale.total += item.quantity * item.retail_price;
    sale.cogs += item.quantity * item.cost_price;
  }
  sale.profit = sale.total - sale.cogs;
  sale.type   = sale.total >= 0 ? model::SaleType::kSale : model::SaleType::kReturn;

  const auto prefix = sale.type == model::SaleType::kSale ? "TRX-" : "RET-";
  sale.public_ref   = util::GenerateUniquePublicRef(prefix, kSaleRefSize, [&](const std::string& ref) {
    return ctx_.repository->FindSaleByPublicRef(*tx, tenant, ref).has_value();
  });

  // Refund bookkeeping first: it can still reject the request.
  ApplyReturns(*tx, tenant, sale);

  for (std::size_t i = 0; i < sale.items.size(); ++i) {
    const auto& item = sale.items[i];
    if (!tracked[i]) {
      STOCKROOM_LOG_WARN("sale line for unknown product; stock unchanged",
                         {observability::StringField("sale_ref", sale.public_ref), observability::StringField("product_id", item.product_id),
                          observability::StringField("variant_id", item.variant_id.value_or(""))});
      continue;
    }
    ledger_.Move(*tx, tenant, item.product_id, item.variant_id, -item.quantity, SaleReason(sale.public_ref), model::LedgerSource::kSale, sale.id);
  }

  shifts_.RecordCash(*tx, tenant, model::CashAmount(sale));

  ThrowIfDbError(ctx_.repository->InsertSale(*tx, sale), "insert sale");
  tx->Commit();

  observability::Metrics::Instance().RecordSale(model::ToString(sale.type), sale.total);

  STOCKROOM_LOG_INFO("sale processed", {observability::StringField("sale_id", sale.id), observability::StringField("sale_ref", sale.public_ref),
                                        observability::StringField("type", model::ToString(sale.type)), observability::IntField("total", sale.total),
                                        observability::IntField("lines", static_cast<std::int64_t>(sale.items.size()))});
  return sale;
}

void SaleProcessor::ApplyReturns(db::Transaction& tx, const std::string& tenant_id, model::Sale& sale) {
  std::map<std::string, std::vector<const model::SaleLine*>> by_original;
  for (const auto& item : sale.items) {
    if (item.quantity < 0 && item.original_sale_id) {
      by_original[*item.original_sale_id].push_back(&item);
    }
  }

  for (const auto& [original_id, lines] : by_original) {
    auto original = LoadSale(*ctx_.repository, tx, tenant_id, original_id);
    if (original.type != model::SaleType::kSale) {
      throw util::ValidationError("sale " + original_id + " is a return and cannot be refunded");
    }

    for (const auto* line : lines) {
      auto it = std::find_if(original.items.begin(), original.items.end(), [&](const model::SaleLine& candidate) {
        return candidate.quantity > 0 && model::SameTarget(candidate, line->product_id, line->variant_id);
      });
      if (it == original.items.end()) {
        throw util::ValidationError("product " + line->product_id + " was not sold in " + original_id);
      }
      it->returned_quantity += -line->quantity;
    }

    const auto before = original.status;
    original.status   = model::DeriveRefundStatus(original);
    ThrowIfDbError(ctx_.repository->UpdateSale(tx, original), "update refunded sale");

    if (original.status != before) {
      STOCKROOM_LOG_INFO("sale refund status changed", {observability::StringField("sale_id", original.id),
                                                        observability::StringField("status", model::ToString(original.status))});
    }

    if (by_original.size() == 1) {
      sale.original_sale_id         = original.id;
      sale.original_sale_public_ref = original.public_ref;
    }
  }
}

void SaleProcessor::PlanCascade(const std::vector<model::Sale>& sales, const std::vector<model::Sale>& all_sales,
                                const std::vector<model::StockAdjustment>& ledger, DeletionPlan& plan) {
  std::vector<const model::Sale*> doomed;
  for (const auto& sale : sales) {
    doomed.push_back(&sale);
    for (const auto& candidate : all_sales) {
      if (candidate.id != sale.id && candidate.type == model::SaleType::kReturn && model::ReferencesSale(candidate, sale.id)) {
        doomed.push_back(&candidate);
      }
    }
  }

  for (const auto* sale : doomed) {
    plan.RemoveSale(sale->id);
    for (const auto& row : ledger) {
      if (BelongsToSale(row, *sale)) plan.RemoveAdjustment(row.id);
    }
  }
}

std::size_t SaleProcessor::DeleteSale(const std::string& sale_id) {
  const auto tenant = ctx_.identity->TenantId();

  auto       tx   = ctx_.repository->Begin();
  const auto sale = LoadSale(*ctx_.repository, *tx, tenant, sale_id);
  if (sale.type == model::SaleType::kReturn) {
    throw util::PreconditionFailed("Delete the original sale transaction, not the return.");
  }

  DeletionPlan plan(ctx_.repository, tenant);
  PlanCascade({sale}, ctx_.repository->ListSales(*tx, tenant), ctx_.repository->ListAdjustments(*tx, tenant), plan);
  plan.Execute(*tx);
  tx->Commit();

  const auto removed = plan.Count(model::tables::kSales);
  STOCKROOM_LOG_INFO("sale deleted", {observability::StringField("sale_id", sale_id), observability::IntField("sales", static_cast<std::int64_t>(removed)),
                                      observability::IntField("ledger_rows", static_cast<std::int64_t>(plan.Count(model::tables::kStockAdjustments)))});
  return removed;
}

std::size_t SaleProcessor::DeleteMatching(const std::function<bool(const model::Sale&)>& selected) {
  const auto tenant = ctx_.identity->TenantId();

  auto       tx        = ctx_.repository->Begin();
  const auto all_sales = ctx_.repository->ListSales(*tx, tenant);

  std::vector<model::Sale> chosen;
  std::copy_if(all_sales.begin(), all_sales.end(), std::back_inserter(chosen), selected);
  if (chosen.empty()) return 0;

  DeletionPlan plan(ctx_.repository, tenant);
  PlanCascade(chosen, all_sales, ctx_.repository->ListAdjustments(*tx, tenant), plan);
  plan.Execute(*tx);
  tx->Commit();

  STOCKROOM_LOG_INFO("sales cleared", {observability::IntField("sales", static_cast<std::int64_t>(chosen.size())),
                                       observability::IntField("rows", static_cast<std::int64_t>(plan.Count(model::tables::kSales)))});
  return chosen.size();
}

std::size_t SaleProcessor::ClearSales(const std::optional<std::vector<model::SaleStatus>>& statuses) {
  return DeleteMatching([&](const model::Sale& sale) { return StatusSelected(sale, statuses); });
}

std::size_t SaleProcessor::PruneSales(int days, const std::optional<std::vector<model::SaleStatus>>& statuses) {
  if (days < 0) {
    throw util::ValidationError("days must be >= 0");
  }
  const auto cutoff = util::DaysBefore(util::Now(), days);
  return DeleteMatching([&](const model::Sale& sale) { return sale.date < cutoff && StatusSelected(sale, statuses); });
}

std::vector<model::Sale> SaleProcessor::ListSales() {
  auto tx = ctx_.repository->Begin();
  return ctx_.repository->ListSales(*tx, ctx_.identity->TenantId());
}

model::Sale SaleProcessor::GetSale(const std::string& sale_id) {
  auto tx   = ctx_.repository->Begin();
  return LoadSale(*ctx_.repository, *tx, ctx_.identity->TenantId(), sale_id);
}

} // namespace stockroom::core
