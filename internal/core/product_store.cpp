#include "product_store.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/core/db_errors.hpp"
#include "internal/core/ledger_reason.hpp"
#include "internal/core/stock_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/identity.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"
#include "internal/util/time.hpp"

namespace stockroom::core {

namespace {

void ValidateDraft(const ProductDraft& draft) {
  if (draft.sku.empty()) {
    throw util::ValidationError("product sku is required");
  }
  if (draft.name.empty()) {
    throw util::ValidationError("product name is required");
  }
  if (draft.retail_price < 0 || draft.cost_price < 0) {
    throw util::ValidationError("product prices must be >= 0");
  }
  if (draft.low_stock_threshold && *draft.low_stock_threshold < 0) {
    throw util::ValidationError("low stock threshold must be >= 0");
  }
  for (const auto& variant : draft.variants) {
    if (variant.retail_price < 0 || variant.cost_price < 0) {
      throw util::ValidationError("variant prices must be >= 0");
    }
  }
  if (draft.opening_stock < 0) {
    throw util::ValidationError("opening stock must be >= 0");
  }
  if (draft.opening_stock != 0 && !draft.variants.empty()) {
    throw util::ValidationError("product " + draft.sku + " has variants; its stock comes from the variants");
  }
}

void AppendPriceChange(std::vector<model::PriceHistoryEntry>& history, model::PriceType type, model::Money old_value, model::Money new_value,
                       const identity::Actor& actor, util::TimePoint at) {
  if (old_value == new_value) return;
  model::PriceHistoryEntry entry;
  entry.date       = at;
  entry.price_type = type;
  entry.old_value  = old_value;
  entry.new_value  = new_value;
  entry.actor_id   = actor.id;
  entry.actor_name = actor.name;
  history.push_back(std::move(entry));
}

} // namespace

ProductStore::ProductStore(CoreContext ctx) : ctx_(std::move(ctx)) {
}

model::Product ProductStore::Insert(db::Transaction& tx, const std::string& tenant_id, const ProductDraft& draft) {
  RequireTenant(draft.tenant_id, tenant_id, "product");
  ValidateDraft(draft);

  if (ctx_.repository->FindProductBySku(tx, tenant_id, draft.sku)) {
    throw util::ValidationError("sku already exists: " + draft.sku);
  }

  model::Product product;
  product.id                  = draft.id.empty() ? util::PrefixedId("prod") : draft.id;
  product.tenant_id           = tenant_id;
  product.sku                 = draft.sku;
  product.name                = draft.name;
  product.retail_price        = draft.retail_price;
  product.cost_price          = draft.cost_price;
  product.low_stock_threshold = draft.low_stock_threshold.value_or(ctx_.settings.default_low_stock_threshold);
  product.variants            = draft.variants;
  product.category_ids        = draft.category_ids;
  product.created_at          = util::Now();
  product.updated_at          = product.created_at;

  for (auto& variant : product.variants) {
    if (variant.id.empty()) variant.id = util::PrefixedId("var");
    variant.price_history.clear();
  }
  product.stock = model::VariantStockSum(product);

  ThrowIfDbError(ctx_.repository->InsertProduct(tx, product), "insert product");
  return product;
}

model::Product ProductStore::AddProduct(const ProductDraft& draft) {
  if (draft.opening_stock != 0) {
    throw util::ValidationError("opening stock is only accepted on import; adjust stock after adding " + draft.sku);
  }
  auto tx      = ctx_.repository->Begin();
  auto product = Insert(*tx, ctx_.identity->TenantId(), draft);
  tx->Commit();

  STOCKROOM_LOG_INFO("product added", {observability::StringField("product_id", product.id), observability::StringField("sku", product.sku)});
  return product;
}

model::Product ProductStore::UpdateProduct(const model::Product& updated) {
  const auto tenant = ctx_.identity->TenantId();
  const auto actor  = ctx_.identity->CurrentActor();
  RequireTenant(updated.tenant_id, tenant, "product");

  if (updated.sku.empty() || updated.name.empty()) {
    throw util::ValidationError("product sku and name are required");
  }
  if (updated.retail_price < 0 || updated.cost_price < 0 || updated.low_stock_threshold < 0) {
    throw util::ValidationError("product prices and threshold must be >= 0");
  }

  auto       tx       = ctx_.repository->Begin();
  const auto existing = LoadProduct(*ctx_.repository, *tx, tenant, updated.id);

  if (updated.sku != existing.sku) {
    if (auto clash = ctx_.repository->FindProductBySku(*tx, tenant, updated.sku); clash && clash->id != existing.id) {
      throw util::ValidationError("sku already exists: " + updated.sku);
    }
  }

  // Variants leave only through IntegrityGuard::DeleteVariant.
  for (const auto& stored : existing.variants) {
    const bool kept = std::any_of(updated.variants.begin(), updated.variants.end(), [&](const model::Variant& v) { return v.id == stored.id; });
    if (!kept) {
      throw util::ValidationError("variant " + stored.id + " cannot be removed by an update; delete it instead");
    }
  }
  if (existing.variants.empty() && !updated.variants.empty() && existing.stock != 0) {
    throw util::PreconditionFailed("product " + existing.id + " has stock; bring it to 0 before adding variants");
  }

  const auto now = util::Now();

  model::Product next = existing;
  next.sku                 = updated.sku;
  next.name                = updated.name;
  next.low_stock_threshold = updated.low_stock_threshold;
  next.category_ids        = updated.category_ids;
  next.updated_at          = now;

  AppendPriceChange(next.price_history, model::PriceType::kRetail, existing.retail_price, updated.retail_price, actor, now);
  AppendPriceChange(next.price_history, model::PriceType::kCost, existing.cost_price, updated.cost_price, actor, now);
  next.retail_price = updated.retail_price;
  next.cost_price   = updated.cost_price;

  next.variants.clear();
  for (const auto& incoming : updated.variants) {
    if (incoming.retail_price < 0 || incoming.cost_price < 0) {
      throw util::ValidationError("variant prices must be >= 0");
    }
    const model::Variant* stored = incoming.id.empty() ? nullptr : model::FindVariant(existing, incoming.id);

    model::Variant variant = incoming;
    if (stored) {
      variant.stock         = stored->stock;
      variant.price_history = stored->price_history;
      AppendPriceChange(variant.price_history, model::PriceType::kRetail, stored->retail_price, incoming.retail_price, actor, now);
      AppendPriceChange(variant.price_history, model::PriceType::kCost, stored->cost_price, incoming.cost_price, actor, now);
    } else {
      if (variant.id.empty()) variant.id = util::PrefixedId("var");
      variant.stock = 0;
      variant.price_history.clear();
    }
    next.variants.push_back(std::move(variant));
  }
  model::RecomputeStock(next);

  ThrowIfDbError(ctx_.repository->UpdateProduct(*tx, next), "update product");
  tx->Commit();

  STOCKROOM_LOG_INFO("product updated", {observability::StringField("product_id", next.id),
                                         observability::IntField("price_history", static_cast<std::int64_t>(next.price_history.size()))});
  return next;
}

ImportResult ProductStore::ImportProducts(const std::vector<ProductDraft>& drafts) {
  const auto tenant = ctx_.identity->TenantId();

  ImportResult                    result;
  std::unordered_set<std::string> seen;
  StockLedger                     ledger(ctx_);

  auto tx = ctx_.repository->Begin();
  for (const auto& draft : drafts) {
    if (!seen.insert(draft.sku).second || ctx_.repository->FindProductBySku(*tx, tenant, draft.sku)) {
      result.skipped_skus.push_back(draft.sku);
      continue;
    }
    const auto product = Insert(*tx, tenant, draft);
    if (draft.opening_stock != 0) {
      StockChange change;
      change.product_id = product.id;
      change.new_level  = draft.opening_stock;
      change.reason     = std::string(kImportedReason);
      ledger.Apply(*tx, tenant, change);
    }
    result.imported_ids.push_back(product.id);
  }

  if (result.imported_ids.empty()) {
    throw util::ValidationError("no new products to import");
  }
  tx->Commit();

  STOCKROOM_LOG_INFO("products imported", {observability::IntField("imported", static_cast<std::int64_t>(result.imported_ids.size())),
                                           observability::IntField("skipped", static_cast<std::int64_t>(result.skipped_skus.size()))});
  return result;
}

std::size_t ProductStore::BulkUpdateCategories(const std::vector<std::string>& product_ids, const std::vector<std::string>& category_ids,
                                               CategoryUpdateMode mode) {
  const auto tenant = ctx_.identity->TenantId();

  std::size_t changed = 0;
  auto        tx      = ctx_.repository->Begin();
  for (const auto& id : product_ids) {
    auto product = ctx_.repository->GetProduct(*tx, tenant, id);
    if (!product) continue;

    auto next = product->category_ids;
    switch (mode) {
      case CategoryUpdateMode::kReplace:
        next = category_ids;
        break;
      case CategoryUpdateMode::kAdd:
        for (const auto& category : category_ids) {
          if (std::find(next.begin(), next.end(), category) == next.end()) next.push_back(category);
        }
        break;
      case CategoryUpdateMode::kRemove:
        next.erase(std::remove_if(next.begin(), next.end(),
                                  [&](const std::string& c) { return std::find(category_ids.begin(), category_ids.end(), c) != category_ids.end(); }),
                   next.end());
        break;
    }
    if (next == product->category_ids) continue;

    product->category_ids = std::move(next);
    product->updated_at   = util::Now();
    ThrowIfDbError(ctx_.repository->UpdateProduct(*tx, *product), "update product categories");
    ++changed;
  }
  tx->Commit();
  return changed;
}

std::vector<model::Product> ProductStore::ListProducts() {
  auto tx = ctx_.repository->Begin();
  return ctx_.repository->ListProducts(*tx, ctx_.identity->TenantId());
}

model::Product ProductStore::GetProduct(const std::string& id) {
  auto tx      = ctx_.repository->Begin();
  return LoadProduct(*ctx_.repository, *tx, ctx_.identity->TenantId(), id);
}

std::vector<model::Category> ProductStore::ListCategories() {
  auto tx = ctx_.repository->Begin();
  return ctx_.repository->ListCategories(*tx, ctx_.identity->TenantId());
}

std::string ProductStore::EnsureCategory(db::Transaction& tx, const std::string& tenant_id, const std::string& name) {
  for (const auto& category : ctx_.repository->ListCategories(tx, tenant_id)) {
    if (category.name == name) return category.id;
  }

  model::Category category;
  category.id        = util::PrefixedId("cat");
  category.tenant_id = tenant_id;
  category.name      = name;
  ThrowIfDbError(ctx_.repository->InsertCategory(tx, category), "insert category");
  return category.id;
}

} // namespace stockroom::core
