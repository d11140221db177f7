#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/types.hpp"

namespace stockroom::model {

struct VariantOption {
  std::string name;  // "Size"
  std::string value; // "XL"
};

struct Variant {
  std::string                    id;
  std::vector<VariantOption>     options;
  std::string                    sku;
  Quantity                       stock        = 0;
  Money                          cost_price   = 0;
  Money                          retail_price = 0;
  std::vector<PriceHistoryEntry> price_history;
};

/*
  Product aggregate.

  INVARIANT: when variants is non-empty, stock == sum(variant.stock).
  stock is derived and recomputed on every write (RecomputeStock); nothing
  sets it independently for a product with variants.
*/
struct Product {
  std::string id;
  std::string tenant_id;

  std::string sku;
  std::string name;
  Money       retail_price        = 0;
  Money       cost_price          = 0;
  Quantity    stock               = 0;
  Quantity    low_stock_threshold = 0;

  std::vector<PriceHistoryEntry> price_history; // append-only
  std::vector<Variant>           variants;
  std::vector<std::string>       category_ids;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};
};

struct Category {
  std::string                id;
  std::string                tenant_id;
  std::string                name;
  std::optional<std::string> parent_id;
};

inline Quantity VariantStockSum(const Product& product) {
  Quantity sum = 0;
  for (const auto& variant : product.variants) {
    sum += variant.stock;
  }
  return sum;
}

inline void RecomputeStock(Product& product) {
  if (!product.variants.empty()) {
    product.stock = VariantStockSum(product);
  }
}

// Own stock plus variant stock, as seen by the deletion guard.
inline Quantity TotalStock(const Product& product) {
  return product.variants.empty() ? product.stock : VariantStockSum(product);
}

inline Variant* FindVariant(Product& product, const std::string& variant_id) {
  for (auto& variant : product.variants) {
    if (variant.id == variant_id) return &variant;
  }
  return nullptr;
}

inline const Variant* FindVariant(const Product& product, const std::string& variant_id) {
  for (const auto& variant : product.variants) {
    if (variant.id == variant_id) return &variant;
  }
  return nullptr;
}

// "Shirt (Red / XL)"
inline std::string DisplayName(const Product& product, const Variant* variant) {
  if (!variant || variant->options.empty()) {
    return product.name;
  }
  std::string label = product.name + " (";
  for (std::size_t i = 0; i < variant->options.size(); ++i) {
    if (i > 0) label += " / ";
    label += variant->options[i].value;
  }
  return label + ")";
}

} // namespace stockroom::model
