#include "db_errors.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"

namespace stockroom::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (result.Retryable()) {
    throw util::Conflict(message);
  }
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(message + " (" + std::string(db::ErrorCodeName(result.code)) + ")");
  }
}

void RequireTenant(const std::string& entity_tenant, const std::string& tenant_id, const std::string& what) {
  if (!entity_tenant.empty() && entity_tenant != tenant_id) {
    throw util::AccessDenied(what + " belongs to another tenant");
  }
}

namespace {

[[noreturn]] void ThrowMissing(const std::optional<std::string>& owner, const std::string& tenant_id, const std::string& what,
                               const std::string& id) {
  if (owner) {
    RequireTenant(*owner, tenant_id, what + " " + id);
  }
  throw util::NotFound(what + " not found: " + id);
}

} // namespace

model::Product LoadProduct(db::Repository& repository, db::Transaction& tx, const std::string& tenant_id, const std::string& id) {
  auto product = repository.GetProduct(tx, tenant_id, id);
  if (!product) ThrowMissing(repository.ProductTenant(tx, id), tenant_id, "product", id);
  return std::move(*product);
}

model::Sale LoadSale(db::Repository& repository, db::Transaction& tx, const std::string& tenant_id, const std::string& id) {
  auto sale = repository.GetSale(tx, tenant_id, id);
  if (!sale) ThrowMissing(repository.SaleTenant(tx, id), tenant_id, "sale", id);
  return std::move(*sale);
}

model::PurchaseOrder LoadPurchaseOrder(db::Repository& repository, db::Transaction& tx, const std::string& tenant_id, const std::string& id) {
  auto po = repository.GetPurchaseOrder(tx, tenant_id, id);
  if (!po) ThrowMissing(repository.PurchaseOrderTenant(tx, id), tenant_id, "purchase order", id);
  return std::move(*po);
}

} // namespace stockroom::core
