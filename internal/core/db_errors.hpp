#pragma once

#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/result.hpp"

namespace stockroom::core {

// Translates a repository Result into the util exception hierarchy.
void ThrowIfDbError(const db::Result& result, const std::string& context);

// AccessDenied when an entity handed in by the caller belongs to another
// tenant. An empty entity tenant means "not yet assigned".
void RequireTenant(const std::string& entity_tenant, const std::string& tenant_id, const std::string& what);

// Loads an entity addressed by id. An id owned by another tenant is
// AccessDenied; an id nobody owns is NotFound.
model::Product       LoadProduct(db::Repository& repository, db::Transaction& tx, const std::string& tenant_id, const std::string& id);
model::Sale          LoadSale(db::Repository& repository, db::Transaction& tx, const std::string& tenant_id, const std::string& id);
model::PurchaseOrder LoadPurchaseOrder(db::Repository& repository, db::Transaction& tx, const std::string& tenant_id, const std::string& id);

} // namespace stockroom::core
