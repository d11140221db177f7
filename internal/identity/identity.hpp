#pragma once

#include <string>
#include <utility>

namespace stockroom::identity {

struct Actor {
  std::string id;
  std::string name;
};

/*
  Supplies the tenant scope and acting user for every operation.

  Authentication happens outside the core; an implementation only reports
  who is already signed in.
*/
class IdentityProvider {
 public:
  virtual ~IdentityProvider() = default;

  virtual std::string TenantId() const     = 0;
  virtual Actor       CurrentActor() const = 0;
};

class StaticIdentity final : public IdentityProvider {
 public:
  StaticIdentity(std::string tenant_id, Actor actor) : tenant_id_(std::move(tenant_id)), actor_(std::move(actor)) {
  }

  std::string TenantId() const override {
    return tenant_id_;
  }

  Actor CurrentActor() const override {
    return actor_;
  }

 private:
  std::string tenant_id_;
  Actor       actor_;
};

} // namespace stockroom::identity
