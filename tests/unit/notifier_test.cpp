#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/model/notification.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "test_support.hpp"

namespace {

using stockroom::model::NotificationCategory;
using stockroom::notify::Notifier;
using stockroom::testing::Fixture;
using stockroom::testing::Throws;

class ThrowingSink final : public stockroom::notify::NotificationSink {
 public:
  void Deliver(const stockroom::model::Notification&) override {
    throw std::runtime_error("sink offline");
  }
};

void TestDeliveredOnlyAfterCommit() {
  Fixture fx;

  {
    auto tx = fx.repository->Begin();
    fx.notifier->Emit(*tx, "shop-1", NotificationCategory::kStock, "rolled back", "prod_1");
  }
  assert(fx.sink->delivered.empty());
  assert(fx.Notifications().empty());

  auto tx = fx.repository->Begin();
  fx.notifier->Emit(*tx, "shop-1", NotificationCategory::kShift, "kept", "");
  assert(fx.sink->delivered.empty());
  tx->Commit();

  assert(fx.sink->delivered.size() == 1);
  assert(fx.sink->delivered[0].message == "kept");
  assert(fx.Notifications().size() == 1);
  assert(!fx.Notifications()[0].is_read);
}

void TestThrowingSinkKeepsCommit() {
  Fixture fx;
  Notifier notifier(fx.repository, std::make_shared<ThrowingSink>());

  auto tx = fx.repository->Begin();
  notifier.Emit(*tx, "shop-1", NotificationCategory::kPurchaseOrder, "PO #PO-ABC123 is now Received.", "po_1");
  tx->Commit();

  assert(fx.Notifications().size() == 1);
}

void TestMarkRead() {
  Fixture fx;

  std::string first_id;
  {
    auto tx  = fx.repository->Begin();
    first_id = fx.notifier->Emit(*tx, "shop-1", NotificationCategory::kStock, "one", "").id;
    fx.notifier->Emit(*tx, "shop-1", NotificationCategory::kStock, "two", "");
    fx.notifier->Emit(*tx, "shop-1", NotificationCategory::kStock, "three", "");
    tx->Commit();
  }

  {
    auto tx = fx.repository->Begin();
    fx.notifier->MarkRead(*tx, "shop-1", first_id);
    assert(Throws<stockroom::util::NotFound>([&] { fx.notifier->MarkRead(*tx, "shop-1", "notif_missing"); }));
    tx->Commit();
  }

  {
    auto tx = fx.repository->Begin();
    assert(fx.notifier->MarkAllRead(*tx, "shop-1") == 2);
    assert(fx.notifier->MarkAllRead(*tx, "shop-1") == 0);
    tx->Commit();
  }

  for (const auto& notification : fx.Notifications()) {
    assert(notification.is_read);
  }
}

void TestPruneRemovesOldRowsOnly() {
  Fixture fx;

  {
    auto tx = fx.repository->Begin();
    stockroom::model::Notification old;
    old.id        = "notif_old";
    old.tenant_id = "shop-1";
    old.timestamp = stockroom::util::DaysBefore(stockroom::util::Now(), 40);
    old.message   = "old";
    assert(static_cast<bool>(fx.repository->InsertNotification(*tx, old)));
    fx.notifier->Emit(*tx, "shop-1", NotificationCategory::kStock, "fresh", "");
    tx->Commit();
  }

  {
    auto tx = fx.repository->Begin();
    assert(Throws<stockroom::util::ValidationError>([&] { fx.notifier->Prune(*tx, "shop-1", -1); }));
    assert(fx.notifier->Prune(*tx, "shop-1", 30) == 1);
    tx->Commit();
  }

  const auto remaining = fx.Notifications();
  assert(remaining.size() == 1);
  assert(remaining[0].message == "fresh");
}

void TestOtherTenantInvisible() {
  Fixture fx;

  auto tx = fx.repository->Begin();
  const auto foreign = fx.notifier->Emit(*tx, "shop-2", NotificationCategory::kStock, "elsewhere", "");
  tx->Commit();

  assert(fx.Notifications().empty());

  auto mark = fx.repository->Begin();
  assert(Throws<stockroom::util::NotFound>([&] { fx.notifier->MarkRead(*mark, "shop-1", foreign.id); }));
}

} // namespace

int main() {
  TestDeliveredOnlyAfterCommit();
  TestThrowingSinkKeepsCommit();
  TestMarkRead();
  TestPruneRemovesOldRowsOnly();
  TestOtherTenantInvisible();

  std::cout << "stockroom_unit_notifier: pass\n";
  return 0;
}
