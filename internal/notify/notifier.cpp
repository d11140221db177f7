#include "notifier.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"
#include "internal/util/time.hpp"

namespace stockroom::notify {

void LogSink::Deliver(const model::Notification& notification) {
  STOCKROOM_LOG_INFO("notification", {observability::StringField("category", model::ToString(notification.category)),
                                      observability::StringField("message", notification.message),
                                      observability::StringField("related_id", notification.related_id)});
}

Notifier::Notifier(std::shared_ptr<db::Repository> repository, std::shared_ptr<NotificationSink> sink)
    : repository_(std::move(repository)), sink_(std::move(sink)) {
}

model::Notification Notifier::Emit(db::Transaction& tx, const std::string& tenant_id, model::NotificationCategory category, std::string message,
                                   std::string related_id) {
  model::Notification notification;
  notification.id         = util::PrefixedId("notif");
  notification.tenant_id  = tenant_id;
  notification.timestamp  = util::Now();
  notification.category   = category;
  notification.message    = std::move(message);
  notification.related_id = std::move(related_id);

  core::ThrowIfDbError(repository_->InsertNotification(tx, notification), "insert notification");

  if (sink_) {
    tx.OnCommit([sink = sink_, notification] {
      try {
        sink->Deliver(notification);
      } catch (const std::exception& ex) {
        // The transition is already durable; delivery is best effort.
        STOCKROOM_LOG_WARN("notification delivery failed",
                           {observability::StringField("notification_id", notification.id), observability::StringField("error", ex.what())});
      }
    });
  }
  return notification;
}

std::vector<model::Notification> Notifier::List(db::Transaction& tx, const std::string& tenant_id) {
  return repository_->ListNotifications(tx, tenant_id);
}

void Notifier::MarkRead(db::Transaction& tx, const std::string& tenant_id, const std::string& id) {
  for (auto& notification : repository_->ListNotifications(tx, tenant_id)) {
    if (notification.id != id) continue;
    if (notification.is_read) return;
    notification.is_read = true;
    core::ThrowIfDbError(repository_->UpdateNotification(tx, notification), "mark notification read");
    return;
  }
  throw util::NotFound("notification not found: " + id);
}

std::size_t Notifier::MarkAllRead(db::Transaction& tx, const std::string& tenant_id) {
  std::size_t changed = 0;
  for (auto& notification : repository_->ListNotifications(tx, tenant_id)) {
    if (notification.is_read) continue;
    notification.is_read = true;
    core::ThrowIfDbError(repository_->UpdateNotification(tx, notification), "mark notification read");
    ++changed;
  }
  return changed;
}

std::size_t Notifier::Prune(db::Transaction& tx, const std::string& tenant_id, int days) {
  if (days < 0) {
    throw util::ValidationError("days must be >= 0");
  }
  const auto cutoff = util::DaysBefore(util::Now(), days);

  std::vector<std::string> stale;
  for (const auto& notification : repository_->ListNotifications(tx, tenant_id)) {
    if (notification.timestamp < cutoff) stale.push_back(notification.id);
  }
  core::ThrowIfDbError(repository_->DeleteNotifications(tx, tenant_id, stale), "prune notifications");
  return stale.size();
}

} // namespace stockroom::notify
