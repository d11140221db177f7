#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/notification.hpp"

namespace stockroom::notify {

// Receives notifications once the unit of work that raised them committed.
class NotificationSink {
 public:
  virtual ~NotificationSink() = default;

  virtual void Deliver(const model::Notification& notification) = 0;
};

// Writes delivered notifications to the "stockroom" logger.
class LogSink final : public NotificationSink {
 public:
  void Deliver(const model::Notification& notification) override;
};

/*
  Notification outbox.

  Emit() inserts the row inside the caller's transaction and registers a
  commit hook for delivery, so a rolled back transition never notifies.
  The remaining methods manage stored notifications.
*/
class Notifier {
 public:
  Notifier(std::shared_ptr<db::Repository> repository, std::shared_ptr<NotificationSink> sink);

  model::Notification Emit(db::Transaction& tx, const std::string& tenant_id, model::NotificationCategory category, std::string message,
                           std::string related_id);

  std::vector<model::Notification> List(db::Transaction& tx, const std::string& tenant_id);

  // NotFound when the id is unknown.
  void MarkRead(db::Transaction& tx, const std::string& tenant_id, const std::string& id);

  // Returns the number of rows that changed.
  std::size_t MarkAllRead(db::Transaction& tx, const std::string& tenant_id);

  // Deletes notifications older than `days`. Returns the number removed.
  std::size_t Prune(db::Transaction& tx, const std::string& tenant_id, int days);

 private:
  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<NotificationSink> sink_;
};

} // namespace stockroom::notify
