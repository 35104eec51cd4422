#include "notification_center.hpp"

#include "internal/core/record_mapping.hpp"
#include "internal/core/transaction_runner.hpp"
#include "internal/util/time.hpp"

namespace registrar::core {

using namespace registrar::records::v1;

NotificationCenter::NotificationCenter(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::optional<Notification> NotificationCenter::Notify(const std::string& user_id, const std::string& message, const std::string& type) {
  if (user_id.empty() || message.empty()) {
    return std::nullopt;
  }

  db::model::NotificationRecord record;
  record.user_id       = user_id;
  record.message       = message;
  record.type          = type;
  record.created_at_ms = util::ToUnixMillis(util::Now());

  const bool stored = RunInTransaction(*repository_, kDefaultTransactionAttempts, [&](db::Transaction& tx) {
    if (!repository_->GetStudent(tx, user_id)) {
      return false;
    }
    ThrowIfDbError(repository_->InsertNotification(tx, record), "insert notification", user_id);
    return true;
  });
  if (!stored) {
    return std::nullopt;
  }
  return ToNotification(record);
}

std::vector<Notification> NotificationCenter::List(const std::string& user_id, bool unread_only) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListNotifications(*tx, user_id, unread_only);
  tx->Commit();

  std::vector<Notification> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ToNotification(record));
  }
  return out;
}

uint64_t NotificationCenter::UnreadCount(const std::string& user_id) {
  auto tx     = repository_->Begin();
  auto unread = repository_->ListNotifications(*tx, user_id, true);
  tx->Commit();
  return unread.size();
}

uint64_t NotificationCenter::MarkAllRead(const std::string& user_id) {
  return RunInTransaction(*repository_, kDefaultTransactionAttempts, [&](db::Transaction& tx) {
    uint64_t updated = 0;
    ThrowIfDbError(repository_->MarkNotificationsRead(tx, user_id, updated), "mark notifications read", user_id);
    return updated;
  });
}

uint64_t NotificationCenter::ClearAll(const std::string& user_id) {
  return RunInTransaction(*repository_, kDefaultTransactionAttempts, [&](db::Transaction& tx) {
    uint64_t deleted = 0;
    ThrowIfDbError(repository_->DeleteNotifications(tx, user_id, deleted), "delete notifications", user_id);
    return deleted;
  });
}

} // namespace registrar::core
