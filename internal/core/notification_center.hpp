#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "registrar/records/v1/types.pb.h"

namespace registrar::core {

/*
  Per-user notices (enrollment confirmations, posted grades, ...).
*/
class NotificationCenter {
 public:
  explicit NotificationCenter(std::shared_ptr<db::Repository> repository);

  // Skipped (nullopt) when user_id or message is empty.
  // nullopt when user or message is empty, or no student has that id.
  std::optional<registrar::records::v1::Notification> Notify(const std::string& user_id, const std::string& message, const std::string& type);

  // Newest first.
  std::vector<registrar::records::v1::Notification> List(const std::string& user_id, bool unread_only);

  uint64_t UnreadCount(const std::string& user_id);

  uint64_t MarkAllRead(const std::string& user_id);
  uint64_t ClearAll(const std::string& user_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace registrar::core
