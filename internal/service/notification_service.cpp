#include "notification_service.hpp"

#include "internal/core/notification_center.hpp"
#include "internal/observability/logging.hpp"
#include "observe_rpc.hpp"
#include "registrar/v1.hpp"

namespace registrar::service {

using namespace registrar::v1;

NotificationService::NotificationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

NotifyResponse NotificationService::Notify(const NotifyRequest& req) {
  return ObserveRpc("NotificationService.Notify", [&] {
    NotifyResponse resp;
    if (auto notification = ctx_.notifications->Notify(req.user_id(), req.message(), req.type())) {
      resp.set_created(true);
      *resp.mutable_notification() = std::move(*notification);
    } else if (!req.user_id().empty() && !req.message().empty()) {
      REGISTRAR_LOG_WARN("notification skipped, no such student", {observability::StringField("user_id", req.user_id())});
    }
    return resp;
  });
}

ListNotificationsResponse NotificationService::ListNotifications(const ListNotificationsRequest& req) {
  return ObserveRpc("NotificationService.ListNotifications", [&] {
    ListNotificationsResponse resp;
    for (auto& notification : ctx_.notifications->List(req.user_id(), req.unread_only())) {
      *resp.add_notifications() = std::move(notification);
    }
    resp.set_unread_count(ctx_.notifications->UnreadCount(req.user_id()));
    return resp;
  });
}

MarkAllNotificationsReadResponse NotificationService::MarkAllRead(const MarkAllNotificationsReadRequest& req) {
  return ObserveRpc("NotificationService.MarkAllRead", [&] {
    MarkAllNotificationsReadResponse resp;
    resp.set_updated(ctx_.notifications->MarkAllRead(req.user_id()));
    return resp;
  });
}

ClearNotificationsResponse NotificationService::Clear(const ClearNotificationsRequest& req) {
  return ObserveRpc("NotificationService.Clear", [&] {
    ClearNotificationsResponse resp;
    resp.set_deleted(ctx_.notifications->ClearAll(req.user_id()));
    return resp;
  });
}

}
