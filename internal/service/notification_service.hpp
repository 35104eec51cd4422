#pragma once

#include "registrar/services/v1/registrar_notification_service.pb.h"
#include "service_context.hpp"

namespace registrar::service {

class NotificationService {
public:
  explicit NotificationService(ServiceContext ctx);

  registrar::services::v1::NotifyResponse
  Notify(const registrar::services::v1::NotifyRequest& req);

  registrar::services::v1::ListNotificationsResponse
  ListNotifications(const registrar::services::v1::ListNotificationsRequest& req);

  registrar::services::v1::MarkAllNotificationsReadResponse
  MarkAllRead(const registrar::services::v1::MarkAllNotificationsReadRequest& req);

  registrar::services::v1::ClearNotificationsResponse
  Clear(const registrar::services::v1::ClearNotificationsRequest& req);

private:
  ServiceContext ctx_;
};

}
