#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "registrar/services/v1/registrar_notification_service.grpc.pb.h"
#include "internal/service/notification_service.hpp"

namespace registrar::grpc {

class NotificationServer final : public registrar::services::v1::RegistrarNotificationService::Service {
public:
  explicit NotificationServer(std::shared_ptr<registrar::service::NotificationService> svc);

  ::grpc::Status Notify(::grpc::ServerContext*,
                        const registrar::services::v1::NotifyRequest*,
                        registrar::services::v1::NotifyResponse*) override;

  ::grpc::Status ListNotifications(::grpc::ServerContext*,
                                   const registrar::services::v1::ListNotificationsRequest*,
                                   registrar::services::v1::ListNotificationsResponse*) override;

  ::grpc::Status MarkAllNotificationsRead(::grpc::ServerContext*,
                                          const registrar::services::v1::MarkAllNotificationsReadRequest*,
                                          registrar::services::v1::MarkAllNotificationsReadResponse*) override;

  ::grpc::Status ClearNotifications(::grpc::ServerContext*,
                                    const registrar::services::v1::ClearNotificationsRequest*,
                                    registrar::services::v1::ClearNotificationsResponse*) override;

private:
  std::shared_ptr<registrar::service::NotificationService> service_;
};

}
