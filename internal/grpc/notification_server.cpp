#include "notification_server.hpp"

#include "grpc_error.hpp"
#include "registrar/v1.hpp"

namespace registrar::grpc {

NotificationServer::NotificationServer(std::shared_ptr<registrar::service::NotificationService> svc) : service_(std::move(svc)) {
}

::grpc::Status NotificationServer::Notify(::grpc::ServerContext*, const registrar::services::v1::NotifyRequest* req,
                                          registrar::services::v1::NotifyResponse* resp) {
  try {
    *resp = service_->Notify(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NotificationServer::ListNotifications(::grpc::ServerContext*, const registrar::services::v1::ListNotificationsRequest* req,
                                                     registrar::services::v1::ListNotificationsResponse* resp) {
  try {
    *resp = service_->ListNotifications(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NotificationServer::MarkAllNotificationsRead(::grpc::ServerContext*,
                                                            const registrar::services::v1::MarkAllNotificationsReadRequest* req,
                                                            registrar::services::v1::MarkAllNotificationsReadResponse* resp) {
  try {
    *resp = service_->MarkAllRead(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NotificationServer::ClearNotifications(::grpc::ServerContext*, const registrar::services::v1::ClearNotificationsRequest* req,
                                                      registrar::services::v1::ClearNotificationsResponse* resp) {
  try {
    *resp = service_->Clear(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace registrar::grpc
