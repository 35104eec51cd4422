#pragma once

#include <chrono>

#include "registrar/services/v1/registrar_admin_service.pb.h"
#include "service_context.hpp"

namespace registrar::service {

// Read-only operator view: record counts per table, the storage backend
// in use and the time since this service was constructed.
class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  registrar::services::v1::StatsResponse Stats(const registrar::services::v1::StatsRequest& req);

private:
  ServiceContext                        ctx_;
  std::chrono::steady_clock::time_point started_at_;
};

}
