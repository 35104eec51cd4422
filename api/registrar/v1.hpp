#pragma once

#include "registrar/records/v1/report.pb.h"
#include "registrar/records/v1/types.pb.h"

#include "registrar/services/v1/registrar_admin_service.pb.h"
#include "registrar/services/v1/registrar_notification_service.pb.h"
#include "registrar/services/v1/registrar_records_service.pb.h"
#include "registrar/services/v1/registrar_report_service.pb.h"

#include "registrar/services/v1/registrar_admin_service.grpc.pb.h"
#include "registrar/services/v1/registrar_notification_service.grpc.pb.h"
#include "registrar/services/v1/registrar_records_service.grpc.pb.h"
#include "registrar/services/v1/registrar_report_service.grpc.pb.h"

namespace registrar::v1 {
using namespace ::registrar::records::v1;
using namespace ::registrar::services::v1;
}
