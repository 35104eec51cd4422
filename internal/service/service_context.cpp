#include "service_context.hpp"

#include "internal/core/attendance_register.hpp"
#include "internal/core/enrollment_ledger.hpp"
#include "internal/core/grade_ledger.hpp"
#include "internal/core/identity_allocator.hpp"
#include "internal/core/notification_center.hpp"
#include "internal/core/records_catalog.hpp"
#include "internal/core/report_assembler.hpp"
#include "internal/db/api/repository.hpp"

namespace registrar::service {

ServiceContext BuildServiceContext(std::shared_ptr<registrar::db::Repository> repository, uint32_t max_allocation_retries) {
  ServiceContext ctx;
  ctx.repository    = repository;
  ctx.allocator     = std::make_shared<core::IdentityAllocator>(repository, max_allocation_retries);
  ctx.catalog       = std::make_shared<core::RecordsCatalog>(repository, ctx.allocator);
  ctx.enrollments   = std::make_shared<core::EnrollmentLedger>(repository);
  ctx.attendance    = std::make_shared<core::AttendanceRegister>(repository);
  ctx.grades        = std::make_shared<core::GradeLedger>(repository);
  ctx.reports       = std::make_shared<core::ReportAssembler>(repository);
  ctx.notifications = std::make_shared<core::NotificationCenter>(repository);
  return ctx;
}

}
