#pragma once

#include <cstdint>
#include <memory>

namespace registrar::core {
class IdentityAllocator;
class RecordsCatalog;
class EnrollmentLedger;
class AttendanceRegister;
class GradeLedger;
class ReportAssembler;
class NotificationCenter;
}
namespace registrar::db { class Repository; }

namespace registrar::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<registrar::db::Repository> repository;
  std::shared_ptr<registrar::core::IdentityAllocator> allocator;
  std::shared_ptr<registrar::core::RecordsCatalog> catalog;
  std::shared_ptr<registrar::core::EnrollmentLedger> enrollments;
  std::shared_ptr<registrar::core::AttendanceRegister> attendance;
  std::shared_ptr<registrar::core::GradeLedger> grades;
  std::shared_ptr<registrar::core::ReportAssembler> reports;
  std::shared_ptr<registrar::core::NotificationCenter> notifications;
};

// Wires the core components over one repository.
ServiceContext BuildServiceContext(std::shared_ptr<registrar::db::Repository> repository, uint32_t max_allocation_retries);

}
