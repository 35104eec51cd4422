#include "admin_service.hpp"

#include "internal/db/api/repository.hpp"
#include "observe_rpc.hpp"
#include "registrar/v1.hpp"

namespace registrar::service {

using namespace registrar::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)), started_at_(std::chrono::steady_clock::now()) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", [&] {
    db::RecordCounts counts;
    {
      auto tx = ctx_.repository->Begin();
      counts  = ctx_.repository->CountRecords(*tx);
      tx->Commit();
    }

    StatsResponse resp;
    resp.set_students(counts.students);
    resp.set_courses(counts.courses);
    resp.set_enrollments(counts.enrollments);
    resp.set_attendance_records(counts.attendance_records);
    resp.set_grades(counts.grades);
    resp.set_notifications(counts.notifications);
    resp.set_storage_backend(ctx_.repository->BackendName());
    resp.set_uptime_seconds(static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_).count()));
    return resp;
  });
}

}
