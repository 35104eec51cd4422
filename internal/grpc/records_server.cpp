#include "records_server.hpp"
#include "capability_metadata.hpp"
#include "grpc_error.hpp"
#include "registrar/v1.hpp"

namespace registrar::grpc {

RecordsServer::RecordsServer(std::shared_ptr<registrar::service::RecordsService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RecordsServer::CreateStudent(::grpc::ServerContext* context,
                                const registrar::services::v1::CreateStudentRequest* req,
                                registrar::services::v1::CreateStudentResponse* resp) {
  try {
    *resp = service_->CreateStudent(CapabilitiesFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::GetStudent(::grpc::ServerContext*,
                                const registrar::services::v1::GetStudentRequest* req,
                                registrar::services::v1::GetStudentResponse* resp) {
  try {
    *resp = service_->GetStudent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::ListStudents(::grpc::ServerContext*,
                                const registrar::services::v1::ListStudentsRequest* req,
                                registrar::services::v1::ListStudentsResponse* resp) {
  try {
    *resp = service_->ListStudents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::DeleteStudent(::grpc::ServerContext* context,
                                const registrar::services::v1::DeleteStudentRequest* req,
                                google::protobuf::Empty*) {
  try {
    service_->DeleteStudent(CapabilitiesFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::CreateCourse(::grpc::ServerContext* context,
                                const registrar::services::v1::CreateCourseRequest* req,
                                registrar::services::v1::CreateCourseResponse* resp) {
  try {
    *resp = service_->CreateCourse(CapabilitiesFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::GetCourse(::grpc::ServerContext*,
                                const registrar::services::v1::GetCourseRequest* req,
                                registrar::services::v1::GetCourseResponse* resp) {
  try {
    *resp = service_->GetCourse(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::ListCourses(::grpc::ServerContext*,
                                const registrar::services::v1::ListCoursesRequest* req,
                                registrar::services::v1::ListCoursesResponse* resp) {
  try {
    *resp = service_->ListCourses(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::DeleteCourse(::grpc::ServerContext* context,
                                const registrar::services::v1::DeleteCourseRequest* req,
                                google::protobuf::Empty*) {
  try {
    service_->DeleteCourse(CapabilitiesFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::Enroll(::grpc::ServerContext* context,
                                const registrar::services::v1::EnrollRequest* req,
                                registrar::services::v1::EnrollResponse* resp) {
  try {
    *resp = service_->Enroll(CapabilitiesFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::ListEnrollments(::grpc::ServerContext*,
                                const registrar::services::v1::ListEnrollmentsRequest* req,
                                registrar::services::v1::ListEnrollmentsResponse* resp) {
  try {
    *resp = service_->ListEnrollments(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::DeleteEnrollment(::grpc::ServerContext* context,
                                const registrar::services::v1::DeleteEnrollmentRequest* req,
                                google::protobuf::Empty*) {
  try {
    service_->DeleteEnrollment(CapabilitiesFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::MarkAttendance(::grpc::ServerContext* context,
                                const registrar::services::v1::MarkAttendanceRequest* req,
                                registrar::services::v1::MarkAttendanceResponse* resp) {
  try {
    *resp = service_->MarkAttendance(CapabilitiesFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::GetAttendance(::grpc::ServerContext*,
                                const registrar::services::v1::GetAttendanceRequest* req,
                                registrar::services::v1::GetAttendanceResponse* resp) {
  try {
    *resp = service_->GetAttendance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::RecordGrade(::grpc::ServerContext* context,
                                const registrar::services::v1::RecordGradeRequest* req,
                                registrar::services::v1::RecordGradeResponse* resp) {
  try {
    *resp = service_->RecordGrade(CapabilitiesFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RecordsServer::GetGrade(::grpc::ServerContext*,
                                const registrar::services::v1::GetGradeRequest* req,
                                registrar::services::v1::GetGradeResponse* resp) {
  try {
    *resp = service_->GetGrade(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
