#pragma once

#include "internal/db/model/attendance_record.hpp"
#include "internal/db/model/course_record.hpp"
#include "internal/db/model/enrollment_record.hpp"
#include "internal/db/model/grade_record.hpp"
#include "internal/db/model/notification_record.hpp"
#include "internal/db/model/student_record.hpp"
#include "registrar/records/v1/types.pb.h"

namespace registrar::core {

/*
  Store rows <-> wire messages.
*/

registrar::records::v1::Student      ToStudent(const db::model::StudentRecord& record);
registrar::records::v1::Course       ToCourse(const db::model::CourseRecord& record);
registrar::records::v1::Enrollment   ToEnrollment(const db::model::EnrollmentRecord& record);
registrar::records::v1::Attendance   ToAttendance(const db::model::AttendanceRecord& record);
registrar::records::v1::Grade        ToGrade(const db::model::GradeRecord& record);
registrar::records::v1::Notification ToNotification(const db::model::NotificationRecord& record);

db::model::StudentRecord ToStudentRecord(const std::string& id, const registrar::records::v1::StudentProfile& profile,
                                         const std::string& enrollment_date);
db::model::CourseRecord  ToCourseRecord(const registrar::records::v1::Course& course);

} // namespace registrar::core
