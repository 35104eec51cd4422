#include "record_mapping.hpp"

#include "internal/util/time.hpp"

namespace registrar::core {

using namespace registrar::records::v1;

Student ToStudent(const db::model::StudentRecord& record) {
  Student student;
  student.set_id(record.id);
  student.set_enrollment_date(record.enrollment_date);

  auto* profile = student.mutable_profile();
  profile->set_name(record.name);
  profile->set_date_of_birth(record.date_of_birth);
  profile->set_gender(record.gender);
  profile->set_email(record.email);
  profile->set_phone(record.phone);
  profile->set_address(record.address);
  profile->set_photo_ref(record.photo_ref);
  return student;
}

Course ToCourse(const db::model::CourseRecord& record) {
  Course course;
  course.set_code(record.code);
  course.set_name(record.name);
  course.set_credit_hours(record.credit_hours);
  course.set_department(record.department);
  return course;
}

Enrollment ToEnrollment(const db::model::EnrollmentRecord& record) {
  Enrollment enrollment;
  enrollment.set_id(record.id);
  enrollment.set_student_id(record.student_id);
  enrollment.set_course_code(record.course_code);
  enrollment.set_semester(record.semester);
  enrollment.set_academic_year(record.academic_year);
  *enrollment.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  return enrollment;
}

Attendance ToAttendance(const db::model::AttendanceRecord& record) {
  Attendance attendance;
  attendance.set_student_id(record.student_id);
  attendance.set_course_code(record.course_code);
  attendance.set_date(record.date);
  attendance.set_status(record.status);
  attendance.set_remark(record.remark);
  return attendance;
}

Grade ToGrade(const db::model::GradeRecord& record) {
  Grade grade;
  grade.set_enrollment_id(record.enrollment_id);
  grade.set_marks(static_cast<double>(record.marks_hundredths) / 100.0);
  grade.set_letter(record.letter);
  grade.set_remark(record.remark);
  *grade.mutable_recorded_at() = util::ToProto(util::FromUnixMillis(record.recorded_at_ms));
  return grade;
}

Notification ToNotification(const db::model::NotificationRecord& record) {
  Notification notification;
  notification.set_id(record.id);
  notification.set_user_id(record.user_id);
  notification.set_message(record.message);
  notification.set_type(record.type);
  notification.set_read(record.read);
  *notification.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  return notification;
}

db::model::StudentRecord ToStudentRecord(const std::string& id, const StudentProfile& profile, const std::string& enrollment_date) {
  db::model::StudentRecord record;
  record.id              = id;
  record.name            = profile.name();
  record.date_of_birth   = profile.date_of_birth();
  record.gender          = profile.gender();
  record.email           = profile.email();
  record.phone           = profile.phone();
  record.address         = profile.address();
  record.photo_ref       = profile.photo_ref();
  record.enrollment_date = enrollment_date;
  return record;
}

db::model::CourseRecord ToCourseRecord(const Course& course) {
  db::model::CourseRecord record;
  record.code         = course.code();
  record.name         = course.name();
  record.credit_hours = course.credit_hours();
  record.department   = course.department();
  return record;
}

} // namespace registrar::core
