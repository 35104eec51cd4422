#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>

#include "registrar/v1.hpp"

using namespace registrar::v1;

static constexpr const char* kCapabilitiesMetadataKey = "x-registrar-capabilities";
static constexpr const char* kAllCapabilities         = "enroll,mark_attendance,record_grade,manage_records";

static void Usage() {
  std::cout << "Usage:\n"
            << "  registrarctl <addr> add-student <name> <gender=male|female|other> [email] [year]\n"
            << "  registrarctl <addr> student <student_id>\n"
            << "  registrarctl <addr> students\n"
            << "  registrarctl <addr> delete-student <student_id>\n"
            << "  registrarctl <addr> add-course <code> <name> <credit_hours> [department]\n"
            << "  registrarctl <addr> courses\n"
            << "  registrarctl <addr> delete-course <code>\n"
            << "  registrarctl <addr> enroll <student_id> <course> <semester> <academic_year>\n"
            << "  registrarctl <addr> enrollments <student_id> [semester] [academic_year]\n"
            << "  registrarctl <addr> unenroll <enrollment_id>\n"
            << "  registrarctl <addr> mark <course> <YYYY-MM-DD> <student_id>=<present|absent|late|excused>[:remark]...\n"
            << "  registrarctl <addr> attendance <student_id> <course> [from] [to]\n"
            << "  registrarctl <addr> grade <enrollment_id> <marks> [remark]\n"
            << "  registrarctl <addr> report <student_id> <semester> <academic_year>\n"
            << "  registrarctl <addr> summary <student_id> <course> [from] [to]\n"
            << "  registrarctl <addr> notifications <user_id> [unread]\n"
            << "  registrarctl <addr> read-all <user_id>\n"
            << "  registrarctl <addr> clear <user_id>\n"
            << "  registrarctl <addr> stats\n"
            << "\n"
            << "REGISTRARCTL_CAPABILITIES overrides the capabilities sent with each call\n"
            << "(default: " << kAllCapabilities << ").\n";
}

static std::optional<Gender> ParseGender(const std::string& value) {
  if (value == "male") return GENDER_MALE;
  if (value == "female") return GENDER_FEMALE;
  if (value == "other") return GENDER_OTHER;
  return std::nullopt;
}

static std::optional<AttendanceStatus> ParseStatus(const std::string& value) {
  if (value == "present") return ATTENDANCE_STATUS_PRESENT;
  if (value == "absent") return ATTENDANCE_STATUS_ABSENT;
  if (value == "late") return ATTENDANCE_STATUS_LATE;
  if (value == "excused") return ATTENDANCE_STATUS_EXCUSED;
  return std::nullopt;
}

static const char* StatusName(AttendanceStatus status) {
  switch (status) {
    case ATTENDANCE_STATUS_PRESENT:
      return "present";
    case ATTENDANCE_STATUS_ABSENT:
      return "absent";
    case ATTENDANCE_STATUS_LATE:
      return "late";
    case ATTENDANCE_STATUS_EXCUSED:
      return "excused";
    default:
      return "unspecified";
  }
}

static const char* LetterName(LetterGrade letter) {
  switch (letter) {
    case LETTER_GRADE_A:
      return "A";
    case LETTER_GRADE_B:
      return "B";
    case LETTER_GRADE_C:
      return "C";
    case LETTER_GRADE_D:
      return "D";
    case LETTER_GRADE_F:
      return "F";
    default:
      return "?";
  }
}

// Rejects negative and non-numeric input instead of letting stoul wrap it.
static std::optional<uint32_t> ParseCreditHours(const std::string& value) {
  long long parsed = 0;
  std::size_t consumed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    return std::nullopt;
  }
  if (consumed != value.size() || parsed < 0 || parsed > std::numeric_limits<uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(parsed);
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message();
  if (!status.error_details().empty()) {
    std::cerr << " [" << status.error_details() << "]";
  }
  std::cerr << "\n";
  return 2;
}

static void PrintStudent(const Student& s) {
  std::cout << "id=" << s.id() << " name=\"" << s.profile().name() << "\" email=" << s.profile().email()
            << " enrolled=" << s.enrollment_date() << "\n";
}

static void PrintEnrollment(const Enrollment& e) {
  std::cout << "enrollment=" << e.id() << " student=" << e.student_id() << " course=" << e.course_code() << " semester=" << e.semester()
            << " year=" << e.academic_year() << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto records_stub      = RegistrarRecordsService::NewStub(channel);
  auto report_stub       = RegistrarReportService::NewStub(channel);
  auto notification_stub = RegistrarNotificationService::NewStub(channel);
  auto admin_stub        = RegistrarAdminService::NewStub(channel);

  grpc::ClientContext ctx;
  const char*         capabilities = std::getenv("REGISTRARCTL_CAPABILITIES");
  ctx.AddMetadata(kCapabilitiesMetadataKey, capabilities ? capabilities : kAllCapabilities);

  std::cout << std::fixed << std::setprecision(2);

  // ------------------------------------------------------------
  // Students
  // ------------------------------------------------------------

  if (cmd == "add-student") {
    if (argc < 5) return 1;

    auto gender = ParseGender(argv[4]);
    if (!gender) {
      std::cerr << "unsupported gender: " << argv[4] << "\n";
      return 1;
    }

    CreateStudentRequest req;
    req.mutable_profile()->set_name(argv[3]);
    req.mutable_profile()->set_gender(*gender);
    if (argc >= 6) req.mutable_profile()->set_email(argv[5]);
    if (argc >= 7) req.set_year(std::stoi(argv[6]));

    CreateStudentResponse resp;
    auto                  status = records_stub->CreateStudent(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintStudent(resp.student());
    return 0;
  }

  if (cmd == "student") {
    if (argc < 4) return 1;

    GetStudentRequest req;
    req.set_student_id(argv[3]);

    GetStudentResponse resp;
    auto               status = records_stub->GetStudent(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintStudent(resp.student());
    return 0;
  }

  if (cmd == "students") {
    ListStudentsResponse resp;
    auto                 status = records_stub->ListStudents(&ctx, ListStudentsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& student : resp.students()) PrintStudent(student);
    return 0;
  }

  if (cmd == "delete-student") {
    if (argc < 4) return 1;

    DeleteStudentRequest req;
    req.set_student_id(argv[3]);

    google::protobuf::Empty resp;
    auto                    status = records_stub->DeleteStudent(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------
  // Courses
  // ------------------------------------------------------------

  if (cmd == "add-course") {
    if (argc < 6) return 1;

    CreateCourseRequest req;
    req.mutable_course()->set_code(argv[3]);
    req.mutable_course()->set_name(argv[4]);
    const auto credits = ParseCreditHours(argv[5]);
    if (!credits) {
      std::cerr << "credit hours must be a non-negative integer: " << argv[5] << "\n";
      return 1;
    }
    req.mutable_course()->set_credit_hours(*credits);
    if (argc >= 7) req.mutable_course()->set_department(argv[6]);

    CreateCourseResponse resp;
    auto                 status = records_stub->CreateCourse(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "course=" << resp.course().code() << "\n";
    return 0;
  }

  if (cmd == "courses") {
    ListCoursesResponse resp;
    auto                status = records_stub->ListCourses(&ctx, ListCoursesRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& course : resp.courses()) {
      std::cout << "code=" << course.code() << " name=\"" << course.name() << "\" credits=" << course.credit_hours()
                << " department=" << course.department() << "\n";
    }
    return 0;
  }

  if (cmd == "delete-course") {
    if (argc < 4) return 1;

    DeleteCourseRequest req;
    req.set_course_code(argv[3]);

    google::protobuf::Empty resp;
    auto                    status = records_stub->DeleteCourse(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------
  // Enrollments
  // ------------------------------------------------------------

  if (cmd == "enroll") {
    if (argc < 7) return 1;

    EnrollRequest req;
    req.set_student_id(argv[3]);
    req.set_course_code(argv[4]);
    req.set_semester(argv[5]);
    req.set_academic_year(argv[6]);

    EnrollResponse resp;
    auto           status = records_stub->Enroll(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintEnrollment(resp.enrollment());
    return 0;
  }

  if (cmd == "enrollments") {
    if (argc < 4) return 1;

    ListEnrollmentsRequest req;
    req.set_student_id(argv[3]);
    if (argc >= 5) req.set_semester(argv[4]);
    if (argc >= 6) req.set_academic_year(argv[5]);

    ListEnrollmentsResponse resp;
    auto                    status = records_stub->ListEnrollments(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& enrollment : resp.enrollments()) PrintEnrollment(enrollment);
    return 0;
  }

  if (cmd == "unenroll") {
    if (argc < 4) return 1;

    DeleteEnrollmentRequest req;
    req.set_enrollment_id(std::stoull(argv[3]));

    google::protobuf::Empty resp;
    auto                    status = records_stub->DeleteEnrollment(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------
  // Attendance
  // ------------------------------------------------------------

  if (cmd == "mark") {
    if (argc < 6) return 1;

    MarkAttendanceRequest req;
    req.set_course_code(argv[3]);
    req.set_date(argv[4]);

    for (int i = 5; i < argc; ++i) {
      const std::string arg = argv[i];
      const auto        eq  = arg.find('=');
      if (eq == std::string::npos) {
        std::cerr << "expected <student_id>=<status>, got " << arg << "\n";
        return 1;
      }

      std::string status_text = arg.substr(eq + 1);
      std::string remark;
      if (const auto colon = status_text.find(':'); colon != std::string::npos) {
        remark      = status_text.substr(colon + 1);
        status_text = status_text.substr(0, colon);
      }

      auto status = ParseStatus(status_text);
      if (!status) {
        std::cerr << "unsupported status: " << status_text << "\n";
        return 1;
      }

      auto* entry = req.add_entries();
      entry->set_student_id(arg.substr(0, eq));
      entry->set_status(*status);
      entry->set_remark(remark);
    }

    MarkAttendanceResponse resp;
    auto                   status = records_stub->MarkAttendance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& result : resp.results()) {
      std::cout << result.student_id() << " " << (result.outcome() == MARK_OUTCOME_INSERTED ? "inserted" : "updated") << "\n";
    }
    return 0;
  }

  if (cmd == "attendance") {
    if (argc < 5) return 1;

    GetAttendanceRequest req;
    req.set_student_id(argv[3]);
    req.set_course_code(argv[4]);
    if (argc >= 6) req.mutable_range()->set_from(argv[5]);
    if (argc >= 7) req.mutable_range()->set_to(argv[6]);

    GetAttendanceResponse resp;
    auto                  status = records_stub->GetAttendance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& record : resp.records()) {
      std::cout << record.date() << " " << StatusName(record.status());
      if (!record.remark().empty()) std::cout << " (" << record.remark() << ")";
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------
  // Grades and reports
  // ------------------------------------------------------------

  if (cmd == "grade") {
    if (argc < 5) return 1;

    RecordGradeRequest req;
    req.set_enrollment_id(std::stoull(argv[3]));
    req.set_marks(std::stod(argv[4]));
    if (argc >= 6) req.set_remark(argv[5]);

    RecordGradeResponse resp;
    auto                status = records_stub->RecordGrade(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "marks=" << resp.grade().marks() << " letter=" << LetterName(resp.grade().letter()) << "\n";
    return 0;
  }

  if (cmd == "report") {
    if (argc < 6) return 1;

    BuildReportCardRequest req;
    req.set_student_id(argv[3]);
    req.set_semester(argv[4]);
    req.set_academic_year(argv[5]);

    BuildReportCardResponse resp;
    auto                    status = report_stub->BuildReportCard(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& card = resp.report_card();
    std::cout << card.student_id() << " " << card.student_name() << " " << card.semester() << " " << card.academic_year() << "\n";
    for (const auto& line : card.lines()) {
      std::cout << "  " << line.course_code() << " \"" << line.course_name() << "\" credits=" << line.credit_hours()
                << " marks=" << line.marks() << " letter=" << LetterName(line.letter()) << " points=" << line.grade_points() << "\n";
    }
    std::cout << "total_credits=" << card.total_credits() << " gpa=" << card.gpa() << "\n";
    return 0;
  }

  if (cmd == "summary") {
    if (argc < 5) return 1;

    BuildAttendanceSummaryRequest req;
    req.set_student_id(argv[3]);
    req.set_course_code(argv[4]);
    if (argc >= 6) req.mutable_range()->set_from(argv[5]);
    if (argc >= 7) req.mutable_range()->set_to(argv[6]);

    BuildAttendanceSummaryResponse resp;
    auto                           status = report_stub->BuildAttendanceSummary(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& s = resp.summary();
    std::cout << "total=" << s.total_classes() << " present=" << s.present_count() << " absent=" << s.absent_count()
              << " late=" << s.late_count() << " excused=" << s.excused_count() << " percentage=" << s.percentage() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  // Notifications
  // ------------------------------------------------------------

  if (cmd == "notifications") {
    if (argc < 4) return 1;

    ListNotificationsRequest req;
    req.set_user_id(argv[3]);
    req.set_unread_only(argc >= 5 && std::string(argv[4]) == "unread");

    ListNotificationsResponse resp;
    auto                      status = notification_stub->ListNotifications(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& n : resp.notifications()) {
      std::cout << (n.read() ? "  " : "* ") << n.id() << " [" << n.type() << "] " << n.message() << "\n";
    }
    std::cout << "unread=" << resp.unread_count() << "\n";
    return 0;
  }

  if (cmd == "read-all") {
    if (argc < 4) return 1;

    MarkAllNotificationsReadRequest req;
    req.set_user_id(argv[3]);

    MarkAllNotificationsReadResponse resp;
    auto                             status = notification_stub->MarkAllNotificationsRead(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "updated=" << resp.updated() << "\n";
    return 0;
  }

  if (cmd == "clear") {
    if (argc < 4) return 1;

    ClearNotificationsRequest req;
    req.set_user_id(argv[3]);

    ClearNotificationsResponse resp;
    auto                       status = notification_stub->ClearNotifications(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted=" << resp.deleted() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsResponse resp;
    auto          status = admin_stub->Stats(&ctx, StatsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "students=" << resp.students() << " courses=" << resp.courses() << " enrollments=" << resp.enrollments()
              << " attendance=" << resp.attendance_records() << " grades=" << resp.grades() << " notifications=" << resp.notifications()
              << " backend=" << resp.storage_backend() << " uptime_s=" << resp.uptime_seconds() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
