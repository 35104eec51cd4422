#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/schema.hpp"

namespace registrar::db::sqlite {

using registrar::db::ErrorCode;
using registrar::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static model::StudentRecord ReadStudent(sqlite3_stmt* st) {
    model::StudentRecord r;
    r.id = ColText(st, 0);
    r.name = ColText(st, 1);
    r.date_of_birth = ColText(st, 2);
    r.gender = static_cast<registrar::records::v1::Gender>(ColI32(st, 3));
    r.email = ColText(st, 4);
    r.phone = ColText(st, 5);
    r.address = ColText(st, 6);
    r.photo_ref = ColText(st, 7);
    r.enrollment_date = ColText(st, 8);
    return r;
}

static model::CourseRecord ReadCourse(sqlite3_stmt* st) {
    model::CourseRecord r;
    r.code = ColText(st, 0);
    r.name = ColText(st, 1);
    r.credit_hours = static_cast<uint32_t>(ColI32(st, 2));
    r.department = ColText(st, 3);
    return r;
}

static model::EnrollmentRecord ReadEnrollment(sqlite3_stmt* st) {
    model::EnrollmentRecord r;
    r.id = ColU64(st, 0);
    r.student_id = ColText(st, 1);
    r.course_code = ColText(st, 2);
    r.semester = ColText(st, 3);
    r.academic_year = ColText(st, 4);
    r.created_at_ms = ColU64(st, 5);
    return r;
}

static model::NotificationRecord ReadNotification(sqlite3_stmt* st) {
    model::NotificationRecord r;
    r.id = ColU64(st, 0);
    r.user_id = ColText(st, 1);
    r.message = ColText(st, 2);
    r.type = ColText(st, 3);
    r.read = ColI32(st, 4) != 0;
    r.created_at_ms = ColU64(st, 5);
    return r;
}

static constexpr const char* kStudentColumns =
    "id,name,date_of_birth,gender,email,phone,address,photo_ref,enrollment_date";

static constexpr const char* kEnrollmentColumns =
    "id,student_id,course_code,semester,academic_year,created_at_ms";

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema() {
    SqliteTransaction tx(db_);
    for (const char* sql : sql::kSchema) {
        db_->Exec(sql);
    }
    tx.Commit();
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Students
// ------------------------------------------------------------------

Result SqliteRepository::InsertStudent(Transaction& t, const model::StudentRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO students(id,name,date_of_birth,gender,email,phone,address,photo_ref,enrollment_date) "
        "VALUES(?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.name);
    BindText(st, 3, r.date_of_birth);
    BindI32(st, 4, static_cast<int>(r.gender));
    BindText(st, 5, r.email);
    BindText(st, 6, r.phone);
    BindText(st, 7, r.address);
    BindText(st, 8, r.photo_ref);
    BindText(st, 9, r.enrollment_date);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "student " + r.id);
    return Translate(db, rc);
}

std::optional<model::StudentRecord>
SqliteRepository::GetStudent(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kStudentColumns + " FROM students WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, id);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadStudent(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::StudentRecord> SqliteRepository::ListStudents(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kStudentColumns + " FROM students ORDER BY id;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    std::vector<model::StudentRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadStudent(st));
    }

    sqlite3_finalize(st);
    return out;
}

std::vector<std::string>
SqliteRepository::ListStudentIdsWithPrefix(Transaction& t, const std::string& prefix) {
    auto* db = TX(t).Handle();

    // substr instead of LIKE so the prefix is never read as a pattern
    const char* sql = "SELECT id FROM students WHERE substr(id,1,?)=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindI32(st, 1, static_cast<int>(prefix.size()));
    BindText(st, 2, prefix);

    std::vector<std::string> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ColText(st, 0));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteStudent(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM students WHERE id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<uint64_t> SqliteRepository::GetStudentSequence(Transaction& t, int year) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT last_sequence FROM student_id_sequences WHERE year=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindI32(st, 1, year);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    const auto sequence = ColU64(st, 0);
    sqlite3_finalize(st);
    return sequence;
}

Result SqliteRepository::SetStudentSequence(Transaction& t, int year, uint64_t sequence) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO student_id_sequences(year,last_sequence) VALUES(?,?) "
        "ON CONFLICT(year) DO UPDATE SET last_sequence=excluded.last_sequence;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st, 1, year);
    BindU64(st, 2, sequence);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Courses
// ------------------------------------------------------------------

Result SqliteRepository::InsertCourse(Transaction& t, const model::CourseRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO courses(code,name,credit_hours,department) VALUES(?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.code);
    BindText(st, 2, r.name);
    BindI32(st, 3, static_cast<int>(r.credit_hours));
    BindText(st, 4, r.department);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "course " + r.code);
    return Translate(db, rc);
}

std::optional<model::CourseRecord>
SqliteRepository::GetCourse(Transaction& t, const std::string& code) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT code,name,credit_hours,department FROM courses WHERE code=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, code);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadCourse(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::CourseRecord> SqliteRepository::ListCourses(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT code,name,credit_hours,department FROM courses ORDER BY code;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return {};

    std::vector<model::CourseRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadCourse(st));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteCourse(Transaction& t, const std::string& code) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM courses WHERE code=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, code);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Enrollments
// ------------------------------------------------------------------

Result SqliteRepository::InsertEnrollment(Transaction& t, model::EnrollmentRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO enrollments(student_id,course_code,semester,academic_year,created_at_ms) "
        "VALUES(?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.student_id);
    BindText(st, 2, r.course_code);
    BindText(st, 3, r.semester);
    BindText(st, 4, r.academic_year);
    BindU64(st, 5, r.created_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "enrollment " + r.student_id + "/" + r.course_code);
    if (rc != SQLITE_DONE)
        return Translate(db, rc);

    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::EnrollmentRecord>
SqliteRepository::GetEnrollment(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kEnrollmentColumns + " FROM enrollments WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindU64(st, 1, id);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadEnrollment(st);
    sqlite3_finalize(st);
    return r;
}

std::optional<model::EnrollmentRecord> SqliteRepository::FindEnrollment(
    Transaction& t, const std::string& student_id, const std::string& course_code,
    const std::string& semester, const std::string& academic_year) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kEnrollmentColumns +
                            " FROM enrollments WHERE student_id=? AND course_code=? AND semester=? AND academic_year=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, student_id);
    BindText(st, 2, course_code);
    BindText(st, 3, semester);
    BindText(st, 4, academic_year);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadEnrollment(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::EnrollmentRecord>
SqliteRepository::ListEnrollmentsByStudent(Transaction& t, const std::string& student_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kEnrollmentColumns +
                            " FROM enrollments WHERE student_id=? ORDER BY id;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindText(st, 1, student_id);

    std::vector<model::EnrollmentRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadEnrollment(st));
    }

    sqlite3_finalize(st);
    return out;
}

std::vector<model::EnrollmentRecord>
SqliteRepository::ListEnrollmentsByCourse(Transaction& t, const std::string& course_code) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kEnrollmentColumns +
                            " FROM enrollments WHERE course_code=? ORDER BY id;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindText(st, 1, course_code);

    std::vector<model::EnrollmentRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadEnrollment(st));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteEnrollment(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM enrollments WHERE id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Attendance
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAttendance(Transaction& t, const model::AttendanceRecord& r, bool& inserted) {
    auto* db = TX(t).Handle();

    // BEGIN IMMEDIATE holds the write lock, so the probe and the write
    // below see the same row set.
    const char* probe_sql =
        "SELECT 1 FROM attendance WHERE student_id=? AND course_code=? AND date=?;";

    sqlite3_stmt* probe = nullptr;
    if (sqlite3_prepare_v2(db, probe_sql, -1, &probe, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(probe, 1, r.student_id);
    BindText(probe, 2, r.course_code);
    BindText(probe, 3, r.date);
    const bool exists = sqlite3_step(probe) == SQLITE_ROW;
    sqlite3_finalize(probe);

    const char* sql =
        "INSERT INTO attendance(student_id,course_code,date,status,remark) VALUES(?,?,?,?,?) "
        "ON CONFLICT(student_id,course_code,date) DO UPDATE SET "
        "status=excluded.status, remark=excluded.remark;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.student_id);
    BindText(st, 2, r.course_code);
    BindText(st, 3, r.date);
    BindI32(st, 4, static_cast<int>(r.status));
    BindText(st, 5, r.remark);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE) {
        inserted = !exists;
    }
    return Translate(db, rc);
}

std::vector<model::AttendanceRecord> SqliteRepository::ListAttendance(
    Transaction& t, const std::string& student_id, const std::string& course_code,
    const std::string& from_date, const std::string& to_date) {
    auto* db = TX(t).Handle();

    std::string sql =
        "SELECT student_id,course_code,date,status,COALESCE(remark,'') "
        "FROM attendance WHERE student_id=? AND course_code=?";
    if (!from_date.empty()) {
        sql += " AND date>=?";
    }
    if (!to_date.empty()) {
        sql += " AND date<=?";
    }
    sql += " ORDER BY date ASC;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    int bind_idx = 1;
    BindText(st, bind_idx++, student_id);
    BindText(st, bind_idx++, course_code);
    if (!from_date.empty()) {
        BindText(st, bind_idx++, from_date);
    }
    if (!to_date.empty()) {
        BindText(st, bind_idx++, to_date);
    }

    std::vector<model::AttendanceRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        model::AttendanceRecord r;
        r.student_id = ColText(st, 0);
        r.course_code = ColText(st, 1);
        r.date = ColText(st, 2);
        r.status = static_cast<registrar::records::v1::AttendanceStatus>(ColI32(st, 3));
        r.remark = ColText(st, 4);
        out.push_back(std::move(r));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteAttendanceByStudent(Transaction& t, const std::string& student_id) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM attendance WHERE student_id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, student_id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

Result SqliteRepository::DeleteAttendanceByCourse(Transaction& t, const std::string& course_code) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM attendance WHERE course_code=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, course_code);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

Result SqliteRepository::DeleteAttendanceByStudentCourse(Transaction& t, const std::string& student_id,
                                                         const std::string& course_code) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM attendance WHERE student_id=? AND course_code=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, student_id);
    BindText(st, 2, course_code);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Grades
// ------------------------------------------------------------------

Result SqliteRepository::UpsertGrade(Transaction& t, const model::GradeRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO grades(enrollment_id,marks_hundredths,letter,remark,recorded_at_ms) VALUES(?,?,?,?,?) "
        "ON CONFLICT(enrollment_id) DO UPDATE SET "
        "marks_hundredths=excluded.marks_hundredths, letter=excluded.letter, "
        "remark=excluded.remark, recorded_at_ms=excluded.recorded_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.enrollment_id);
    BindI64(st, 2, r.marks_hundredths);
    BindI32(st, 3, static_cast<int>(r.letter));
    BindText(st, 4, r.remark);
    BindU64(st, 5, r.recorded_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

std::optional<model::GradeRecord>
SqliteRepository::GetGrade(Transaction& t, uint64_t enrollment_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT enrollment_id,marks_hundredths,letter,COALESCE(remark,''),recorded_at_ms "
        "FROM grades WHERE enrollment_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindU64(st, 1, enrollment_id);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::GradeRecord r;
    r.enrollment_id = ColU64(st, 0);
    r.marks_hundredths = ColI64(st, 1);
    r.letter = static_cast<registrar::records::v1::LetterGrade>(ColI32(st, 2));
    r.remark = ColText(st, 3);
    r.recorded_at_ms = ColU64(st, 4);

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::DeleteGrade(Transaction& t, uint64_t enrollment_id) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM grades WHERE enrollment_id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, enrollment_id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

Result SqliteRepository::InsertNotification(Transaction& t, model::NotificationRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO notifications(user_id,message,type,is_read,created_at_ms) VALUES(?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.user_id);
    BindText(st, 2, r.message);
    BindText(st, 3, r.type);
    BindI32(st, 4, r.read ? 1 : 0);
    BindU64(st, 5, r.created_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE)
        return Translate(db, rc);

    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::NotificationRecord>
SqliteRepository::ListNotifications(Transaction& t, const std::string& user_id, bool unread_only) {
    auto* db = TX(t).Handle();

    std::string sql =
        "SELECT id,user_id,message,COALESCE(type,''),is_read,created_at_ms "
        "FROM notifications WHERE user_id=?";
    if (unread_only) {
        sql += " AND is_read=0";
    }
    sql += " ORDER BY id DESC;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindText(st, 1, user_id);

    std::vector<model::NotificationRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadNotification(st));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::MarkNotificationsRead(Transaction& t, const std::string& user_id, uint64_t& updated) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE notifications SET is_read=1 WHERE user_id=? AND is_read=0;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, user_id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    updated = rc == SQLITE_DONE ? static_cast<uint64_t>(sqlite3_changes(db)) : 0;
    return Translate(db, rc);
}

Result SqliteRepository::DeleteNotifications(Transaction& t, const std::string& user_id, uint64_t& deleted) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM notifications WHERE user_id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, user_id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    deleted = rc == SQLITE_DONE ? static_cast<uint64_t>(sqlite3_changes(db)) : 0;
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Admin
// ------------------------------------------------------------------

RecordCounts SqliteRepository::CountRecords(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT (SELECT COUNT(*) FROM students),"
        " (SELECT COUNT(*) FROM courses),"
        " (SELECT COUNT(*) FROM enrollments),"
        " (SELECT COUNT(*) FROM attendance),"
        " (SELECT COUNT(*) FROM grades),"
        " (SELECT COUNT(*) FROM notifications);";

    RecordCounts counts;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return counts;

    if (sqlite3_step(st) == SQLITE_ROW) {
        counts.students = ColU64(st, 0);
        counts.courses = ColU64(st, 1);
        counts.enrollments = ColU64(st, 2);
        counts.attendance_records = ColU64(st, 3);
        counts.grades = ColU64(st, 4);
        counts.notifications = ColU64(st, 5);
    }

    sqlite3_finalize(st);
    return counts;
}

} // namespace registrar::db::sqlite
