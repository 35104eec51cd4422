#pragma once

#include <array>

namespace registrar::db::sql {

/*
  Canonical schema, applied idempotently at startup.

  Each table carries a unique key on its invariant; there are no
  ON DELETE CASCADE clauses because cascades are performed explicitly
  by the enrollment ledger.
*/

inline constexpr std::array<const char*, 10> kSchema = {
    "CREATE TABLE IF NOT EXISTS students ("
    " id TEXT PRIMARY KEY,"
    " name TEXT NOT NULL,"
    " date_of_birth TEXT,"
    " gender INTEGER NOT NULL,"
    " email TEXT,"
    " phone TEXT,"
    " address TEXT,"
    " photo_ref TEXT,"
    " enrollment_date TEXT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS student_id_sequences ("
    " year INTEGER PRIMARY KEY,"
    " last_sequence INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS courses ("
    " code TEXT PRIMARY KEY,"
    " name TEXT NOT NULL,"
    " credit_hours INTEGER NOT NULL CHECK (credit_hours > 0),"
    " department TEXT);",

    "CREATE TABLE IF NOT EXISTS enrollments ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " student_id TEXT NOT NULL,"
    " course_code TEXT NOT NULL,"
    " semester TEXT NOT NULL,"
    " academic_year TEXT NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " UNIQUE(student_id, course_code, semester, academic_year));",

    "CREATE INDEX IF NOT EXISTS enrollments_by_course ON enrollments(course_code);",

    "CREATE TABLE IF NOT EXISTS attendance ("
    " student_id TEXT NOT NULL,"
    " course_code TEXT NOT NULL,"
    " date TEXT NOT NULL,"
    " status INTEGER NOT NULL,"
    " remark TEXT,"
    " PRIMARY KEY (student_id, course_code, date));",

    "CREATE INDEX IF NOT EXISTS attendance_by_course ON attendance(course_code);",

    "CREATE TABLE IF NOT EXISTS grades ("
    " enrollment_id INTEGER PRIMARY KEY,"
    " marks_hundredths INTEGER NOT NULL CHECK (marks_hundredths BETWEEN 0 AND 10000),"
    " letter INTEGER NOT NULL,"
    " remark TEXT,"
    " recorded_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS notifications ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " user_id TEXT NOT NULL,"
    " message TEXT NOT NULL,"
    " type TEXT,"
    " is_read INTEGER NOT NULL DEFAULT 0,"
    " created_at_ms INTEGER NOT NULL);",

    "CREATE INDEX IF NOT EXISTS notifications_by_user ON notifications(user_id, is_read);",
};

} // namespace registrar::db::sql
