#pragma once

#include <stdexcept>
#include <string>

namespace registrar::util {

/*
  Central error types.

  Every error carries the offending key (student id, course code,
  enrollment id, ...) so callers can choose between retry and a
  user-facing message. These get translated later to gRPC status codes.
*/

class RecordsError : public std::runtime_error {
 public:
  RecordsError(const std::string& msg, std::string key) : std::runtime_error(msg), key_(std::move(key)) {
  }

  const std::string& key() const noexcept {
    return key_;
  }

 private:
  std::string key_;
};

class NotFound : public RecordsError {
 public:
  explicit NotFound(const std::string& msg, std::string key = {}) : RecordsError(msg, std::move(key)) {
  }
};

class AlreadyExists : public RecordsError {
 public:
  explicit AlreadyExists(const std::string& msg, std::string key = {}) : RecordsError(msg, std::move(key)) {
  }
};

// (student, course, semester, academic year) is already enrolled.
class DuplicateEnrollment : public AlreadyExists {
 public:
  explicit DuplicateEnrollment(const std::string& msg, std::string key = {}) : AlreadyExists(msg, std::move(key)) {
  }
};

class InvalidScore : public RecordsError {
 public:
  explicit InvalidScore(const std::string& msg, std::string key = {}) : RecordsError(msg, std::move(key)) {
  }
};

class ValidationError : public RecordsError {
 public:
  explicit ValidationError(const std::string& msg, std::string key = {}) : RecordsError(msg, std::move(key)) {
  }
};

// Identifier allocation kept conflicting after the bounded retries.
class AllocationConflict : public RecordsError {
 public:
  explicit AllocationConflict(const std::string& msg, std::string key = {}) : RecordsError(msg, std::move(key)) {
  }
};

class PermissionDenied : public RecordsError {
 public:
  explicit PermissionDenied(const std::string& msg, std::string key = {}) : RecordsError(msg, std::move(key)) {
  }
};

} // namespace registrar::util
