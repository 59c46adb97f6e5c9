#pragma once

#include <string>
#include <utility>

namespace routebroker::db {

/*
  Outcome of a repository write, independent of the backend.

    Duplicate         md5 of a mesh or id of a job already stored
    NotFound          update of a route id that does not exist
    InvalidReference  row points at a mesh / route that does not exist
    Contention        lock or serialization conflict; the caller may retry
    Unavailable       the database cannot be reached or read
    Storage           anything else the backend reports
*/
enum class ErrorCode {
  Ok = 0,
  Duplicate,
  NotFound,
  InvalidReference,
  Contention,
  Unavailable,
  Storage,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "ok";
    case ErrorCode::Duplicate:
      return "duplicate";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::InvalidReference:
      return "invalid reference";
    case ErrorCode::Contention:
      return "contention";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::Storage:
      return "storage error";
  }
  return "storage error";
}

struct Result {
  ErrorCode   code = ErrorCode::Ok;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::Ok;
  }
};

} // namespace routebroker::db
