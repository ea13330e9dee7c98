#pragma once

#include <stdexcept>
#include <string>

namespace aff4::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Thrown by read paths and transaction control (Begin/Commit), which have
  no Result to return.
*/
class RepositoryError : public std::runtime_error {
 public:
  explicit RepositoryError(Result result) : std::runtime_error(result.message), result_(std::move(result)) {
  }

  const Result& result() const {
    return result_;
  }

 private:
  Result result_;
};

} // namespace aff4::db
