#pragma once

#include <stdexcept>
#include <string>

namespace aff4::util {

/*
  Central error types.

  Every failure that leaves the store is one of these.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidUrn : public std::runtime_error {
 public:
  explicit InvalidUrn(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Unknown attribute name, wrong value type or wrong multiplicity.
class SchemaViolation : public std::runtime_error {
 public:
  explicit SchemaViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Flow status could not be determined. Callers may retry.
class LockStatusUnavailable : public std::runtime_error {
 public:
  explicit LockStatusUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Persistence backend failed. Callers may retry; the store never does.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace aff4::util
