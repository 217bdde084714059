#pragma once

#include <stdexcept>
#include <string>

namespace slotwatch::util {

/*
  Central error types.

  Busy pages are not errors; they surface as scan outcomes.
  NotFound is translated to a gRPC status by the admin adapter.
*/

class InitializationError : public std::runtime_error {
 public:
  explicit InitializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DriverError : public std::runtime_error {
 public:
  explicit DriverError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ElementNotFound : public std::runtime_error {
 public:
  explicit ElementNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LoginFailed : public std::runtime_error {
 public:
  explicit LoginFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SessionExpired : public std::runtime_error {
 public:
  explicit SessionExpired(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NavigationFailed : public std::runtime_error {
 public:
  explicit NavigationFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace slotwatch::util
