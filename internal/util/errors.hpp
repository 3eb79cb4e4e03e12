#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace asqueue::util {

/*
  Central error types raised by the queue store.

  Absence of rows is never an error; reads return empty / zero.
*/

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

class StoreError : public std::runtime_error {
 public:
  StoreError(db::ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  db::ErrorCode Code() const {
    return code_;
  }

  virtual bool Retryable() const {
    return false;
  }

 private:
  db::ErrorCode code_;
};

// Connection / IO / lock / deadline failures. Safe to retry.
class BackendUnavailable : public StoreError {
 public:
  BackendUnavailable(db::ErrorCode code, const std::string& msg) : StoreError(code, msg) {
  }

  bool Retryable() const override {
    return true;
  }
};

// Duplicate or malformed row. Retrying the same write will fail again.
class ConstraintViolation : public StoreError {
 public:
  explicit ConstraintViolation(const std::string& msg) : StoreError(db::ErrorCode::ConstraintViolation, msg) {
  }
};

} // namespace asqueue::util
