#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace alarmsrv::util {

/*
  Central error types.

  Thrown by the service layer, translated later to gRPC status codes.
*/

// Malformed client input. Carries the offending field.
class ValidationError : public std::runtime_error {
 public:
  ValidationError(std::string field, const std::string& msg)
      : std::runtime_error("invalid " + field + ": " + msg), field_(std::move(field)) {
  }

  const std::string& Field() const {
    return field_;
  }

 private:
  std::string field_;
};

// (channel_id, data_type, point_id, rule_name)
struct RuleTuple {
  std::int64_t channel_id = 0;
  std::string  data_type;
  std::int64_t point_id = 0;
  std::string  rule_name;
};

class DuplicateRule : public std::runtime_error {
 public:
  explicit DuplicateRule(RuleTuple tuple)
      : std::runtime_error("rule already exists: channel_id=" + std::to_string(tuple.channel_id) + " data_type=" + tuple.data_type +
                           " point_id=" + std::to_string(tuple.point_id) + " rule_name=" + tuple.rule_name),
        tuple_(std::move(tuple)) {
  }

  const RuleTuple& Tuple() const {
    return tuple_;
  }

 private:
  RuleTuple tuple_;
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Storage-level constraint failure not otherwise classified.
class ConstraintViolation : public std::runtime_error {
 public:
  explicit ConstraintViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

// I/O failure or lock wait exhausted. Never retried internally.
class StorageUnavailable : public std::runtime_error {
 public:
  explicit StorageUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace alarmsrv::util
