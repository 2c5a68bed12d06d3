#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace alarmsrv::model {

enum class DataType : std::uint8_t {
  kTelemetry  = 0,
  kStatus     = 1,
  kControl    = 2,
  kAdjustment = 3,
};

enum class WarningLevel : std::uint8_t {
  kLow    = 1,
  kMedium = 2,
  kHigh   = 3,
};

enum class Operator : std::uint8_t {
  kGreater      = 0,
  kLess         = 1,
  kGreaterEqual = 2,
  kLessEqual    = 3,
  kEqual        = 4,
  kNotEqual     = 5,
};

constexpr std::string_view ToCode(DataType type) {
  switch (type) {
    case DataType::kTelemetry:
      return "T";
    case DataType::kStatus:
      return "S";
    case DataType::kControl:
      return "C";
    case DataType::kAdjustment:
    default:
      return "A";
  }
}

constexpr std::string_view ToString(DataType type) {
  switch (type) {
    case DataType::kTelemetry:
      return "telemetry";
    case DataType::kStatus:
      return "status";
    case DataType::kControl:
      return "control";
    case DataType::kAdjustment:
    default:
      return "adjustment";
  }
}

constexpr std::optional<DataType> ParseDataType(std::string_view code) {
  if (code == "T") return DataType::kTelemetry;
  if (code == "S") return DataType::kStatus;
  if (code == "C") return DataType::kControl;
  if (code == "A") return DataType::kAdjustment;
  return std::nullopt;
}

constexpr std::string_view ToString(WarningLevel level) {
  switch (level) {
    case WarningLevel::kLow:
      return "low";
    case WarningLevel::kMedium:
      return "medium";
    case WarningLevel::kHigh:
    default:
      return "high";
  }
}

constexpr std::optional<WarningLevel> ParseWarningLevel(std::int64_t level) {
  if (level >= 1 && level <= 3) {
    return static_cast<WarningLevel>(level);
  }
  return std::nullopt;
}

constexpr std::string_view ToSymbol(Operator op) {
  switch (op) {
    case Operator::kGreater:
      return ">";
    case Operator::kLess:
      return "<";
    case Operator::kGreaterEqual:
      return ">=";
    case Operator::kLessEqual:
      return "<=";
    case Operator::kEqual:
      return "==";
    case Operator::kNotEqual:
    default:
      return "!=";
  }
}

constexpr std::optional<Operator> ParseOperator(std::string_view symbol) {
  if (symbol == ">") return Operator::kGreater;
  if (symbol == "<") return Operator::kLess;
  if (symbol == ">=") return Operator::kGreaterEqual;
  if (symbol == "<=") return Operator::kLessEqual;
  if (symbol == "==") return Operator::kEqual;
  if (symbol == "!=") return Operator::kNotEqual;
  return std::nullopt;
}

} // namespace alarmsrv::model
