#define MQTT_LOG_COMPONENT "config.units"

#include "mqtt/config/units.h"

#include <cmath>
#include <limits>

#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace config {

namespace {

struct Unit {
  const char* suffix;
  uint64_t scale;
};

// Smallest unit first
const Unit kDurationUnits[] = {
    {"ms", 1}, {"s", 1000}, {"m", 60 * 1000}, {"h", 60 * 60 * 1000}};
const Unit kSizeUnits[] = {
    {"B", 1}, {"KB", Size::KB}, {"MB", Size::MB}, {"GB", Size::GB}};

constexpr uint64_t kMaxMillis =
    static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
constexpr uint64_t kMaxBytes =
    static_cast<uint64_t>(std::numeric_limits<size_t>::max());

template <size_t N>
uint64_t parseWithUnits(const std::string& text,
                        const Unit (&units)[N],
                        uint64_t max,
                        const char* kind,
                        const std::string& field) {
  size_t digits = 0;
  while (digits < text.size() && text[digits] >= '0' && text[digits] <= '9') {
    ++digits;
  }

  const Unit* unit = nullptr;
  if (digits > 0) {
    std::string suffix = text.substr(digits);
    for (const auto& candidate : units) {
      if (suffix == candidate.suffix) {
        unit = &candidate;
        break;
      }
    }
  }
  if (unit == nullptr) {
    std::string expected;
    for (const auto& candidate : units) {
      expected += expected.empty() ? "" : ", ";
      expected += candidate.suffix;
    }
    throw UnitParseError(field, std::string("Invalid ") + kind + " '" + text +
                                    "', expected <number><unit> with unit " +
                                    expected);
  }

  uint64_t value = 0;
  bool overflow = false;
  for (size_t i = 0; i < digits && !overflow; ++i) {
    uint64_t digit = static_cast<uint64_t>(text[i] - '0');
    overflow = value > (max - digit) / 10;
    value = value * 10 + digit;
  }
  if (overflow || value > max / unit->scale) {
    throw UnitParseError(field, std::string(kind) + " '" + text +
                                    "' is too large (overflow)");
  }

  uint64_t result = value * unit->scale;
  MQTT_LOG(Debug, "Parsed {} '{}' as {}", kind, text, result);
  return result;
}

template <size_t N>
uint64_t numberFromJson(const nlohmann::json& value,
                        const Unit (&units)[N],
                        uint64_t max,
                        const char* kind,
                        const std::string& field) {
  if (value.is_string()) {
    return parseWithUnits(value.get<std::string>(), units, max, kind, field);
  }
  if (value.is_number_unsigned()) {
    uint64_t number = value.get<uint64_t>();
    if (number <= max) {
      return number;
    }
  } else if (value.is_number_integer()) {
    if (value.get<int64_t>() >= 0) {
      return value.get<uint64_t>();
    }
  } else if (value.is_number_float()) {
    double number = value.get<double>();
    if (std::isfinite(number) && number >= 0 &&
        number < static_cast<double>(max)) {
      return static_cast<uint64_t>(number);
    }
  } else {
    throw UnitParseError(field, std::string("Expected a ") + kind +
                                    " string or a number");
  }
  throw UnitParseError(field, std::string(kind) + " " + value.dump() +
                                  " is negative or too large");
}

template <size_t N>
std::string toStringWithUnits(uint64_t value, const Unit (&units)[N]) {
  if (value == 0) {
    return std::string("0") + units[0].suffix;
  }
  for (size_t i = N; i-- > 0;) {
    if (value % units[i].scale == 0) {
      return std::to_string(value / units[i].scale) + units[i].suffix;
    }
  }
  return std::to_string(value) + units[0].suffix;
}

}  // namespace

std::chrono::milliseconds Duration::parse(const std::string& text,
                                          const std::string& field) {
  return std::chrono::milliseconds(static_cast<int64_t>(
      parseWithUnits(text, kDurationUnits, kMaxMillis, "duration", field)));
}

std::chrono::milliseconds Duration::fromJson(const nlohmann::json& value,
                                             const std::string& field) {
  return std::chrono::milliseconds(static_cast<int64_t>(
      numberFromJson(value, kDurationUnits, kMaxMillis, "duration", field)));
}

std::string Duration::toString(std::chrono::milliseconds duration) {
  if (duration.count() < 0) {
    return "-" + toString(-duration);
  }
  return toStringWithUnits(static_cast<uint64_t>(duration.count()),
                           kDurationUnits);
}

uint64_t Size::parse(const std::string& text, const std::string& field) {
  return parseWithUnits(text, kSizeUnits, kMaxBytes, "size", field);
}

uint64_t Size::fromJson(const nlohmann::json& value,
                        const std::string& field) {
  return numberFromJson(value, kSizeUnits, kMaxBytes, "size", field);
}

std::string Size::toString(uint64_t bytes) {
  return toStringWithUnits(bytes, kSizeUnits);
}

}  // namespace config
}  // namespace mqtt
