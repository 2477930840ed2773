#ifndef MQTT_CONFIG_UNITS_H
#define MQTT_CONFIG_UNITS_H

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace mqtt {
namespace config {

/**
 * A duration or size that could not be parsed. `field()` names the
 * configuration field, or is empty for a bare string.
 */
class UnitParseError : public std::runtime_error {
 public:
  UnitParseError(const std::string& field, const std::string& reason)
      : std::runtime_error(field.empty()
                               ? reason
                               : "Field '" + field + "': " + reason),
        field_(field) {}

  const std::string& field() const { return field_; }

 private:
  std::string field_;
};

/**
 * Durations are written `<digits><unit>` with unit ms, s, m or h, e.g.
 * "250ms", "30s", "5m". In JSON a plain number means milliseconds.
 */
class Duration {
 public:
  // @throws UnitParseError
  static std::chrono::milliseconds parse(const std::string& text,
                                         const std::string& field = "");

  // @throws UnitParseError
  static std::chrono::milliseconds fromJson(const nlohmann::json& value,
                                            const std::string& field);

  // Largest unit that divides evenly: 60000ms -> "1m", 1500ms -> "1500ms"
  static std::string toString(std::chrono::milliseconds duration);
};

/**
 * Sizes are written `<digits><unit>` with unit B, KB, MB or GB in binary
 * multiples, e.g. "256KB". In JSON a plain number means bytes.
 */
class Size {
 public:
  static constexpr uint64_t KB = 1024;
  static constexpr uint64_t MB = KB * 1024;
  static constexpr uint64_t GB = MB * 1024;

  // @throws UnitParseError
  static uint64_t parse(const std::string& text,
                        const std::string& field = "");

  // @throws UnitParseError
  static uint64_t fromJson(const nlohmann::json& value,
                           const std::string& field);

  static std::string toString(uint64_t bytes);
};

}  // namespace config
}  // namespace mqtt

#endif  // MQTT_CONFIG_UNITS_H
