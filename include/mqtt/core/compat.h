#ifndef MQTT_CORE_COMPAT_H
#define MQTT_CORE_COMPAT_H

// optional/variant spelled once for the whole library. Packets are a
// variant and most results an optional, so these names appear everywhere.

#include <optional>
#include <variant>

namespace mqtt {

template <typename T>
using optional = std::optional<T>;

inline constexpr auto nullopt = std::nullopt;

using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace mqtt

#endif  // MQTT_CORE_COMPAT_H
