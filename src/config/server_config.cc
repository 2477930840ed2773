#define MQTT_LOG_COMPONENT "config.server"

#include "mqtt/config/server_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <iterator>

#include <yaml-cpp/yaml.h>

#include "mqtt/codec/codec.h"
#include "mqtt/config/units.h"
#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace config {

namespace {

constexpr size_t MAX_FILE_SIZE_BYTES = 1024 * 1024;

nlohmann::json yamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return nullptr;
    case YAML::NodeType::Scalar: {
      const std::string& text = node.Scalar();
      // Quoted scalars stay strings
      if (node.Tag() == "!") {
        return text;
      }
      if (text == "true" || text == "false") {
        return text == "true";
      }
      int64_t integer = 0;
      if (YAML::convert<int64_t>::decode(node, integer)) {
        return integer;
      }
      double number = 0;
      if (text.find('.') != std::string::npos &&
          YAML::convert<double>::decode(node, number)) {
        return number;
      }
      return text;
    }
    case YAML::NodeType::Sequence: {
      auto result = nlohmann::json::array();
      for (const auto& item : node) {
        result.push_back(yamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      auto result = nlohmann::json::object();
      for (const auto& pair : node) {
        result[pair.first.as<std::string>()] = yamlToJson(pair.second);
      }
      return result;
    }
    default:
      break;
  }
  return nullptr;
}

std::string logLevelName(logging::LogLevel level) {
  std::string name = logging::logLevelToString(level);
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return name;
}

template <typename T>
T readUnsigned(const nlohmann::json& j,
               const std::string& field,
               uint64_t max_value) {
  const auto& value = j.at(field);
  if (!value.is_number_integer() || value.get<int64_t>() < 0) {
    throw ConfigValidationError(field, "Expected a non-negative integer");
  }
  uint64_t number = value.get<uint64_t>();
  if (number > max_value) {
    throw ConfigValidationError(
        field, "Value " + std::to_string(number) + " exceeds maximum " +
                   std::to_string(max_value));
  }
  return static_cast<T>(number);
}

}  // namespace

void ServerConfig::validate() const {
  if (address.empty()) {
    throw ConfigValidationError("address", "Listen address cannot be empty");
  }
  if (max_frame_size > codec::MAX_REMAINING_LENGTH) {
    throw ConfigValidationError(
        "max_frame_size",
        "Cannot exceed " + std::to_string(codec::MAX_REMAINING_LENGTH));
  }
  if (handshake_timeout.count() < 0) {
    throw ConfigValidationError("handshake_timeout", "Cannot be negative");
  }
  if (keep_alive_tick.count() <= 0) {
    throw ConfigValidationError("keep_alive_tick", "Must be positive");
  }
  if (default_idle_timeout.count() < 0) {
    throw ConfigValidationError("default_idle_timeout", "Cannot be negative");
  }
}

logging::SinkConfig ServerConfig::logSink() const {
  logging::SinkConfig sink;
  sink.file = log_file;
  sink.json = log_json;
  sink.max_file_size = static_cast<size_t>(log_max_size);
  return sink;
}

nlohmann::json ServerConfig::toJson() const {
  nlohmann::json j;
  j["address"] = address;
  j["port"] = port;
  j["max_frame_size"] = Size::toString(max_frame_size);
  j["max_inflight"] = max_inflight;
  j["handshake_timeout"] = Duration::toString(handshake_timeout);
  j["keep_alive_tick"] = Duration::toString(keep_alive_tick);
  j["default_idle_timeout"] = Duration::toString(default_idle_timeout);
  j["log_level"] = logLevelName(log_level);
  if (!log_file.empty()) {
    j["log_file"] = log_file;
  }
  j["log_format"] = log_json ? "json" : "text";
  j["log_max_size"] = Size::toString(log_max_size);
  return j;
}

ServerConfig ServerConfig::fromJson(const nlohmann::json& j) {
  ServerConfig config;
  if (!j.is_object()) {
    throw ConfigValidationError("<root>", "Expected an object");
  }

  auto has = [&j](const char* key) {
    return j.contains(key) && !j.at(key).is_null();
  };

  if (has("address")) {
    if (!j.at("address").is_string()) {
      throw ConfigValidationError("address", "Type error: expected string");
    }
    config.address = j.at("address").get<std::string>();
  }

  if (has("port")) {
    config.port = readUnsigned<uint16_t>(j, "port", 65535);
  }

  if (has("max_frame_size")) {
    uint64_t size = Size::fromJson(j.at("max_frame_size"), "max_frame_size");
    if (size > codec::MAX_REMAINING_LENGTH) {
      throw ConfigValidationError(
          "max_frame_size",
          "Cannot exceed " + std::to_string(codec::MAX_REMAINING_LENGTH));
    }
    config.max_frame_size = static_cast<uint32_t>(size);
  }

  if (has("max_inflight")) {
    config.max_inflight = readUnsigned<size_t>(j, "max_inflight", 65535);
  }

  if (has("handshake_timeout")) {
    config.handshake_timeout =
        Duration::fromJson(j.at("handshake_timeout"), "handshake_timeout");
  }

  if (has("keep_alive_tick")) {
    config.keep_alive_tick =
        Duration::fromJson(j.at("keep_alive_tick"), "keep_alive_tick");
  }

  if (has("default_idle_timeout")) {
    config.default_idle_timeout = Duration::fromJson(
        j.at("default_idle_timeout"), "default_idle_timeout");
  }

  if (has("log_level")) {
    if (!j.at("log_level").is_string() ||
        !logging::parseLogLevel(j.at("log_level").get<std::string>(),
                                config.log_level)) {
      throw ConfigValidationError(
          "log_level",
          "Expected one of debug, info, warning, error, critical, off");
    }
  }

  if (has("log_file")) {
    if (!j.at("log_file").is_string()) {
      throw ConfigValidationError("log_file", "Type error: expected string");
    }
    config.log_file = j.at("log_file").get<std::string>();
  }

  if (has("log_max_size")) {
    config.log_max_size = Size::fromJson(j.at("log_max_size"), "log_max_size");
  }

  if (has("log_format")) {
    const auto& format = j.at("log_format");
    if (format != "text" && format != "json") {
      throw ConfigValidationError("log_format", "Expected text or json");
    }
    config.log_json = format == "json";
  }

  for (auto it = j.begin(); it != j.end(); ++it) {
    static const char* const known[] = {"address",
                                        "port",
                                        "max_frame_size",
                                        "max_inflight",
                                        "handshake_timeout",
                                        "keep_alive_tick",
                                        "default_idle_timeout",
                                        "log_level",
                                        "log_file",
                                        "log_format",
                                        "log_max_size"};
    if (std::find(std::begin(known), std::end(known), it.key()) ==
        std::end(known)) {
      MQTT_LOG(Warning, "Ignoring unknown configuration field '{}'", it.key());
    }
  }

  return config;
}

std::string substituteEnvironmentVariables(const std::string& content) {
  static const std::regex env_regex(
      R"(\$\{([A-Za-z_][A-Za-z0-9_]*)(:-([^}]*))?\})");

  std::string result;
  size_t vars_expanded = 0;
  auto last = content.cbegin();

  for (std::sregex_iterator it(content.cbegin(), content.cend(), env_regex),
       end;
       it != end; ++it) {
    const std::smatch& match = *it;
    std::string var_name = match[1].str();
    bool has_default = match[2].matched;

    const char* env_value = std::getenv(var_name.c_str());
    if (!env_value && !has_default) {
      MQTT_LOG(Error, "Undefined environment variable without default: ${{{}}}",
               var_name);
      throw std::runtime_error("Undefined environment variable: " + var_name);
    }

    result.append(last, match[0].first);
    result.append(env_value ? std::string(env_value) : match[3].str());
    last = match[0].second;
    ++vars_expanded;
  }
  result.append(last, content.cend());

  if (vars_expanded > 0) {
    MQTT_LOG(Debug, "Expanded {} environment variables", vars_expanded);
  }
  return result;
}

nlohmann::json parseConfigText(const std::string& content) {
  auto json = nlohmann::json::parse(content, nullptr, false);
  if (!json.is_discarded()) {
    return json;
  }

  try {
    YAML::Node root = YAML::Load(content);
    return yamlToJson(root);
  } catch (const YAML::ParserException& e) {
    std::ostringstream error;
    error << "YAML parse error at line " << e.mark.line + 1 << ", column "
          << e.mark.column + 1;
    throw std::runtime_error(error.str());
  }
}

ServerConfig loadServerConfigFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open configuration file: " + path);
  }

  std::ostringstream contents;
  contents << file.rdbuf();
  std::string content = contents.str();
  if (content.size() > MAX_FILE_SIZE_BYTES) {
    throw std::runtime_error("Configuration file too large: " + path);
  }

  MQTT_LOG(Info, "Loading configuration from {}", path);
  nlohmann::json j = parseConfigText(substituteEnvironmentVariables(content));
  if (j.is_null()) {
    j = nlohmann::json::object();
  }

  ServerConfig config = ServerConfig::fromJson(j);
  config.validate();
  return config;
}

}  // namespace config
}  // namespace mqtt
