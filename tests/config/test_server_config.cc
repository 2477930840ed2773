#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include <unistd.h>

#include "mqtt/config/server_config.h"
#include "mqtt/config/units.h"

namespace mqtt {
namespace config {
namespace {

using namespace std::chrono_literals;

// Writes `content` to a unique file removed with the fixture
class ServerConfigFileTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (!path_.empty()) {
      std::remove(path_.c_str());
    }
    ::unsetenv("MQTT_TEST_PORT");
    ::unsetenv("MQTT_TEST_ADDRESS");
  }

  std::string writeFile(const std::string& content,
                        const std::string& suffix) {
    path_ = ::testing::TempDir() + "mqtt_config_" +
            std::to_string(::getpid()) + suffix;
    std::ofstream out(path_, std::ios::binary);
    out << content;
    return path_;
  }

  std::string path_;
};

TEST(ServerConfigTest, Defaults) {
  ServerConfig config;
  EXPECT_EQ("127.0.0.1", config.address);
  EXPECT_EQ(1883, config.port);
  EXPECT_EQ(0u, config.max_frame_size);
  EXPECT_EQ(15u, config.max_inflight);
  EXPECT_EQ(0ms, config.handshake_timeout);
  EXPECT_EQ(1000ms, config.keep_alive_tick);
  EXPECT_EQ(0ms, config.default_idle_timeout);
  EXPECT_EQ(logging::LogLevel::Info, config.log_level);
  EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfigTest, FromJsonWithUnits) {
  auto j = nlohmann::json::parse(R"({
    "address": "0.0.0.0",
    "port": 8883,
    "max_frame_size": "256KB",
    "max_inflight": 4,
    "handshake_timeout": "5s",
    "keep_alive_tick": 250,
    "default_idle_timeout": "5m",
    "log_level": "debug"
  })");

  ServerConfig config = ServerConfig::fromJson(j);
  EXPECT_EQ("0.0.0.0", config.address);
  EXPECT_EQ(8883, config.port);
  EXPECT_EQ(262144u, config.max_frame_size);
  EXPECT_EQ(4u, config.max_inflight);
  EXPECT_EQ(5000ms, config.handshake_timeout);
  EXPECT_EQ(250ms, config.keep_alive_tick);
  EXPECT_EQ(300000ms, config.default_idle_timeout);
  EXPECT_EQ(logging::LogLevel::Debug, config.log_level);
}

TEST(ServerConfigTest, AbsentFieldsKeepDefaults) {
  ServerConfig config =
      ServerConfig::fromJson(nlohmann::json::parse(R"({"port": 0})"));
  EXPECT_EQ(0, config.port);
  EXPECT_EQ("127.0.0.1", config.address);
  EXPECT_EQ(15u, config.max_inflight);
  EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfigTest, JsonRoundTripKeepsValues) {
  ServerConfig config;
  config.port = 1884;
  config.max_frame_size = 65536;
  config.handshake_timeout = 3s;
  config.log_level = logging::LogLevel::Warning;

  nlohmann::json j = config.toJson();
  EXPECT_EQ("64KB", j["max_frame_size"]);
  EXPECT_EQ("3s", j["handshake_timeout"]);
  EXPECT_EQ("warning", j["log_level"]);

  ServerConfig parsed = ServerConfig::fromJson(j);
  EXPECT_EQ(1884, parsed.port);
  EXPECT_EQ(65536u, parsed.max_frame_size);
  EXPECT_EQ(3000ms, parsed.handshake_timeout);
  EXPECT_EQ(logging::LogLevel::Warning, parsed.log_level);
}

TEST(ServerConfigTest, LogDestination) {
  ServerConfig config = ServerConfig::fromJson(nlohmann::json::parse(R"({
    "log_file": "/var/log/mqtt.log",
    "log_format": "json",
    "log_max_size": "50MB"
  })"));
  EXPECT_EQ("/var/log/mqtt.log", config.log_file);
  EXPECT_TRUE(config.log_json);
  EXPECT_EQ(50u * 1024 * 1024, config.log_max_size);

  logging::SinkConfig sink = config.logSink();
  EXPECT_EQ("/var/log/mqtt.log", sink.file);
  EXPECT_TRUE(sink.json);
  EXPECT_EQ(50u * 1024 * 1024, sink.max_file_size);

  nlohmann::json j = config.toJson();
  EXPECT_EQ("json", j["log_format"]);
  EXPECT_EQ("/var/log/mqtt.log", j["log_file"]);

  // Defaults write text to stderr
  ServerConfig defaults;
  EXPECT_TRUE(defaults.logSink().file.empty());
  EXPECT_EQ("text", defaults.toJson()["log_format"]);
  EXPECT_FALSE(defaults.toJson().contains("log_file"));
}

TEST(ServerConfigTest, BadLogFormatThrows) {
  try {
    ServerConfig::fromJson(
        nlohmann::json::parse(R"({"log_format": "xml"})"));
    FAIL() << "Expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_EQ("log_format", e.field());
  }
  EXPECT_THROW(ServerConfig::fromJson(
                   nlohmann::json::parse(R"({"log_file": 3})")),
               ConfigValidationError);
}

TEST(ServerConfigTest, TypeErrorsNameTheField) {
  try {
    ServerConfig::fromJson(nlohmann::json::parse(R"({"port": "high"})"));
    FAIL() << "Expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_EQ("port", e.field());
  }

  try {
    ServerConfig::fromJson(nlohmann::json::parse(R"({"port": 70000})"));
    FAIL() << "Expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_EQ("port", e.field());
    EXPECT_NE(std::string::npos, e.reason().find("exceeds maximum"));
  }

  EXPECT_THROW(
      ServerConfig::fromJson(nlohmann::json::parse(R"({"address": 5})")),
      ConfigValidationError);
  EXPECT_THROW(ServerConfig::fromJson(
                   nlohmann::json::parse(R"({"log_level": "loud"})")),
               ConfigValidationError);
  EXPECT_THROW(ServerConfig::fromJson(nlohmann::json::array()),
               ConfigValidationError);
}

TEST(ServerConfigTest, BadUnitsThrow) {
  EXPECT_THROW(ServerConfig::fromJson(
                   nlohmann::json::parse(R"({"handshake_timeout": "5 s"})")),
               UnitParseError);
  EXPECT_THROW(ServerConfig::fromJson(
                   nlohmann::json::parse(R"({"max_frame_size": "1TB"})")),
               UnitParseError);
}

TEST(ServerConfigTest, FrameSizeAboveProtocolLimit) {
  try {
    ServerConfig::fromJson(
        nlohmann::json::parse(R"({"max_frame_size": "1GB"})"));
    FAIL() << "Expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_EQ("max_frame_size", e.field());
  }
}

TEST(ServerConfigTest, ValidateRejectsOutOfRange) {
  ServerConfig config;
  config.keep_alive_tick = 0ms;
  EXPECT_THROW(config.validate(), ConfigValidationError);

  config = ServerConfig();
  config.address.clear();
  EXPECT_THROW(config.validate(), ConfigValidationError);

  config = ServerConfig();
  config.handshake_timeout = -1ms;
  EXPECT_THROW(config.validate(), ConfigValidationError);

  config = ServerConfig();
  config.max_frame_size = 268435456;
  EXPECT_THROW(config.validate(), ConfigValidationError);
}

// ============================================================================
// Text parsing
// ============================================================================

TEST(ServerConfigTextTest, ParsesJsonAndYaml) {
  auto json = parseConfigText(R"({"port": 1999})");
  EXPECT_EQ(1999, json["port"].get<int>());

  auto yaml = parseConfigText(
      "address: 0.0.0.0\n"
      "port: 2000\n"
      "max_frame_size: \"1MB\"\n"
      "handshake_timeout: 5s\n"
      "log_level: error\n");
  EXPECT_EQ("0.0.0.0", yaml["address"]);
  EXPECT_EQ(2000, yaml["port"].get<int>());
  EXPECT_EQ("1MB", yaml["max_frame_size"]);
  EXPECT_EQ("5s", yaml["handshake_timeout"]);

  ServerConfig config = ServerConfig::fromJson(yaml);
  EXPECT_EQ(1048576u, config.max_frame_size);
  EXPECT_EQ(logging::LogLevel::Error, config.log_level);
}

TEST(ServerConfigTextTest, YamlSyntaxErrorReportsLine) {
  try {
    parseConfigText("port: 1883\naddress: [unclosed\n");
    FAIL() << "Expected a parse error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string::npos, std::string(e.what()).find("YAML"));
  }
}

TEST(ServerConfigTextTest, EnvironmentSubstitution) {
  ::setenv("MQTT_TEST_PORT", "2883", 1);
  ::unsetenv("MQTT_TEST_ADDRESS");

  EXPECT_EQ("port: 2883",
            substituteEnvironmentVariables("port: ${MQTT_TEST_PORT}"));
  EXPECT_EQ("address: 10.0.0.1",
            substituteEnvironmentVariables(
                "address: ${MQTT_TEST_ADDRESS:-10.0.0.1}"));
  EXPECT_EQ("no variables", substituteEnvironmentVariables("no variables"));
  EXPECT_THROW(substituteEnvironmentVariables("${MQTT_TEST_ADDRESS}"),
               std::runtime_error);

  ::unsetenv("MQTT_TEST_PORT");
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ServerConfigFileTest, LoadsYamlFileWithEnvironment) {
  ::setenv("MQTT_TEST_PORT", "1999", 1);
  std::string path = writeFile(
      "# broker settings\n"
      "address: ${MQTT_TEST_ADDRESS:-0.0.0.0}\n"
      "port: ${MQTT_TEST_PORT}\n"
      "max_inflight: 8\n"
      "keep_alive_tick: 500ms\n",
      ".yaml");

  ServerConfig config = loadServerConfigFile(path);
  EXPECT_EQ("0.0.0.0", config.address);
  EXPECT_EQ(1999, config.port);
  EXPECT_EQ(8u, config.max_inflight);
  EXPECT_EQ(500ms, config.keep_alive_tick);
}

TEST_F(ServerConfigFileTest, LoadsJsonFile) {
  std::string path =
      writeFile(R"({"port": 1885, "default_idle_timeout": "2m"})", ".json");

  ServerConfig config = loadServerConfigFile(path);
  EXPECT_EQ(1885, config.port);
  EXPECT_EQ(120000ms, config.default_idle_timeout);
}

TEST_F(ServerConfigFileTest, EmptyFileGivesDefaults) {
  std::string path = writeFile("", ".yaml");
  ServerConfig config = loadServerConfigFile(path);
  EXPECT_EQ(1883, config.port);
}

TEST_F(ServerConfigFileTest, InvalidFileContentThrows) {
  std::string path = writeFile("keep_alive_tick: 0ms\n", ".yaml");
  EXPECT_THROW(loadServerConfigFile(path), ConfigValidationError);
}

TEST_F(ServerConfigFileTest, MissingFileThrows) {
  EXPECT_THROW(loadServerConfigFile("/nonexistent/mqtt.yaml"),
               std::runtime_error);
}

}  // namespace
}  // namespace config
}  // namespace mqtt
