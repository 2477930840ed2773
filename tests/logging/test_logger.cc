#define MQTT_LOG_COMPONENT "registry.macro"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "mqtt/logging/log_formatter.h"
#include "mqtt/logging/log_macros.h"
#include "mqtt/logging/log_sink.h"
#include "mqtt/logging/logger.h"
#include "mqtt/logging/logger_registry.h"

#include "../mocks/test_log_sink.h"

using namespace mqtt::logging;
using mqtt::test::TestLogSink;

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override { sink_ = std::make_shared<TestLogSink>(); }

  std::shared_ptr<TestLogSink> sink_;
};

TEST_F(LoggerTest, BasicLogging) {
  Logger logger("test");
  logger.setSink(sink_);

  logger.info("Test message");

  auto messages = sink_->messages();
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ(LogLevel::Info, messages[0].level);
  EXPECT_EQ("Test message", messages[0].message);
  EXPECT_EQ("test", messages[0].logger_name);
}

TEST_F(LoggerTest, LogLevelFiltering) {
  Logger logger("test");
  logger.setSink(sink_);
  logger.setLevel(LogLevel::Warning);

  logger.debug("Debug - should not appear");
  logger.info("Info - should not appear");
  logger.warning("Warning - should appear");
  logger.error("Error - should appear");

  auto messages = sink_->messages();
  ASSERT_EQ(2u, messages.size());
  EXPECT_EQ("Warning - should appear", messages[0].message);
  EXPECT_EQ("Error - should appear", messages[1].message);
}

TEST_F(LoggerTest, OffSuppressesEverything) {
  Logger logger("test");
  logger.setSink(sink_);
  logger.setLevel(LogLevel::Off);

  logger.error("never");
  EXPECT_EQ(0u, sink_->count());
  EXPECT_FALSE(logger.shouldLog(LogLevel::Critical));
}

TEST_F(LoggerTest, FormattedLogging) {
  Logger logger("test");
  logger.setSink(sink_);

  logger.info("Packet {} with id {}", "PUBLISH", 42);

  auto messages = sink_->messages();
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ("Packet PUBLISH with id 42", messages[0].message);
}

TEST_F(LoggerTest, BracesWithoutArgumentsArePassedThrough) {
  Logger logger("test");
  logger.setSink(sink_);

  logger.info("literal {}");
  EXPECT_EQ("literal {}", sink_->messages()[0].message);
}

TEST_F(LoggerTest, LocationLogging) {
  Logger logger("server.connection", Component::Server);
  logger.setSink(sink_);

  logger.log(LogLevel::Error, "connection.cc", 42, "close",
             "Closing connection {}", 7);

  auto messages = sink_->messages();
  ASSERT_EQ(1u, messages.size());
  EXPECT_STREQ("connection.cc", messages[0].file);
  EXPECT_EQ(42, messages[0].line);
  EXPECT_STREQ("close", messages[0].function);
  EXPECT_EQ(Component::Server, messages[0].component);
  EXPECT_EQ("Closing connection 7", messages[0].message);
  EXPECT_TRUE(messages[0].context.empty());
}

TEST_F(LoggerTest, ContextTagsMessage) {
  Logger logger("server.connection", Component::Server);
  logger.setSink(sink_);

  LogContext context;
  context.connection_id = 12;
  context.client_id = "sensor-1";
  logger.log(context, LogLevel::Info, "connection.cc", 7, "onAccepted",
             "Client connected (keep_alive={}s)", 30);

  auto messages = sink_->messages();
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ(12u, messages[0].context.connection_id);
  EXPECT_EQ("sensor-1", messages[0].context.client_id);
  EXPECT_EQ("Client connected (keep_alive=30s)", messages[0].message);
}

TEST_F(LoggerTest, ContextRespectsLevel) {
  Logger logger("client");
  logger.setSink(sink_);
  logger.setLevel(LogLevel::Error);

  LogContext context;
  context.client_id = "quiet";
  logger.log(context, LogLevel::Warning, nullptr, 0, nullptr, "dropped");
  EXPECT_EQ(0u, sink_->count());
}

TEST_F(LoggerTest, ConcurrentLogging) {
  Logger logger("test");
  logger.setSink(sink_);

  const int num_threads = 4;
  const int messages_per_thread = 100;

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&logger, t]() {
      for (int i = 0; i < messages_per_thread; ++i) {
        logger.info("Thread {} message {}", t, i);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(static_cast<size_t>(num_threads * messages_per_thread),
            sink_->count());
}

TEST_F(LoggerTest, GettersAndSetters) {
  Logger logger("test_logger");
  EXPECT_EQ("test_logger", logger.getName());
  EXPECT_EQ(LogLevel::Info, logger.getLevel());

  logger.setLevel(LogLevel::Debug);
  EXPECT_EQ(LogLevel::Debug, logger.getLevel());

  logger.setSink(sink_);
  EXPECT_EQ(sink_, logger.getSink());
}

// ============================================================================
// Registry
// ============================================================================

class LoggerRegistryTest : public ::testing::Test {
 protected:
  void TearDown() override {
    auto& registry = LoggerRegistry::instance();
    registry.clearPatterns();
    registry.setGlobalLevel(LogLevel::Info);
    registry.setDefaultSink(std::make_shared<StdioSink>(StdioSink::Stderr));
  }
};

TEST_F(LoggerRegistryTest, SameNameSameLogger) {
  auto& registry = LoggerRegistry::instance();
  auto a = registry.getOrCreateLogger("registry.same");
  auto b = registry.getOrCreateLogger("registry.same");
  EXPECT_EQ(a, b);
  EXPECT_NE(a, registry.getOrCreateLogger("registry.other"));
}

TEST_F(LoggerRegistryTest, ComponentFromDottedName) {
  EXPECT_EQ(Component::Server,
            LoggerRegistry::componentFromName("server.connection"));
  EXPECT_EQ(Component::Protocol,
            LoggerRegistry::componentFromName("protocol.keepalive"));
  EXPECT_EQ(Component::Codec, LoggerRegistry::componentFromName("codec"));
  EXPECT_EQ(Component::Root, LoggerRegistry::componentFromName("unknown.x"));
  EXPECT_EQ(Component::Root, LoggerRegistry::componentFromName("Server"));

  auto logger = LoggerRegistry::instance().getOrCreateLogger("session.sink");
  EXPECT_EQ(Component::Session, logger->component());
}

TEST_F(LoggerRegistryTest, GlobalLevelAppliesToAll) {
  auto& registry = LoggerRegistry::instance();
  auto logger = registry.getOrCreateLogger("registry.global");

  registry.setGlobalLevel(LogLevel::Error);
  EXPECT_EQ(LogLevel::Error, registry.getGlobalLevel());
  EXPECT_EQ(LogLevel::Error, logger->getLevel());
  EXPECT_FALSE(logger->shouldLog(LogLevel::Warning));
}

TEST_F(LoggerRegistryTest, PatternsOverrideGlobalLevel) {
  auto& registry = LoggerRegistry::instance();
  auto codec = registry.getOrCreateLogger("pattern.codec");
  auto server = registry.getOrCreateLogger("pattern.server");

  registry.setGlobalLevel(LogLevel::Warning);
  registry.setPattern("pattern.code?", LogLevel::Debug);

  EXPECT_EQ(LogLevel::Debug, codec->getLevel());
  EXPECT_EQ(LogLevel::Warning, server->getLevel());
  EXPECT_EQ(LogLevel::Debug, registry.getEffectiveLevel("pattern.codec"));

  // Later patterns win
  registry.setPattern("pattern.*", LogLevel::Error);
  EXPECT_EQ(LogLevel::Error, registry.getEffectiveLevel("pattern.codec"));

  // Loggers created after the pattern pick it up
  auto late = registry.getOrCreateLogger("pattern.late");
  EXPECT_EQ(LogLevel::Error, late->getLevel());

  registry.clearPatterns();
  EXPECT_EQ(LogLevel::Warning, codec->getLevel());
}

TEST_F(LoggerRegistryTest, PatternDotIsLiteral) {
  auto& registry = LoggerRegistry::instance();
  registry.setGlobalLevel(LogLevel::Info);
  registry.setPattern("server.*", LogLevel::Debug);

  EXPECT_EQ(LogLevel::Debug, registry.getEffectiveLevel("server.router"));
  EXPECT_EQ(LogLevel::Info, registry.getEffectiveLevel("serverXrouter"));
}

TEST_F(LoggerRegistryTest, DefaultSinkReachesMacroLogging) {
  auto& registry = LoggerRegistry::instance();
  auto sink = std::make_shared<TestLogSink>();
  registry.setDefaultSink(sink);
  registry.setGlobalLevel(LogLevel::Debug);

  LogContext context;
  context.connection_id = 3;

  MQTT_LOG(Info, "Connection {} accepted", 3);
  MQTT_CONN_LOG(Debug, context, "debug line");

  EXPECT_TRUE(sink->hasMessage(LogLevel::Info, "Connection 3 accepted"));
  EXPECT_TRUE(sink->hasMessage(LogLevel::Debug, "debug line"));
  auto messages = sink->messages();
  ASSERT_EQ(2u, messages.size());
  EXPECT_EQ("registry.macro", messages[0].logger_name);
  EXPECT_NE(nullptr, messages[0].file);
  EXPECT_EQ(0u, messages[0].context.connection_id);
  EXPECT_EQ(3u, messages[1].context.connection_id);

  auto names = registry.getLoggerNames();
  EXPECT_NE(names.end(), std::find(names.begin(), names.end(),
                                   std::string("registry.macro")));
}

// ============================================================================
// Formatters and sinks
// ============================================================================

static LogMessage sampleMessage() {
  LogMessage msg;
  msg.level = LogLevel::Warning;
  msg.message = "Keep-alive expired";
  msg.logger_name = "protocol.keepalive";
  msg.component = Component::Protocol;
  msg.file = "src/protocol/keep_alive_monitor.cc";
  msg.line = 12;
  msg.function = "onTick";
  msg.context.connection_id = 5;
  msg.context.client_id = "sensor-1";
  return msg;
}

TEST(LogFormatterTest, DefaultFormat) {
  std::string line = DefaultFormatter().format(sampleMessage());

  EXPECT_NE(std::string::npos, line.find("[WARNING]"));
  EXPECT_NE(std::string::npos, line.find("[protocol.keepalive]"));
  EXPECT_NE(std::string::npos, line.find("[keep_alive_monitor.cc:12]"));
  EXPECT_EQ(std::string::npos, line.find("src/protocol"));
  EXPECT_NE(std::string::npos,
            line.find("[conn:5] [client:sensor-1] Keep-alive expired"));
}

TEST(LogFormatterTest, JsonFormat) {
  std::string line = JsonFormatter().format(sampleMessage());
  auto j = nlohmann::json::parse(line);

  EXPECT_EQ("WARNING", j["level"]);
  EXPECT_EQ("protocol.keepalive", j["logger"]);
  EXPECT_EQ("protocol", j["component"]);
  EXPECT_EQ(12, j["line"].get<int>());
  EXPECT_EQ("onTick", j["function"]);
  EXPECT_EQ(5u, j["connection_id"].get<uint64_t>());
  EXPECT_EQ("sensor-1", j["client_id"]);
  EXPECT_EQ("Keep-alive expired", j["message"]);
}

TEST(LogFormatterTest, JsonOmitsEmptyContext) {
  LogMessage msg;
  msg.message = "engine";
  auto j = nlohmann::json::parse(JsonFormatter().format(msg));
  EXPECT_FALSE(j.contains("connection_id"));
  EXPECT_FALSE(j.contains("client_id"));
  EXPECT_FALSE(j.contains("file"));
}

TEST(LogFormatterTest, JsonFormatToleratesBinaryPayload) {
  LogMessage msg;
  msg.context.client_id = std::string("id\xc3", 3);
  msg.message = std::string("payload \xff\xfe", 10);
  std::string line;
  EXPECT_NO_THROW(line = JsonFormatter().format(msg));
  EXPECT_FALSE(nlohmann::json::parse(line)["message"].get<std::string>()
                   .empty());
}

TEST(LogSinkTest, ExternalSinkForwardsFormattedLine) {
  std::vector<std::string> lines;
  auto sink = std::make_shared<ExternalSink>(
      [&](LogLevel level, const std::string& name, const std::string& line) {
        EXPECT_EQ(LogLevel::Info, level);
        EXPECT_EQ("external", name);
        lines.push_back(line);
      });

  Logger logger("external");
  logger.setSink(sink);
  logger.info("hello {}", "world");

  ASSERT_EQ(1u, lines.size());
  EXPECT_NE(std::string::npos, lines[0].find("hello world"));
}

class RotatingFileSinkTest : public ::testing::Test {
 protected:
  void SetUp() override {
    base_ = ::testing::TempDir() + "mqtt_log_rotate.log";
    removeAll();
  }
  void TearDown() override { removeAll(); }

  void removeAll() {
    std::remove(base_.c_str());
    for (int i = 1; i <= 3; ++i) {
      std::remove((base_ + "." + std::to_string(i)).c_str());
    }
  }

  static bool exists(const std::string& path) {
    return std::ifstream(path).good();
  }

  std::string base_;
};

TEST_F(RotatingFileSinkTest, RotatesBySize) {
  {
    RotatingFileSink::Config config;
    config.path = base_;
    config.max_file_size = 200;
    config.max_files = 2;
    config.flush_each_line = true;
    RotatingFileSink sink(config);
    sink.setFormatter(std::make_unique<JsonFormatter>());

    for (int i = 0; i < 10; ++i) {
      sink.log(sampleMessage());
    }
  }

  EXPECT_TRUE(exists(base_));
  EXPECT_TRUE(exists(base_ + ".1"));
  EXPECT_TRUE(exists(base_ + ".2"));
  EXPECT_FALSE(exists(base_ + ".3"));

  std::ifstream current(base_);
  std::string line;
  ASSERT_TRUE(static_cast<bool>(std::getline(current, line)));
  EXPECT_EQ("Keep-alive expired", nlohmann::json::parse(line)["message"]);
}

TEST_F(RotatingFileSinkTest, AppendsToExistingFile) {
  {
    std::ofstream existing(base_);
    existing << "earlier line\n";
  }

  RotatingFileSink::Config config;
  config.path = base_;
  {
    RotatingFileSink sink(config);
    sink.log(sampleMessage());
  }

  std::ifstream in(base_);
  std::string first;
  std::string second;
  ASSERT_TRUE(static_cast<bool>(std::getline(in, first)));
  ASSERT_TRUE(static_cast<bool>(std::getline(in, second)));
  EXPECT_EQ("earlier line", first);
  EXPECT_NE(std::string::npos, second.find("Keep-alive expired"));
}

TEST(LogSinkTest, UnwritableFileThrows) {
  RotatingFileSink::Config config;
  config.path = "/nonexistent-dir/mqtt.log";
  EXPECT_THROW(RotatingFileSink sink(config), std::runtime_error);
}

TEST(LogSinkTest, CreateSinkFromConfig) {
  std::string path = ::testing::TempDir() + "mqtt_log_config.log";
  std::remove(path.c_str());

  SinkConfig config;
  config.file = path;
  config.json = true;
  {
    auto sink = createSink(config);
    ASSERT_NE(nullptr, sink);
    sink->log(sampleMessage());
    sink->flush();
  }

  std::ifstream in(path);
  std::string line;
  ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
  EXPECT_EQ("sensor-1", nlohmann::json::parse(line)["client_id"]);
  std::remove(path.c_str());

  EXPECT_NE(nullptr, createSink(SinkConfig()));
}

TEST(LogLevelTest, Names) {
  EXPECT_STREQ("DEBUG", logLevelToString(LogLevel::Debug));
  EXPECT_STREQ("OFF", logLevelToString(LogLevel::Off));
  EXPECT_STREQ("transport", componentToString(Component::Transport));

  LogLevel level = LogLevel::Info;
  EXPECT_TRUE(parseLogLevel("warning", level));
  EXPECT_EQ(LogLevel::Warning, level);
  EXPECT_TRUE(parseLogLevel("CRITICAL", level));
  EXPECT_EQ(LogLevel::Critical, level);
  EXPECT_FALSE(parseLogLevel("chatty", level));
  EXPECT_EQ(LogLevel::Critical, level);
}
