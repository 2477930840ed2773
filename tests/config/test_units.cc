#include <gtest/gtest.h>

#include "mqtt/config/units.h"

#include <memory>
#include <string>
#include <vector>

#include "../mocks/test_log_sink.h"

namespace mqtt {
namespace config {
namespace {

using namespace std::chrono_literals;

class UnitsTest : public ::testing::Test {
 protected:
  void SetUp() override { test_sink_ = test::captureLogger("config.units"); }

  std::shared_ptr<test::TestLogSink> test_sink_;
};

TEST_F(UnitsTest, DurationUnits) {
  EXPECT_EQ(0ms, Duration::parse("0ms"));
  EXPECT_EQ(250ms, Duration::parse("250ms"));
  EXPECT_EQ(30s, Duration::parse("30s"));
  EXPECT_EQ(5min, Duration::parse("5m"));
  EXPECT_EQ(24h, Duration::parse("24h"));
  EXPECT_EQ(90min, Duration::parse("90m"));

  EXPECT_TRUE(test_sink_->hasMessage(logging::LogLevel::Debug,
                                     "Parsed duration '24h'"));
}

TEST_F(UnitsTest, DurationRejectsMalformedText) {
  std::vector<std::string> invalid = {
      "", "10", "ms", "10 ms", "-5s", "1.5s", "10sec", "10S", "1d", "10m30s",
  };

  for (const auto& text : invalid) {
    try {
      Duration::parse(text, "handshake_timeout");
      ADD_FAILURE() << "Accepted '" << text << "'";
    } catch (const UnitParseError& e) {
      EXPECT_EQ("handshake_timeout", e.field());
      EXPECT_NE(std::string::npos, std::string(e.what()).find("ms, s, m, h"))
          << e.what();
    }
  }
}

TEST_F(UnitsTest, DurationOverflow) {
  try {
    Duration::parse("9999999999999h");
    FAIL() << "Expected UnitParseError";
  } catch (const UnitParseError& e) {
    EXPECT_TRUE(e.field().empty());
    EXPECT_NE(std::string::npos, std::string(e.what()).find("overflow"));
  }
  EXPECT_THROW(Duration::parse("99999999999999999999999ms"), UnitParseError);
}

TEST_F(UnitsTest, DurationFromJson) {
  EXPECT_EQ(30s, Duration::fromJson(nlohmann::json("30s"), "t"));

  // Bare numbers are milliseconds
  EXPECT_EQ(5000ms, Duration::fromJson(nlohmann::json(5000), "t"));
  EXPECT_EQ(1500ms, Duration::fromJson(nlohmann::json(1500.7), "t"));

  EXPECT_THROW(Duration::fromJson(nlohmann::json(-1), "t"), UnitParseError);
  EXPECT_THROW(Duration::fromJson(nlohmann::json(-0.5), "t"), UnitParseError);
  EXPECT_THROW(Duration::fromJson(nlohmann::json::array(), "t"),
               UnitParseError);
  EXPECT_THROW(Duration::fromJson(nlohmann::json(true), "t"), UnitParseError);
}

TEST_F(UnitsTest, DurationToString) {
  EXPECT_EQ("0ms", Duration::toString(0ms));
  EXPECT_EQ("500ms", Duration::toString(500ms));
  EXPECT_EQ("1s", Duration::toString(1000ms));
  EXPECT_EQ("1m", Duration::toString(60s));
  EXPECT_EQ("2h", Duration::toString(120min));
  EXPECT_EQ("1500ms", Duration::toString(1500ms));
  EXPECT_EQ("61s", Duration::toString(61s));
}

TEST_F(UnitsTest, SizeUnits) {
  EXPECT_EQ(0u, Size::parse("0B"));
  EXPECT_EQ(1024u, Size::parse("1024B"));
  EXPECT_EQ(1024u, Size::parse("1KB"));
  EXPECT_EQ(262144u, Size::parse("256KB"));
  EXPECT_EQ(268435456u, Size::parse("256MB"));
  EXPECT_EQ(Size::GB, Size::parse("1GB"));

  EXPECT_TRUE(
      test_sink_->hasMessage(logging::LogLevel::Debug, "Parsed size '1GB'"));
}

TEST_F(UnitsTest, SizeRejectsMalformedText) {
  std::vector<std::string> invalid = {
      "", "10", "KB", "10 KB", "-5MB", "1.5GB", "10mb", "1TB", "10BK",
  };

  for (const auto& text : invalid) {
    EXPECT_THROW(Size::parse(text, "max_frame_size"), UnitParseError)
        << text;
  }
  EXPECT_THROW(Size::parse("999999999999GB"), UnitParseError);
}

TEST_F(UnitsTest, SizeFromJson) {
  EXPECT_EQ(10485760u, Size::fromJson(nlohmann::json("10MB"), "limit"));

  // Bare numbers are bytes
  EXPECT_EQ(1024u, Size::fromJson(nlohmann::json(1024), "limit"));

  try {
    Size::fromJson(nlohmann::json(-10), "max_frame_size");
    FAIL() << "Expected UnitParseError";
  } catch (const UnitParseError& e) {
    EXPECT_EQ("max_frame_size", e.field());
    EXPECT_NE(std::string::npos, std::string(e.what()).find("max_frame_size"));
  }
  EXPECT_THROW(Size::fromJson(nlohmann::json::object(), "limit"),
               UnitParseError);
}

TEST_F(UnitsTest, SizeToString) {
  EXPECT_EQ("0B", Size::toString(0));
  EXPECT_EQ("512B", Size::toString(512));
  EXPECT_EQ("1KB", Size::toString(1024));
  EXPECT_EQ("256KB", Size::toString(262144));
  EXPECT_EQ("1MB", Size::toString(Size::MB));
  EXPECT_EQ("1GB", Size::toString(Size::GB));
  EXPECT_EQ("1025B", Size::toString(1025));
}

}  // namespace
}  // namespace config
}  // namespace mqtt
