/**
 * @file topic.h
 * @brief MQTT topic names, topic filters and wildcard matching
 *
 * A topic is split on '/' into levels. Filters may use '+' for exactly one
 * level and '#' for the remainder. Levels starting with '$' are metadata and
 * are only matched by an identical metadata level, never by a wildcard.
 */

#ifndef MQTT_CODEC_TOPIC_H
#define MQTT_CODEC_TOPIC_H

#include <string>
#include <utility>
#include <vector>

#include "mqtt/core/result.h"

namespace mqtt {
namespace codec {

enum class LevelKind {
  Normal,          // sport
  Metadata,        // $SYS
  Blank,           // empty segment
  SingleWildcard,  // +
  MultiWildcard    // #
};

class Level {
 public:
  Level() : kind_(LevelKind::Blank) {}

  static Level normal(const std::string& value) {
    return Level(LevelKind::Normal, value);
  }
  static Level metadata(const std::string& value) {
    return Level(LevelKind::Metadata, value);
  }
  static Level blank() { return Level(); }
  static Level singleWildcard() { return Level(LevelKind::SingleWildcard, ""); }
  static Level multiWildcard() { return Level(LevelKind::MultiWildcard, ""); }

  // Classify one segment. '+' or '#' mixed with other text is InvalidLevel.
  static Result<Level> parse(const std::string& segment);

  LevelKind kind() const { return kind_; }

  // Text of a Normal or Metadata level, empty otherwise
  const std::string& value() const { return value_; }

  bool isNormal() const { return kind_ == LevelKind::Normal; }
  bool isMetadata() const { return kind_ == LevelKind::Metadata; }
  bool isWildcard() const {
    return kind_ == LevelKind::SingleWildcard ||
           kind_ == LevelKind::MultiWildcard;
  }

  // Normal must not start with '$', Metadata must; neither may hold + or #
  bool isValid() const;

  std::string toString() const;

  bool operator==(const Level& other) const {
    return kind_ == other.kind_ && value_ == other.value_;
  }
  bool operator!=(const Level& other) const { return !(*this == other); }

 private:
  Level(LevelKind kind, const std::string& value)
      : kind_(kind), value_(value) {}

  LevelKind kind_;
  std::string value_;
};

class Topic {
 public:
  Topic() = default;
  explicit Topic(std::vector<Level> levels) : levels_(std::move(levels)) {}

  /**
   * Parse and validate a topic or filter.
   *
   * Fails with INVALID_LEVEL for a malformed segment and INVALID_TOPIC when
   * '#' is not last or a metadata level is not first.
   */
  static Result<Topic> parse(const std::string& text);

  const std::vector<Level>& levels() const { return levels_; }

  bool hasWildcards() const;

  bool isValid() const;

  // True when this filter matches the literal topic name
  bool matches(const std::string& topic) const;

  std::string toString() const;

  bool operator==(const Topic& other) const {
    return levels_ == other.levels_;
  }
  bool operator!=(const Topic& other) const { return !(*this == other); }

 private:
  std::vector<Level> levels_;
};

// A validated subscription filter keeping its original text
class TopicFilter {
 public:
  static Result<TopicFilter> create(const std::string& filter);

  const std::string& filter() const { return filter_; }
  const Topic& topic() const { return topic_; }

  bool matches(const std::string& topic) const {
    return topic_.matches(topic);
  }

 private:
  TopicFilter(const std::string& filter, Topic topic)
      : filter_(filter), topic_(std::move(topic)) {}

  std::string filter_;
  Topic topic_;
};

// Topic names carried by PUBLISH and wills may not contain '+' or '#'
VoidResult validateTopicName(const std::string& name);

}  // namespace codec
}  // namespace mqtt

#endif  // MQTT_CODEC_TOPIC_H
