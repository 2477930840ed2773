#include "mqtt/codec/topic.h"

#include <utility>

namespace mqtt {
namespace codec {

namespace {

bool startsWithDollar(const std::string& s) {
  return !s.empty() && s[0] == '$';
}

bool containsWildcard(const std::string& s) {
  return s.find_first_of("+#") != std::string::npos;
}

std::vector<std::string> splitLevels(const std::string& text) {
  std::vector<std::string> segments;
  size_t start = 0;
  while (true) {
    size_t slash = text.find('/', start);
    if (slash == std::string::npos) {
      segments.push_back(text.substr(start));
      break;
    }
    segments.push_back(text.substr(start, slash - start));
    start = slash + 1;
  }
  return segments;
}

// Single filter level against one topic segment (not MultiWildcard)
bool levelMatches(const Level& level, const std::string& segment) {
  switch (level.kind()) {
    case LevelKind::Normal:
      return !startsWithDollar(segment) && level.value() == segment;
    case LevelKind::Metadata:
      return level.value() == segment;
    case LevelKind::Blank:
      return segment.empty();
    case LevelKind::SingleWildcard:
    case LevelKind::MultiWildcard:
      return !startsWithDollar(segment);
  }
  return false;
}

}  // namespace

// ===== Level =====

Result<Level> Level::parse(const std::string& segment) {
  if (segment == "+") {
    return singleWildcard();
  }
  if (segment == "#") {
    return multiWildcard();
  }
  if (segment.empty()) {
    return blank();
  }
  if (containsWildcard(segment)) {
    return Error(errors::INVALID_LEVEL,
                 "Wildcard mixed into topic level '" + segment + "'");
  }
  if (startsWithDollar(segment)) {
    return metadata(segment);
  }
  return normal(segment);
}

bool Level::isValid() const {
  switch (kind_) {
    case LevelKind::Normal:
      return !startsWithDollar(value_) && !containsWildcard(value_);
    case LevelKind::Metadata:
      return startsWithDollar(value_) && !containsWildcard(value_);
    default:
      return true;
  }
}

std::string Level::toString() const {
  switch (kind_) {
    case LevelKind::Normal:
    case LevelKind::Metadata:
      return value_;
    case LevelKind::Blank:
      return "";
    case LevelKind::SingleWildcard:
      return "+";
    case LevelKind::MultiWildcard:
      return "#";
  }
  return "";
}

// ===== Topic =====

Result<Topic> Topic::parse(const std::string& text) {
  std::vector<Level> levels;
  for (const auto& segment : splitLevels(text)) {
    auto level = Level::parse(segment);
    if (isError(level)) {
      return get<Error>(level);
    }
    levels.push_back(std::move(get<Level>(level)));
  }

  Topic topic(std::move(levels));
  if (!topic.isValid()) {
    return Error(errors::INVALID_TOPIC, "Invalid topic filter '" + text + "'");
  }
  return topic;
}

bool Topic::hasWildcards() const {
  for (const auto& level : levels_) {
    if (level.isWildcard()) {
      return true;
    }
  }
  return false;
}

bool Topic::isValid() const {
  for (size_t i = 0; i < levels_.size(); ++i) {
    const Level& level = levels_[i];
    if (!level.isValid()) {
      return false;
    }
    if (level.kind() == LevelKind::MultiWildcard && i != levels_.size() - 1) {
      return false;
    }
    if (level.isMetadata() && i != 0) {
      return false;
    }
  }
  return true;
}

bool Topic::matches(const std::string& topic) const {
  const auto segments = splitLevels(topic);
  size_t pos = 0;

  for (const auto& level : levels_) {
    if (level.kind() == LevelKind::MultiWildcard) {
      // '#' also matches the parent level ("sport/#" matches "sport")
      return pos == segments.size() || levelMatches(level, segments[pos]);
    }
    if (pos == segments.size()) {
      return false;
    }
    if (!levelMatches(level, segments[pos])) {
      return false;
    }
    ++pos;
  }
  return pos == segments.size();
}

std::string Topic::toString() const {
  std::string out;
  for (size_t i = 0; i < levels_.size(); ++i) {
    if (i != 0) {
      out += '/';
    }
    out += levels_[i].toString();
  }
  return out;
}

// ===== TopicFilter =====

Result<TopicFilter> TopicFilter::create(const std::string& filter) {
  auto topic = Topic::parse(filter);
  if (isError(topic)) {
    return get<Error>(topic);
  }
  return TopicFilter(filter, std::move(get<Topic>(topic)));
}

VoidResult validateTopicName(const std::string& name) {
  if (name.find_first_of("+#") != std::string::npos) {
    return makeVoidError(Error(errors::INVALID_TOPIC,
                               "Wildcard in topic name '" + name + "'"));
  }
  return makeVoidSuccess();
}

}  // namespace codec
}  // namespace mqtt
