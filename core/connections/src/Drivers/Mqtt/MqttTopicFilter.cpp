// connections/src/Drivers/Mqtt/MqttTopicFilter.cpp

#include "Drivers/Mqtt/MqttTopicFilter.h"

namespace OtLink {
namespace Drivers {

namespace {

std::vector<std::string> SplitLevels(const std::string &value) {
  std::vector<std::string> levels;
  size_t start = 0;
  while (true) {
    size_t pos = value.find('/', start);
    if (pos == std::string::npos) {
      levels.push_back(value.substr(start));
      break;
    }
    levels.push_back(value.substr(start, pos - start));
    start = pos + 1;
  }
  return levels;
}

} // namespace

bool IsValidTopicFilter(const std::string &filter) {
  if (filter.empty()) {
    return false;
  }
  auto levels = SplitLevels(filter);
  for (size_t i = 0; i < levels.size(); ++i) {
    const auto &level = levels[i];
    if (level.find('#') != std::string::npos) {
      if (level != "#" || i != levels.size() - 1) {
        return false;
      }
    }
    if (level.find('+') != std::string::npos && level != "+") {
      return false;
    }
  }
  return true;
}

bool TopicMatchesFilter(const std::string &filter, const std::string &topic) {
  if (filter.empty() || topic.empty()) {
    return false;
  }
  if (filter == topic) {
    return true;
  }

  auto filter_levels = SplitLevels(filter);
  auto topic_levels = SplitLevels(topic);

  // $SYS 등은 첫 레벨 와일드카드 대상이 아님
  if (topic[0] == '$' && (filter_levels[0] == "+" || filter_levels[0] == "#")) {
    return false;
  }

  size_t i = 0;
  for (; i < filter_levels.size(); ++i) {
    const auto &level = filter_levels[i];
    if (level == "#") {
      return i == filter_levels.size() - 1;
    }
    if (i >= topic_levels.size()) {
      return false;
    }
    if (level != "+" && level != topic_levels[i]) {
      return false;
    }
  }
  return i == topic_levels.size();
}

bool TopicMatchesAny(const std::vector<std::string> &filters,
                     const std::string &topic) {
  for (const auto &filter : filters) {
    if (TopicMatchesFilter(filter, topic)) {
      return true;
    }
  }
  return false;
}

} // namespace Drivers
} // namespace OtLink
