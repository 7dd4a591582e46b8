/**
 * @file test_mqtt_topic_filter.cpp
 * @brief MQTT 토픽 필터 매칭 (+, #, $ 토픽)
 */

#include "Drivers/Mqtt/MqttTopicFilter.h"

#include <gtest/gtest.h>

using namespace OtLink::Drivers;

TEST(MqttTopicFilterTest, ExactMatch) {
  EXPECT_TRUE(TopicMatchesFilter("plant/line1/temp", "plant/line1/temp"));
  EXPECT_FALSE(TopicMatchesFilter("plant/line1/temp", "plant/line1/pressure"));
  EXPECT_FALSE(TopicMatchesFilter("plant/line1", "plant/line1/temp"));
}

TEST(MqttTopicFilterTest, SingleLevelWildcard) {
  EXPECT_TRUE(TopicMatchesFilter("plant/+/temp", "plant/line1/temp"));
  EXPECT_TRUE(TopicMatchesFilter("plant/+/temp", "plant/line2/temp"));
  EXPECT_FALSE(TopicMatchesFilter("plant/+/temp", "plant/line1/cell/temp"));
  EXPECT_FALSE(TopicMatchesFilter("plant/+", "plant"));
  EXPECT_TRUE(TopicMatchesFilter("+/+", "a/b"));
}

TEST(MqttTopicFilterTest, MultiLevelWildcard) {
  EXPECT_TRUE(TopicMatchesFilter("plant/#", "plant/line1/temp"));
  EXPECT_TRUE(TopicMatchesFilter("plant/#", "plant/line1"));
  EXPECT_TRUE(TopicMatchesFilter("plant/#", "plant"));
  EXPECT_FALSE(TopicMatchesFilter("plant/#", "factory/line1"));
  EXPECT_TRUE(TopicMatchesFilter("#", "anything/at/all"));
}

TEST(MqttTopicFilterTest, DollarTopicsSkipLeadingWildcards) {
  EXPECT_FALSE(TopicMatchesFilter("#", "$SYS/broker/uptime"));
  EXPECT_FALSE(TopicMatchesFilter("+/broker/uptime", "$SYS/broker/uptime"));
  EXPECT_TRUE(TopicMatchesFilter("$SYS/#", "$SYS/broker/uptime"));
}

TEST(MqttTopicFilterTest, MatchesAnyOfSeveralFilters) {
  std::vector<std::string> filters{"plant/line1/#", "alarms/+"};
  EXPECT_TRUE(TopicMatchesAny(filters, "plant/line1/temp"));
  EXPECT_TRUE(TopicMatchesAny(filters, "alarms/high"));
  EXPECT_FALSE(TopicMatchesAny(filters, "plant/line2/temp"));
  EXPECT_FALSE(TopicMatchesAny({}, "plant/line1/temp"));
}

TEST(MqttTopicFilterTest, ValidatesFilterSyntax) {
  EXPECT_TRUE(IsValidTopicFilter("plant/+/temp"));
  EXPECT_TRUE(IsValidTopicFilter("plant/#"));
  EXPECT_FALSE(IsValidTopicFilter(""));
  EXPECT_FALSE(IsValidTopicFilter("plant/#/temp"));
  EXPECT_FALSE(IsValidTopicFilter("plant/line#"));
  EXPECT_FALSE(IsValidTopicFilter("plant/li+ne"));
}
