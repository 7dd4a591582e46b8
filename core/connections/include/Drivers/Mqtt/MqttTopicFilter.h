// connections/include/Drivers/Mqtt/MqttTopicFilter.h
#ifndef OTLINK_DRIVERS_MQTT_TOPIC_FILTER_H
#define OTLINK_DRIVERS_MQTT_TOPIC_FILTER_H

#include <string>
#include <vector>

namespace OtLink {
namespace Drivers {

/**
 * @brief MQTT 토픽 필터 매칭 (+ 단일 레벨, # 다중 레벨)
 * @details "a/#" 는 "a" 자체와도 매칭된다. '$' 로 시작하는 토픽은
 *          첫 레벨 와일드카드와 매칭되지 않는다.
 */
bool TopicMatchesFilter(const std::string &filter, const std::string &topic);

/**
 * @brief 필터 목록 중 하나라도 매칭되면 true
 */
bool TopicMatchesAny(const std::vector<std::string> &filters,
                     const std::string &topic);

/**
 * @brief 구독 가능한 필터 문자열인지 ('#' 는 마지막 레벨에만)
 */
bool IsValidTopicFilter(const std::string &filter);

} // namespace Drivers
} // namespace OtLink

#endif // OTLINK_DRIVERS_MQTT_TOPIC_FILTER_H
