#ifndef OTLINK_COMMON_STRUCTS_H
#define OTLINK_COMMON_STRUCTS_H

/**
 * @file Structs.h
 * @brief OtLink 핵심 구조체 정의
 * @author OtLink Development Team
 *
 * 연결 설정, 저장 레코드, probe 결과, 프로토콜별 읽기 결과를 정의한다.
 * 프로토콜별 읽기 결과는 의미가 다르므로 (Modbus/OPC UA 는 항목별 성공/실패,
 * MQTT 는 수집 창 동안 누적) 하나의 구조로 합치지 않는다.
 */

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "BasicTypes.h"
#include "Enums.h"

namespace OtLink {
namespace Structs {

using namespace OtLink::BasicTypes;
using namespace OtLink::Enums;
using JsonType = nlohmann::json;

// =========================================================================
// 에러 / probe 결과
// =========================================================================

/**
 * @brief 연결 테스트 1회의 결과. 저장되지 않고 레코드 갱신에만 쓰인다
 */
struct ProbeResult {
  bool success = false;
  std::string message;
  int64_t latency_ms = 0;

  JsonType ToJson() const {
    return JsonType{
        {"success", success}, {"message", message}, {"latencyMs", latency_ms}};
  }
};

/**
 * @brief 에러 정보
 * @details bool 반환 + out-parameter 로 전달된다. TIMEOUT 인 경우
 *          timeout_after_ms 에 마감 시간이 기록된다.
 */
struct ErrorInfo {
  ErrorCode code = ErrorCode::SUCCESS;
  std::string message;
  uint32_t timeout_after_ms = 0;
  Timestamp occurred_at;

  ErrorInfo() = default;
  ErrorInfo(ErrorCode c, const std::string &msg)
      : code(c), message(msg), occurred_at(GetCurrentTimestamp()) {}

  static ErrorInfo Timeout(const std::string &msg, uint32_t after_ms) {
    ErrorInfo info(ErrorCode::TIMEOUT, msg);
    info.timeout_after_ms = after_ms;
    return info;
  }

  bool IsError() const { return code != ErrorCode::SUCCESS; }
  bool IsTimeout() const { return code == ErrorCode::TIMEOUT; }

  void Clear() {
    code = ErrorCode::SUCCESS;
    message.clear();
    timeout_after_ms = 0;
  }

  ProbeResult ToProbeResult(int64_t latency_ms = 0) const {
    ProbeResult result;
    result.success = !IsError();
    result.message = message;
    result.latency_ms = latency_ms;
    return result;
  }
};

// =========================================================================
// 연결 설정
// =========================================================================

struct OpcUaSettings {
  std::string endpoint;
  std::string security_mode = "None";
  std::string security_policy = "None";
  std::string username;
  std::string password;
  uint32_t client_timeout_ms = 10000;
};

struct MqttSettings {
  std::string broker;
  int port = 1883;
  bool has_port = false;
  std::string scheme = "mqtt"; // mqtt | mqtts | ws | wss
  std::string client_id;
  std::string username;
  std::string password;
  uint32_t connect_timeout_ms = 10000;
  int keep_alive_s = 60;
};

struct ModbusSettings {
  std::string transport = "TCP"; // TCP | RTU
  std::string host;
  int port = 502;
  bool has_port = false;
  int unit_id = 1;
  bool has_unit_id = false;
  std::string serial_port = "/dev/ttyUSB0";
  int baud_rate = 9600;
  char parity = 'N';
  int data_bits = 8;
  int stop_bits = 1;
  uint32_t response_timeout_ms = 3000;
};

/**
 * @brief 한 번의 연결 시도를 기술하는 불변 값
 */
struct ConnectionConfig {
  ProtocolType protocol = ProtocolType::UNKNOWN;
  OpcUaSettings opcua;
  MqttSettings mqtt;
  ModbusSettings modbus;

  // scada / mes / dataHistorian 및 원본 JSON 보존용
  std::map<std::string, std::string> properties;
  JsonType raw = JsonType::object();
};

// =========================================================================
// 저장 레코드 (data_connections)
// =========================================================================

struct ConnectionRecord {
  ConnectionId id;
  std::string organization_id;
  std::string name;
  std::string protocol; // 저장된 원문 ("opcua", "dataHistorian", ...)
  std::string config_json = "{}";
  ConnectionStatus status = ConnectionStatus::INACTIVE;
  std::string last_tested_at;
  std::string last_error;
  int64_t latency_ms = 0;
};

struct StatusUpdate {
  ConnectionStatus status = ConnectionStatus::INACTIVE;
  std::string last_tested_at;
  std::string last_error;
  int64_t latency_ms = 0;
};

/**
 * @brief 상태가 바뀐 경우에만 생성되는 전이 이벤트 (at-most-once)
 */
struct StatusTransitionEvent {
  ConnectionId connection_id;
  std::string organization_id;
  std::string protocol;
  ConnectionStatus old_status = ConnectionStatus::INACTIVE;
  ConnectionStatus new_status = ConnectionStatus::INACTIVE;
  int64_t latency_ms = 0;
  std::string last_error;
  std::string occurred_at;

  JsonType ToJson() const {
    return JsonType{{"connectionId", connection_id},
                    {"organizationId", organization_id},
                    {"protocol", protocol},
                    {"oldStatus", ConnectionStatusToString(old_status)},
                    {"newStatus", ConnectionStatusToString(new_status)},
                    {"latencyMs", latency_ms},
                    {"lastError", last_error},
                    {"occurredAt", occurred_at}};
  }
};

// =========================================================================
// 프로토콜별 읽기 결과
// =========================================================================

struct OpcUaNodeValue {
  std::string node_id;
  JsonType value; // null 이면 값 없음
  DataQuality quality = DataQuality::UNKNOWN;
  std::string status_code;
  std::string timestamp;
};

struct OpcUaReadResult {
  std::string timestamp;
  std::vector<OpcUaNodeValue> values; // 입력 순서 유지

  JsonType ToJson() const {
    JsonType by_node = JsonType::object();
    JsonType raw = JsonType::array();
    for (const auto &v : values) {
      JsonType item{{"nodeId", v.node_id},
                    {"value", v.value},
                    {"timestamp", v.timestamp},
                    {"quality", DataQualityToString(v.quality)},
                    {"statusCode", v.status_code}};
      by_node[v.node_id] = item;
      raw.push_back(item);
    }
    return JsonType{{"timestamp", timestamp}, {"values", by_node}, {"raw", raw}};
  }
};

struct MqttMessage {
  std::string topic;
  JsonType payload; // JSON 파싱 실패 시 원문 문자열
  std::string timestamp;
};

struct MqttCollectResult {
  std::string timestamp;
  std::map<std::string, std::vector<JsonType>> topic_data;
  std::vector<MqttMessage> messages;
  size_t topic_count = 0;
  size_t message_count = 0;

  JsonType ToJson() const {
    JsonType topics = JsonType::object();
    for (const auto &kv : topic_data) {
      topics[kv.first] = kv.second;
    }
    JsonType msgs = JsonType::array();
    for (const auto &m : messages) {
      msgs.push_back(JsonType{
          {"topic", m.topic}, {"payload", m.payload}, {"timestamp", m.timestamp}});
    }
    return JsonType{{"timestamp", timestamp},
                    {"topicData", topics},
                    {"messages", msgs},
                    {"topicCount", topic_count},
                    {"messageCount", message_count}};
  }
};

struct ModbusAddressValue {
  int address = 0;
  std::optional<int> value; // 실패 시 nullopt
  std::string error;
  std::string timestamp;
};

struct ModbusReadResult {
  std::string timestamp;
  int function_code = 3;
  std::vector<ModbusAddressValue> values;
  size_t failed_count = 0;
  bool link_suspect = false; // 예외 응답이 아닌 전송 계층 실패가 있었음

  JsonType ToJson() const {
    JsonType by_address = JsonType::object();
    JsonType raw = JsonType::array();
    for (const auto &v : values) {
      JsonType item{{"address", v.address},
                    {"functionCode", function_code},
                    {"timestamp", v.timestamp}};
      item["value"] = v.value ? JsonType(*v.value) : JsonType(nullptr);
      if (!v.error.empty()) {
        item["error"] = v.error;
      }
      by_address[std::to_string(v.address)] = item["value"];
      raw.push_back(item);
    }
    return JsonType{{"timestamp", timestamp},
                    {"values", by_address},
                    {"raw", raw},
                    {"failedCount", failed_count}};
  }
};

} // namespace Structs
} // namespace OtLink

#endif // OTLINK_COMMON_STRUCTS_H
