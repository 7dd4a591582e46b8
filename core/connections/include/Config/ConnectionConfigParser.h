// =============================================================================
// connections/include/Config/ConnectionConfigParser.h
// 저장된 JSON 설정 -> ConnectionConfig 변환, 검증, 캐시 키 생성
// =============================================================================

#ifndef OTLINK_CONFIG_CONNECTION_CONFIG_PARSER_H
#define OTLINK_CONFIG_CONNECTION_CONFIG_PARSER_H

#include "Common/Structs.h"

#include <string>

namespace OtLink {
namespace Config {

using ConnectionConfig = OtLink::Structs::ConnectionConfig;
using ErrorInfo = OtLink::Structs::ErrorInfo;
using JsonType = OtLink::Structs::JsonType;
using ProtocolType = OtLink::Enums::ProtocolType;

/**
 * @brief JSON 에 없는 값을 채우는 기본값 (ConfigManager 에서 로드)
 */
struct ParserDefaults {
  uint32_t opcua_client_timeout_ms = 10000;
  uint32_t mqtt_connect_timeout_ms = 10000;
  uint32_t modbus_response_timeout_ms = 3000;

  static ParserDefaults FromConfig();
};

class ConnectionConfigParser {
public:
  explicit ConnectionConfigParser(const ParserDefaults &defaults = {})
      : defaults_(defaults) {}

  /**
   * @brief JSON 객체 파싱
   * @return 타입이 맞지 않으면 false (INVALID_CONFIGURATION)
   */
  bool Parse(ProtocolType protocol, const JsonType &json,
             ConnectionConfig &config, ErrorInfo &error) const;

  /**
   * @brief 저장된 문자열 파싱. 실패 메시지는 "Invalid configuration: ..."
   */
  bool Parse(ProtocolType protocol, const std::string &json_text,
             ConnectionConfig &config, ErrorInfo &error) const;

  /**
   * @brief 필수 필드 검증 (ConfigError)
   */
  static bool Validate(const ConnectionConfig &config, ErrorInfo &error);

  /**
   * @brief 같은 키 = 같은 논리 연결
   *  - opcua|<endpoint>|<username or anonymous>
   *  - mqtt|<broker>|<port>|<clientId or default>
   *  - modbus|<host or serialPort>|<port>|<unitId>
   */
  static std::string DeriveCacheKey(const ConnectionConfig &config);

private:
  ParserDefaults defaults_;
};

} // namespace Config
} // namespace OtLink

#endif // OTLINK_CONFIG_CONNECTION_CONFIG_PARSER_H
