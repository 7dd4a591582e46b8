// shared/include/Common/Enums.h
#ifndef OTLINK_COMMON_ENUMS_H
#define OTLINK_COMMON_ENUMS_H

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

// =============================================================================
// 매크로 충돌 방지 - 반드시 enum 정의 전에!
// =============================================================================
#ifdef _WIN32
#ifdef ERROR
#undef ERROR
#endif
#ifdef FATAL
#undef FATAL
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

// Linux/system headers might define INFO, DEBUG, or WARN as macros
#ifdef INFO
#undef INFO
#endif

#ifdef DEBUG
#undef DEBUG
#endif

#ifdef WARN
#undef WARN
#endif

namespace OtLink {
namespace Enums {

// =========================================================================
// 로그 레벨
// =========================================================================
enum class LogLevel : uint8_t {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  LOG_ERROR = 4, // ERROR 매크로 충돌 방지
  LOG_FATAL = 5,
  OFF = 255
};

// =========================================================================
// OT 프로토콜 종류
// =========================================================================
enum class ProtocolType : uint8_t {
  UNKNOWN = 0,
  OPCUA = 1,
  MQTT = 2,
  MODBUS = 3,
  SCADA = 4,
  MES = 5,
  DATA_HISTORIAN = 6
};

// =========================================================================
// 저장된 연결 레코드 상태 (data_connections.status)
// =========================================================================
enum class ConnectionStatus : uint8_t {
  INACTIVE = 0,
  ACTIVE = 1,
  CONNECTION_ERROR = 2 // "error"
};

// =========================================================================
// 데이터 품질
// =========================================================================
enum class DataQuality : uint8_t { UNKNOWN = 0, GOOD = 1, BAD = 2 };

// =========================================================================
// 에러 코드
// =========================================================================
enum class ErrorCode : uint16_t {
  SUCCESS = 0,
  UNKNOWN_ERROR = 1,

  // 연결 관련 (ConnectError)
  CONNECTION_FAILED = 10,
  CONNECTION_LOST = 13,
  AUTHENTICATION_FAILED = 14,

  // 통신 관련
  TIMEOUT = 100,
  PROTOCOL_ERROR = 101,
  READ_FAILED = 102,

  // 설정 관련 (ConfigError)
  INVALID_CONFIGURATION = 400,
  MISSING_CONFIGURATION = 401,
  UNSUPPORTED_FUNCTION = 402,

  // 드라이버 미탑재/비활성
  DRIVER_UNAVAILABLE = 500,

  INTERNAL_ERROR = 900
};

// =========================================================================
// 변환 함수들
// =========================================================================

inline std::string LogLevelToString(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::LOG_ERROR:
    return "ERROR";
  case LogLevel::LOG_FATAL:
    return "FATAL";
  case LogLevel::OFF:
    return "OFF";
  default:
    return "UNKNOWN";
  }
}

/**
 * @brief 저장 형식 문자열 ("opcua", "mqtt", ...)
 */
inline std::string ProtocolTypeToString(ProtocolType type) {
  switch (type) {
  case ProtocolType::OPCUA:
    return "opcua";
  case ProtocolType::MQTT:
    return "mqtt";
  case ProtocolType::MODBUS:
    return "modbus";
  case ProtocolType::SCADA:
    return "scada";
  case ProtocolType::MES:
    return "mes";
  case ProtocolType::DATA_HISTORIAN:
    return "dataHistorian";
  default:
    return "unknown";
  }
}

/**
 * @brief 사람이 읽는 이름 (로그/메시지용)
 */
inline std::string ProtocolDisplayName(ProtocolType type) {
  switch (type) {
  case ProtocolType::OPCUA:
    return "OPC UA";
  case ProtocolType::MQTT:
    return "MQTT";
  case ProtocolType::MODBUS:
    return "Modbus";
  case ProtocolType::SCADA:
    return "SCADA";
  case ProtocolType::MES:
    return "MES";
  case ProtocolType::DATA_HISTORIAN:
    return "Data Historian";
  default:
    return "Unknown";
  }
}

inline ProtocolType StringToProtocolType(const std::string &name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (s == "opcua" || s == "opc-ua" || s == "opc_ua")
    return ProtocolType::OPCUA;
  if (s == "mqtt")
    return ProtocolType::MQTT;
  if (s == "modbus" || s == "modbus_tcp" || s == "modbus_rtu")
    return ProtocolType::MODBUS;
  if (s == "scada")
    return ProtocolType::SCADA;
  if (s == "mes")
    return ProtocolType::MES;
  if (s == "datahistorian" || s == "data-historian" || s == "data_historian")
    return ProtocolType::DATA_HISTORIAN;
  return ProtocolType::UNKNOWN;
}

/**
 * @brief 자동 헬스체크 대상(OT 계열) 프로토콜인지
 */
inline bool IsOtProtocol(ProtocolType type) {
  return type != ProtocolType::UNKNOWN;
}

/**
 * @brief 실제 드라이버로 probe 가능한 프로토콜인지
 */
inline bool HasProtocolDriver(ProtocolType type) {
  return type == ProtocolType::OPCUA || type == ProtocolType::MQTT ||
         type == ProtocolType::MODBUS;
}

inline std::string ConnectionStatusToString(ConnectionStatus status) {
  switch (status) {
  case ConnectionStatus::ACTIVE:
    return "active";
  case ConnectionStatus::CONNECTION_ERROR:
    return "error";
  case ConnectionStatus::INACTIVE:
  default:
    return "inactive";
  }
}

inline ConnectionStatus StringToConnectionStatus(const std::string &status) {
  if (status == "active")
    return ConnectionStatus::ACTIVE;
  if (status == "error")
    return ConnectionStatus::CONNECTION_ERROR;
  return ConnectionStatus::INACTIVE;
}

inline std::string DataQualityToString(DataQuality quality) {
  switch (quality) {
  case DataQuality::GOOD:
    return "Good";
  case DataQuality::BAD:
    return "Bad";
  default:
    return "Unknown";
  }
}

inline std::string ErrorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::SUCCESS:
    return "SUCCESS";
  case ErrorCode::CONNECTION_FAILED:
    return "CONNECTION_FAILED";
  case ErrorCode::CONNECTION_LOST:
    return "CONNECTION_LOST";
  case ErrorCode::AUTHENTICATION_FAILED:
    return "AUTHENTICATION_FAILED";
  case ErrorCode::TIMEOUT:
    return "TIMEOUT";
  case ErrorCode::PROTOCOL_ERROR:
    return "PROTOCOL_ERROR";
  case ErrorCode::READ_FAILED:
    return "READ_FAILED";
  case ErrorCode::INVALID_CONFIGURATION:
    return "INVALID_CONFIGURATION";
  case ErrorCode::MISSING_CONFIGURATION:
    return "MISSING_CONFIGURATION";
  case ErrorCode::UNSUPPORTED_FUNCTION:
    return "UNSUPPORTED_FUNCTION";
  case ErrorCode::DRIVER_UNAVAILABLE:
    return "DRIVER_UNAVAILABLE";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  default:
    return "UNKNOWN_ERROR";
  }
}

/**
 * @brief ConfigError 계열 코드인지
 */
inline bool IsConfigError(ErrorCode code) {
  return code == ErrorCode::INVALID_CONFIGURATION ||
         code == ErrorCode::MISSING_CONFIGURATION ||
         code == ErrorCode::UNSUPPORTED_FUNCTION;
}

} // namespace Enums
} // namespace OtLink

#endif // OTLINK_COMMON_ENUMS_H
