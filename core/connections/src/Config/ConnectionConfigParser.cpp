// =============================================================================
// connections/src/Config/ConnectionConfigParser.cpp
// =============================================================================

#include "Config/ConnectionConfigParser.h"
#include "Utils/ConfigManager.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace OtLink {
namespace Config {

using ErrorCode = OtLink::Enums::ErrorCode;

ParserDefaults ParserDefaults::FromConfig() {
  auto &config = ConfigManager::getInstance();
  ParserDefaults defaults;
  defaults.opcua_client_timeout_ms = static_cast<uint32_t>(
      std::max(1, config.getInt("OPCUA_CLIENT_TIMEOUT_MS", 10000)));
  defaults.mqtt_connect_timeout_ms = static_cast<uint32_t>(
      std::max(1, config.getInt("MQTT_CONNECT_TIMEOUT_MS", 10000)));
  defaults.modbus_response_timeout_ms = static_cast<uint32_t>(
      std::max(1, config.getInt("MODBUS_RESPONSE_TIMEOUT_MS", 3000)));
  return defaults;
}

// =============================================================================
// JSON 필드 헬퍼 (UI 가 숫자를 문자열로 저장하는 경우가 있다)
// =============================================================================

namespace {

bool HasValue(const JsonType &json, const char *key) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return false;
  }
  if (it->is_string()) {
    return !it->get<std::string>().empty();
  }
  return true;
}

std::string GetString(const JsonType &json, const char *key,
                      const std::string &fallback = "") {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return fallback;
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return std::to_string(it->get<int64_t>());
  }
  throw std::invalid_argument(std::string("'") + key + "' must be a string");
}

std::invalid_argument OutOfRange(const char *key) {
  return std::invalid_argument(std::string("'") + key + "' is out of range");
}

int GetInt(const JsonType &json, const char *key, int fallback) {
  using Limits = std::numeric_limits<int>;
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return fallback;
  }
  if (it->is_number_unsigned()) {
    auto value = it->get<uint64_t>();
    if (value > static_cast<uint64_t>(Limits::max())) {
      throw OutOfRange(key);
    }
    return static_cast<int>(value);
  }
  if (it->is_number_integer()) {
    auto value = it->get<int64_t>();
    if (value < Limits::min() || value > Limits::max()) {
      throw OutOfRange(key);
    }
    return static_cast<int>(value);
  }
  if (it->is_number_float()) {
    double value = it->get<double>();
    if (!std::isfinite(value) ||
        value <= static_cast<double>(Limits::min()) - 1.0 ||
        value >= static_cast<double>(Limits::max()) + 1.0) {
      throw OutOfRange(key);
    }
    return static_cast<int>(value);
  }
  if (it->is_string()) {
    const auto text = it->get<std::string>();
    if (text.empty()) {
      return fallback;
    }
    size_t consumed = 0;
    int value = 0;
    try {
      value = std::stoi(text, &consumed);
    } catch (const std::out_of_range &) {
      throw OutOfRange(key);
    } catch (const std::invalid_argument &) {
      throw std::invalid_argument(std::string("'") + key +
                                  "' must be a number");
    }
    if (consumed != text.size()) {
      throw std::invalid_argument(std::string("'") + key +
                                  "' must be a number");
    }
    return value;
  }
  throw std::invalid_argument(std::string("'") + key + "' must be a number");
}

bool IsValidPort(int port) { return port >= 1 && port <= 65535; }

std::string ToUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return value;
}

} // namespace

// =============================================================================
// 파싱
// =============================================================================

bool ConnectionConfigParser::Parse(ProtocolType protocol,
                                   const std::string &json_text,
                                   ConnectionConfig &config,
                                   ErrorInfo &error) const {
  auto json = JsonType::parse(json_text.empty() ? "{}" : json_text, nullptr,
                              false);
  if (json.is_discarded()) {
    error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                      "Invalid configuration: malformed JSON");
    return false;
  }
  return Parse(protocol, json, config, error);
}

bool ConnectionConfigParser::Parse(ProtocolType protocol, const JsonType &json,
                                   ConnectionConfig &config,
                                   ErrorInfo &error) const {
  if (!json.is_object()) {
    error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                      "Invalid configuration: expected a JSON object");
    return false;
  }

  ConnectionConfig parsed;
  parsed.protocol = protocol;
  parsed.raw = json;

  try {
    switch (protocol) {
    case ProtocolType::OPCUA: {
      auto &s = parsed.opcua;
      s.endpoint = GetString(json, "endpoint");
      s.security_mode = GetString(json, "securityMode", "None");
      s.security_policy = GetString(json, "securityPolicy", "None");
      s.username = GetString(json, "username");
      s.password = GetString(json, "password");
      s.client_timeout_ms = static_cast<uint32_t>(
          GetInt(json, "timeout",
                 static_cast<int>(defaults_.opcua_client_timeout_ms)));
      break;
    }
    case ProtocolType::MQTT: {
      auto &s = parsed.mqtt;
      s.broker = GetString(json, "broker");
      s.has_port = HasValue(json, "port");
      s.port = GetInt(json, "port", 1883);
      s.scheme = GetString(json, "protocol", "mqtt");
      s.client_id = GetString(json, "clientId");
      s.username = GetString(json, "username");
      s.password = GetString(json, "password");
      s.keep_alive_s = GetInt(json, "keepAlive", 60);
      s.connect_timeout_ms = static_cast<uint32_t>(
          GetInt(json, "connectTimeout",
                 static_cast<int>(defaults_.mqtt_connect_timeout_ms)));
      break;
    }
    case ProtocolType::MODBUS: {
      auto &s = parsed.modbus;
      s.transport = ToUpper(GetString(json, "type", "TCP"));
      s.host = GetString(json, "host");
      s.has_port = HasValue(json, "port");
      s.port = GetInt(json, "port", 502);
      s.has_unit_id = HasValue(json, "unitId");
      s.unit_id = GetInt(json, "unitId", 1);
      s.serial_port = GetString(json, "serialPort", "/dev/ttyUSB0");
      s.baud_rate = GetInt(json, "baudRate", 9600);
      std::string parity = ToUpper(GetString(json, "parity", "N"));
      s.parity = parity.empty() ? 'N' : parity[0];
      s.data_bits = GetInt(json, "dataBits", 8);
      s.stop_bits = GetInt(json, "stopBits", 1);
      s.response_timeout_ms = static_cast<uint32_t>(
          GetInt(json, "timeout",
                 static_cast<int>(defaults_.modbus_response_timeout_ms)));
      break;
    }
    default:
      // scada / mes / dataHistorian: 문자열/숫자 필드만 보존
      for (auto it = json.begin(); it != json.end(); ++it) {
        if (it->is_string()) {
          parsed.properties[it.key()] = it->get<std::string>();
        } else if (it->is_number() || it->is_boolean()) {
          parsed.properties[it.key()] = it->dump();
        }
      }
      break;
    }
  } catch (const std::exception &e) {
    error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                      std::string("Invalid configuration: ") + e.what());
    return false;
  }

  config = std::move(parsed);
  return true;
}

// =============================================================================
// 검증
// =============================================================================

bool ConnectionConfigParser::Validate(const ConnectionConfig &config,
                                      ErrorInfo &error) {
  auto has_property = [&config](const std::string &key) {
    auto it = config.properties.find(key);
    return it != config.properties.end() && !it->second.empty();
  };

  switch (config.protocol) {
  case ProtocolType::OPCUA:
    if (config.opcua.endpoint.empty()) {
      error = ErrorInfo(ErrorCode::MISSING_CONFIGURATION,
                        "OPC UA endpoint is required");
      return false;
    }
    return true;
  case ProtocolType::MQTT:
    if (config.mqtt.broker.empty() || !config.mqtt.has_port) {
      error = ErrorInfo(ErrorCode::MISSING_CONFIGURATION,
                        "MQTT broker and port are required");
      return false;
    }
    if (!IsValidPort(config.mqtt.port)) {
      error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                        "MQTT port must be between 1 and 65535");
      return false;
    }
    return true;
  case ProtocolType::MODBUS:
    if (config.modbus.unit_id < 0 || config.modbus.unit_id > 255) {
      error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                        "Modbus unit id must be between 0 and 255");
      return false;
    }
    if (config.modbus.transport == "RTU") {
      if (config.modbus.serial_port.empty()) {
        error = ErrorInfo(ErrorCode::MISSING_CONFIGURATION,
                          "Modbus serial port is required");
        return false;
      }
      return true;
    }
    if (config.modbus.transport != "TCP") {
      error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                        "Unsupported Modbus connection type: " +
                            config.modbus.transport);
      return false;
    }
    if (config.modbus.host.empty() || !config.modbus.has_port) {
      error = ErrorInfo(ErrorCode::MISSING_CONFIGURATION,
                        "Modbus host and port are required");
      return false;
    }
    if (!IsValidPort(config.modbus.port)) {
      error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                        "Modbus port must be between 1 and 65535");
      return false;
    }
    return true;
  case ProtocolType::SCADA:
    if (!has_property("protocol") || !has_property("endpoint")) {
      error = ErrorInfo(ErrorCode::MISSING_CONFIGURATION,
                        "SCADA protocol and endpoint are required");
      return false;
    }
    return true;
  case ProtocolType::MES:
    if (!has_property("apiUrl")) {
      error = ErrorInfo(ErrorCode::MISSING_CONFIGURATION,
                        "MES API URL is required");
      return false;
    }
    return true;
  case ProtocolType::DATA_HISTORIAN:
    if (!has_property("server") || !has_property("database")) {
      error = ErrorInfo(ErrorCode::MISSING_CONFIGURATION,
                        "Data Historian server and database are required");
      return false;
    }
    return true;
  default:
    error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                      "Unsupported connection protocol");
    return false;
  }
}

std::string ConnectionConfigParser::DeriveCacheKey(
    const ConnectionConfig &config) {
  switch (config.protocol) {
  case ProtocolType::OPCUA:
    return "opcua|" + config.opcua.endpoint + "|" +
           (config.opcua.username.empty() ? std::string("anonymous")
                                          : config.opcua.username);
  case ProtocolType::MQTT:
    return "mqtt|" + config.mqtt.broker + "|" +
           std::to_string(config.mqtt.port) + "|" +
           (config.mqtt.client_id.empty() ? std::string("default")
                                          : config.mqtt.client_id);
  case ProtocolType::MODBUS: {
    const auto &s = config.modbus;
    const std::string &target = s.transport == "RTU" ? s.serial_port : s.host;
    return "modbus|" + target + "|" + std::to_string(s.port) + "|" +
           std::to_string(s.unit_id);
  }
  default:
    return Enums::ProtocolTypeToString(config.protocol) + "|" +
           config.raw.dump();
  }
}

} // namespace Config
} // namespace OtLink
