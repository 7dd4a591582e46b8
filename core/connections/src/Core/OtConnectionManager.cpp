// =============================================================================
// connections/src/Core/OtConnectionManager.cpp
// =============================================================================

#include "Core/OtConnectionManager.h"
#include "Drivers/Modbus/ModbusAdapter.h"
#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

#include <algorithm>
#include <sstream>

namespace OtLink {
namespace Core {

using namespace std::chrono;
using ErrorCode = OtLink::Enums::ErrorCode;
using ProtocolType = OtLink::Enums::ProtocolType;
using Config::ConnectionConfigParser;

ManagerOptions ManagerOptions::FromConfig() {
  auto &config = ConfigManager::getInstance();
  ManagerOptions options;
  options.probe_timeout =
      milliseconds(std::max(1, config.getInt("PROBE_TIMEOUT_MS", 5000)));
  options.opcua_read_timeout =
      milliseconds(std::max(1, config.getInt("OPCUA_READ_TIMEOUT_MS", 10000)));
  options.modbus_read_timeout =
      milliseconds(std::max(1, config.getInt("MODBUS_READ_TIMEOUT_MS", 10000)));
  options.mqtt_collect_window =
      milliseconds(std::max(1, config.getInt("MQTT_COLLECT_WINDOW_MS", 5000)));
  options.mqtt_collect_grace =
      milliseconds(std::max(0, config.getInt("MQTT_COLLECT_GRACE_MS", 5000)));
  return options;
}

OtConnectionManager::OtConnectionManager(
    std::shared_ptr<Pool::ConnectionPool> pool,
    std::shared_ptr<Pool::TimedExecutor> executor,
    const ConnectionConfigParser &parser, const ManagerOptions &options)
    : pool_(std::move(pool)), executor_(std::move(executor)), parser_(parser),
      options_(options) {}

namespace {

int64_t ElapsedMs(steady_clock::time_point start) {
  return duration_cast<milliseconds>(steady_clock::now() - start).count();
}

} // namespace

// =============================================================================
// 연결 테스트
// =============================================================================

ProbeResult OtConnectionManager::TestConnection(const ConnectionConfig &config,
                                                milliseconds timeout) {
  auto start = steady_clock::now();
  const std::string name = Enums::ProtocolDisplayName(config.protocol);

  ErrorInfo error;
  if (!Validate(config, error)) {
    LogManager::getInstance().Warn("[OtConnectionManager] {} test rejected: {}",
                                   name, error.message);
    return error.ToProbeResult(ElapsedMs(start));
  }

  // 드라이버가 없는 OT 프로토콜은 설정 검증만 한다
  if (!Enums::HasProtocolDriver(config.protocol)) {
    ProbeResult result;
    result.success = true;
    result.message = name + " configuration valid (not auto-checked)";
    result.latency_ms = ElapsedMs(start);
    return result;
  }

  const std::string key = ConnectionConfigParser::DeriveCacheKey(config);
  auto pool = pool_;
  std::string message;
  bool ok = executor_->Run(
      [pool, config](std::string &out, ErrorInfo &err) {
        auto handle = pool->GetHandle(config, err);
        if (!handle) {
          return false;
        }
        if (!handle->adapter->Probe(handle->session, out, err)) {
          pool->Invalidate(handle->key, handle->session);
          return false;
        }
        return true;
      },
      timeout, name + " test", message, error);

  ProbeResult result;
  result.latency_ms = ElapsedMs(start);
  if (ok) {
    result.success = true;
    result.message = message;
    LogManager::getInstance().Debug("[OtConnectionManager] {} test ok ({}ms)",
                                    key, result.latency_ms);
    return result;
  }

  if (error.IsTimeout()) {
    DropTimedOutSession(key);
  }
  result.success = false;
  result.message = error.message;
  LogManager::getInstance().Warn("[OtConnectionManager] {} test failed: {}",
                                 key, error.message);
  return result;
}

void OtConnectionManager::DropTimedOutSession(const std::string &key) {
  // 포기된 워커가 세션 I/O 잠금을 쥐고 있을 수 있어 disconnect 는 백그라운드에서
  Pool::HandlePtr evicted = pool_->Evict(key);
  if (!evicted) {
    return;
  }
  executor_->Dispatch(
      [evicted]() { Pool::ConnectionPool::Dispose(evicted, "timed out"); },
      "Disconnect of " + key);
}

bool OtConnectionManager::ParseForProtocol(const std::string &protocol,
                                           const std::string &config_json,
                                           ConnectionConfig &config,
                                           ErrorInfo &error) const {
  ProtocolType type = Enums::StringToProtocolType(protocol);
  if (type == ProtocolType::UNKNOWN) {
    error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                      "Unsupported connection protocol: " + protocol);
    return false;
  }
  return parser_.Parse(type, config_json, config, error);
}

ProbeResult OtConnectionManager::TestConnection(const std::string &protocol,
                                                const std::string &config_json,
                                                milliseconds timeout) {
  ConnectionConfig config;
  ErrorInfo error;
  if (!ParseForProtocol(protocol, config_json, config, error)) {
    return error.ToProbeResult();
  }
  return TestConnection(config, timeout);
}

// =============================================================================
// OPC UA 배치 읽기
// =============================================================================

bool OtConnectionManager::ReadOpcUa(const ConnectionConfig &config,
                                    const std::vector<std::string> &node_ids,
                                    Structs::OpcUaReadResult &result,
                                    ErrorInfo &error, milliseconds timeout) {
  if (config.protocol != ProtocolType::OPCUA) {
    error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                      "OPC UA configuration expected");
    return false;
  }
  if (!Validate(config, error)) {
    return false;
  }
  if (node_ids.empty()) {
    error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                      "At least one OPC UA node id is required");
    return false;
  }
  if (timeout.count() <= 0) {
    timeout = options_.opcua_read_timeout;
  }

  auto pool = pool_;
  bool ok = executor_->Run(
      [pool, config, node_ids](Structs::OpcUaReadResult &out, ErrorInfo &err) {
        auto handle = pool->GetHandle(config, err);
        if (!handle) {
          return false;
        }
        auto adapter =
            std::dynamic_pointer_cast<Drivers::IOpcUaAdapter>(handle->adapter);
        if (!adapter) {
          err = ErrorInfo(ErrorCode::DRIVER_UNAVAILABLE,
                          "OPC UA read is not supported by this driver");
          return false;
        }
        if (!adapter->ReadNodes(handle->session, node_ids, out, err)) {
          pool->Invalidate(handle->key, handle->session);
          return false;
        }
        return true;
      },
      timeout, "OPC UA read", result, error);

  if (!ok) {
    if (error.IsTimeout()) {
      DropTimedOutSession(ConnectionConfigParser::DeriveCacheKey(config));
    }
    LogManager::getInstance().Warn("[OtConnectionManager] OPC UA read error: {}",
                                   error.message);
  }
  return ok;
}

// =============================================================================
// MQTT 수집
// =============================================================================

bool OtConnectionManager::CollectMqtt(const ConnectionConfig &config,
                                      const std::vector<std::string> &topics,
                                      int qos,
                                      Structs::MqttCollectResult &result,
                                      ErrorInfo &error, milliseconds window) {
  if (config.protocol != ProtocolType::MQTT) {
    error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                      "MQTT configuration expected");
    return false;
  }
  if (!Validate(config, error)) {
    return false;
  }
  if (window.count() <= 0) {
    window = options_.mqtt_collect_window;
  }
  milliseconds deadline = window + options_.mqtt_collect_grace;

  auto pool = pool_;
  bool ok = executor_->Run(
      [pool, config, topics, qos, window](Structs::MqttCollectResult &out,
                                          ErrorInfo &err) {
        auto handle = pool->GetHandle(config, err);
        if (!handle) {
          return false;
        }
        auto adapter =
            std::dynamic_pointer_cast<Drivers::IMqttAdapter>(handle->adapter);
        if (!adapter) {
          err = ErrorInfo(ErrorCode::DRIVER_UNAVAILABLE,
                          "MQTT collection is not supported by this driver");
          return false;
        }
        if (!adapter->CollectMessages(handle->session, topics, qos, window, out,
                                      err)) {
          if (!Enums::IsConfigError(err.code)) {
            pool->Invalidate(handle->key, handle->session);
          }
          return false;
        }
        return true;
      },
      deadline, "MQTT collection", result, error);

  if (!ok) {
    if (error.IsTimeout()) {
      DropTimedOutSession(ConnectionConfigParser::DeriveCacheKey(config));
    }
    LogManager::getInstance().Warn(
        "[OtConnectionManager] MQTT collection error: {}", error.message);
  }
  return ok;
}

// =============================================================================
// Modbus 읽기
// =============================================================================

bool OtConnectionManager::ReadModbus(const ConnectionConfig &config,
                                     const std::vector<int> &addresses,
                                     int function_code,
                                     Structs::ModbusReadResult &result,
                                     ErrorInfo &error, milliseconds timeout) {
  if (config.protocol != ProtocolType::MODBUS) {
    error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                      "Modbus configuration expected");
    return false;
  }
  if (!Validate(config, error)) {
    return false;
  }
  if (!Drivers::ModbusAdapter::IsSupportedFunctionCode(function_code)) {
    error = ErrorInfo(ErrorCode::UNSUPPORTED_FUNCTION,
                      "Unsupported Modbus function code: " +
                          std::to_string(function_code));
    return false;
  }
  if (timeout.count() <= 0) {
    timeout = options_.modbus_read_timeout;
  }

  auto pool = pool_;
  bool ok = executor_->Run(
      [pool, config, addresses, function_code](Structs::ModbusReadResult &out,
                                               ErrorInfo &err) {
        auto handle = pool->GetHandle(config, err);
        if (!handle) {
          return false;
        }
        auto adapter =
            std::dynamic_pointer_cast<Drivers::IModbusAdapter>(handle->adapter);
        if (!adapter) {
          err = ErrorInfo(ErrorCode::DRIVER_UNAVAILABLE,
                          "Modbus read is not supported by this driver");
          return false;
        }
        bool read_ok = adapter->ReadAddresses(handle->session, addresses,
                                              function_code, out, err);
        // 예외 응답이 아닌 실패는 링크 문제로 보고 다음 호출에서 재연결
        if (!read_ok || out.link_suspect) {
          pool->Invalidate(handle->key, handle->session);
        }
        return read_ok;
      },
      timeout, "Modbus read", result, error);

  if (!ok) {
    if (error.IsTimeout()) {
      DropTimedOutSession(ConnectionConfigParser::DeriveCacheKey(config));
    }
    LogManager::getInstance().Warn("[OtConnectionManager] Modbus read error: {}",
                                   error.message);
    return false;
  }
  if (result.failed_count > 0) {
    LogManager::getInstance().Info(
        "[OtConnectionManager] Modbus read: {} of {} addresses failed",
        result.failed_count, result.values.size());
  }
  return true;
}

// =============================================================================
// 범용 읽기
// =============================================================================

bool OtConnectionManager::ReadConnection(const std::string &protocol,
                                         const std::string &config_json,
                                         const JsonType &targets,
                                         int timeout_ms, JsonType &out,
                                         ErrorInfo &error) {
  ConnectionConfig config;
  if (!ParseForProtocol(protocol, config_json, config, error)) {
    return false;
  }
  if (!targets.is_object()) {
    error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                      "Read targets must be a JSON object");
    return false;
  }
  milliseconds timeout(timeout_ms > 0 ? timeout_ms : 0);

  try {
    switch (config.protocol) {
    case ProtocolType::OPCUA: {
      auto node_ids =
          targets.value("nodeIds", std::vector<std::string>{});
      Structs::OpcUaReadResult result;
      if (!ReadOpcUa(config, node_ids, result, error, timeout)) {
        return false;
      }
      out = result.ToJson();
      return true;
    }
    case ProtocolType::MQTT: {
      auto topics = targets.value("topics", std::vector<std::string>{});
      int qos = targets.value("qos", 0);
      Structs::MqttCollectResult result;
      if (!CollectMqtt(config, topics, qos, result, error, timeout)) {
        return false;
      }
      out = result.ToJson();
      return true;
    }
    case ProtocolType::MODBUS: {
      auto addresses = targets.value("addresses", std::vector<int>{});
      int function_code = targets.value("functionCode", 3);
      Structs::ModbusReadResult result;
      if (!ReadModbus(config, addresses, function_code, result, error,
                      timeout)) {
        return false;
      }
      out = result.ToJson();
      return true;
    }
    default:
      error = ErrorInfo(ErrorCode::UNSUPPORTED_FUNCTION,
                        Enums::ProtocolDisplayName(config.protocol) +
                            " does not support reads");
      return false;
    }
  } catch (const nlohmann::json::exception &e) {
    error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                      std::string("Invalid read targets: ") + e.what());
    return false;
  }
}

// =============================================================================
// 종료 / 통계
// =============================================================================

void OtConnectionManager::CloseAll() {
  LogManager::getInstance().Info("[OtConnectionManager] Closing all connections");
  pool_->CloseAll();
}

std::string OtConnectionManager::DescribeStatistics() const {
  auto pool_stats = pool_->GetStatistics();
  auto exec_stats = executor_->GetStatistics();
  std::ostringstream oss;
  oss << "pool(active=" << pool_stats.active_handles
      << ", connects=" << pool_stats.total_connects
      << ", failed=" << pool_stats.failed_connects
      << ", hits=" << pool_stats.pool_hits
      << ", misses=" << pool_stats.pool_misses
      << ", evictions=" << pool_stats.evictions << ") executor(started="
      << exec_stats.started << ", completed=" << exec_stats.completed
      << ", timed_out=" << exec_stats.timed_out
      << ", failed=" << exec_stats.failed
      << ", in_flight=" << exec_stats.in_flight << ")";
  return oss.str();
}

} // namespace Core
} // namespace OtLink
