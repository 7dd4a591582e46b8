// =============================================================================
// connections/src/Drivers/Modbus/ModbusAdapter.cpp
// =============================================================================

#include "Drivers/Modbus/ModbusAdapter.h"
#include "Logging/LogManager.h"

#include <cerrno>

namespace OtLink {
namespace Drivers {

namespace {

void SetResponseTimeout(modbus_t *ctx, uint32_t timeout_ms) {
  uint32_t timeout_sec = timeout_ms / 1000;
  uint32_t timeout_usec = (timeout_ms % 1000) * 1000;
  modbus_set_response_timeout(ctx, timeout_sec, timeout_usec);
}

} // namespace

bool ModbusAdapter::IsSupportedFunctionCode(int function_code) {
  return function_code >= 1 && function_code <= 4;
}

bool ModbusAdapter::IsExceptionResponse(int error_number) {
  return error_number >= EMBXILFUN && error_number <= EMBXGTAR;
}

std::shared_ptr<ModbusSession>
ModbusAdapter::AsModbusSession(const SessionPtr &session) {
  return std::dynamic_pointer_cast<ModbusSession>(session);
}

// =============================================================================
// 연결 관리
// =============================================================================

SessionPtr ModbusAdapter::Connect(const ConnectionConfig &config,
                                  ErrorInfo &error) {
  const auto &settings = config.modbus;
  auto session = std::make_shared<ModbusSession>();
  session->response_timeout_ms = settings.response_timeout_ms;
  session->unit_id = settings.unit_id;

  if (settings.transport == "TCP") {
    if (settings.host.empty()) {
      error = ErrorInfo(ErrorCode::MISSING_CONFIGURATION,
                        "Modbus host and port are required");
      return nullptr;
    }
    session->target = settings.host + ":" + std::to_string(settings.port);
    session->ctx = modbus_new_tcp(settings.host.c_str(), settings.port);
  } else if (settings.transport == "RTU") {
    session->target = settings.serial_port;
    session->ctx =
        modbus_new_rtu(settings.serial_port.c_str(), settings.baud_rate,
                       settings.parity, settings.data_bits, settings.stop_bits);
  } else {
    error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                      "Unsupported Modbus connection type: " +
                          settings.transport);
    return nullptr;
  }

  if (!session->ctx) {
    error = ErrorInfo(ErrorCode::CONNECTION_FAILED,
                      std::string("Failed to create Modbus client: ") +
                          modbus_strerror(errno));
    return nullptr;
  }

  SetResponseTimeout(session->ctx, settings.response_timeout_ms);

  // RTU 는 slave 주소가 필수
  if (settings.has_unit_id || settings.transport == "RTU") {
    if (modbus_set_slave(session->ctx, settings.unit_id) == -1) {
      error = ErrorInfo(ErrorCode::INVALID_CONFIGURATION,
                        "Invalid Modbus unit id: " +
                            std::to_string(settings.unit_id));
      return nullptr;
    }
  }

  if (modbus_connect(session->ctx) == -1) {
    int error_number = errno;
    error = ErrorInfo(ErrorCode::CONNECTION_FAILED,
                      "Modbus connection failed: " + session->target + ": " +
                          modbus_strerror(error_number));
    LogManager::getInstance().logDriver("modbus", LogLevel::WARN,
                                        error.message);
    return nullptr;
  }

  LogManager::getInstance().logDriver(
      "modbus", LogLevel::INFO,
      "Connected to " + session->target + " (" + settings.transport +
          ", unit " + std::to_string(settings.unit_id) + ")");
  return session;
}

bool ModbusAdapter::VerifyLive(const SessionPtr &session) {
  // 독립적인 liveness probe 없음
  return AsModbusSession(session) != nullptr;
}

void ModbusAdapter::Disconnect(const SessionPtr &session) {
  auto modbus_session = AsModbusSession(session);
  if (!modbus_session) {
    return;
  }
  auto io_lock = modbus_session->TryLockIo(kDisconnectLockWait);
  if (!io_lock.owns_lock()) {
    // 포기된 연산이 진행 중. 세션 소멸 시 닫힌다
    LogManager::getInstance().logDriver(
        "modbus", LogLevel::WARN,
        "Session busy, deferring close: " + modbus_session->target);
    return;
  }
  modbus_session->Close();
  LogManager::getInstance().logDriver(
      "modbus", LogLevel::DEBUG, "Disconnected: " + modbus_session->target);
}

// =============================================================================
// 읽기
// =============================================================================

bool ModbusAdapter::ReadSingle(modbus_t *ctx, int address, int function_code,
                               int &value, int &error_number) {
  int rc = -1;
  switch (function_code) {
  case 1: {
    uint8_t bit = 0;
    rc = modbus_read_bits(ctx, address, 1, &bit);
    value = bit ? 1 : 0;
    break;
  }
  case 2: {
    uint8_t bit = 0;
    rc = modbus_read_input_bits(ctx, address, 1, &bit);
    value = bit ? 1 : 0;
    break;
  }
  case 3: {
    uint16_t reg = 0;
    rc = modbus_read_registers(ctx, address, 1, &reg);
    value = reg;
    break;
  }
  case 4: {
    uint16_t reg = 0;
    rc = modbus_read_input_registers(ctx, address, 1, &reg);
    value = reg;
    break;
  }
  default:
    error_number = EINVAL;
    return false;
  }

  if (rc == -1) {
    error_number = errno;
    return false;
  }
  return true;
}

bool ModbusAdapter::ReadAddresses(const SessionPtr &session,
                                  const std::vector<int> &addresses,
                                  int function_code,
                                  Structs::ModbusReadResult &result,
                                  ErrorInfo &error) {
  if (!IsSupportedFunctionCode(function_code)) {
    error = ErrorInfo(ErrorCode::UNSUPPORTED_FUNCTION,
                      "Unsupported Modbus function code: " +
                          std::to_string(function_code));
    return false;
  }

  auto modbus_session = AsModbusSession(session);
  if (!modbus_session) {
    error = ErrorInfo(ErrorCode::INTERNAL_ERROR, "Invalid Modbus session");
    return false;
  }

  auto io_lock = modbus_session->LockIo();
  if (!modbus_session->ctx) {
    error = ErrorInfo(ErrorCode::CONNECTION_LOST, "Modbus client is closed");
    return false;
  }

  result = Structs::ModbusReadResult();
  result.timestamp = BasicTypes::NowIso8601();
  result.function_code = function_code;

  for (int address : addresses) {
    Structs::ModbusAddressValue entry;
    entry.address = address;
    entry.timestamp = result.timestamp;

    int value = 0;
    int error_number = 0;
    if (address < 0 || address > 0xFFFF) {
      entry.error = "Invalid Modbus address: " + std::to_string(address);
      result.failed_count++;
    } else if (ReadSingle(modbus_session->ctx, address, function_code, value,
                          error_number)) {
      entry.value = value;
    } else {
      entry.error = modbus_strerror(error_number);
      result.failed_count++;
      if (!IsExceptionResponse(error_number)) {
        result.link_suspect = true;
      }
      LogManager::getInstance().logDriver(
          "modbus", LogLevel::WARN,
          "Error reading Modbus address " + std::to_string(address) + " on " +
              modbus_session->target + ": " + entry.error);
    }
    result.values.push_back(std::move(entry));
  }

  return true;
}

bool ModbusAdapter::Probe(const SessionPtr &session, std::string &message,
                          ErrorInfo &error) {
  auto modbus_session = AsModbusSession(session);
  if (!modbus_session) {
    error = ErrorInfo(ErrorCode::INTERNAL_ERROR, "Invalid Modbus session");
    return false;
  }

  auto io_lock = modbus_session->LockIo();
  if (!modbus_session->ctx) {
    error = ErrorInfo(ErrorCode::CONNECTION_LOST, "Modbus client is closed");
    return false;
  }

  int value = 0;
  int error_number = 0;
  if (ReadSingle(modbus_session->ctx, 0, 3, value, error_number)) {
    message = "Modbus connection successful";
    return true;
  }

  // 장치가 예외로 응답했다면 링크는 살아있다
  if (IsExceptionResponse(error_number)) {
    message = std::string("Modbus connection established (test read may "
                          "have failed: ") +
              modbus_strerror(error_number) + ")";
    return true;
  }

  if (error_number == ETIMEDOUT) {
    error = ErrorInfo::Timeout("Modbus test read timeout after " +
                                   std::to_string(
                                       modbus_session->response_timeout_ms) +
                                   "ms",
                               modbus_session->response_timeout_ms);
  } else {
    error = ErrorInfo(ErrorCode::CONNECTION_LOST,
                      std::string("Modbus test read failed: ") +
                          modbus_strerror(error_number));
  }
  return false;
}

} // namespace Drivers
} // namespace OtLink
