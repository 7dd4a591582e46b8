// =============================================================================
// connections/include/Drivers/Modbus/ModbusAdapter.h
// libmodbus 기반 Modbus TCP/RTU 어댑터
// =============================================================================

#ifndef OTLINK_DRIVERS_MODBUS_ADAPTER_H
#define OTLINK_DRIVERS_MODBUS_ADAPTER_H

#include "Drivers/Common/IOtAdapter.h"

#include <modbus/modbus.h>

#include <string>

namespace OtLink {
namespace Drivers {

/**
 * @brief modbus_t 컨텍스트 소유 세션
 */
class ModbusSession : public AdapterSession {
public:
  ModbusSession() : AdapterSession(ProtocolType::MODBUS) {}
  ~ModbusSession() override { Close(); }

  void Close() {
    if (ctx) {
      modbus_close(ctx);
      modbus_free(ctx);
      ctx = nullptr;
    }
  }

  modbus_t *ctx = nullptr;
  std::string target; // host:port 또는 serial port
  int unit_id = 1;
  uint32_t response_timeout_ms = 3000;
};

/**
 * @brief Modbus 어댑터
 *
 * 별도의 liveness 확인이 없어 VerifyLive 는 항상 true 이다. 링크 상태는
 * 다음 읽기 결과(link_suspect)로 판단하며 호출자가 풀에서 무효화한다.
 */
class ModbusAdapter : public IModbusAdapter {
public:
  ModbusAdapter() = default;
  ~ModbusAdapter() override = default;

  ProtocolType GetProtocolType() const override {
    return ProtocolType::MODBUS;
  }

  SessionPtr Connect(const ConnectionConfig &config,
                     ErrorInfo &error) override;
  bool VerifyLive(const SessionPtr &session) override;
  bool Probe(const SessionPtr &session, std::string &message,
             ErrorInfo &error) override;
  void Disconnect(const SessionPtr &session) override;

  bool ReadAddresses(const SessionPtr &session,
                     const std::vector<int> &addresses, int function_code,
                     Structs::ModbusReadResult &result,
                     ErrorInfo &error) override;

  static bool IsSupportedFunctionCode(int function_code);

  /**
   * @brief Modbus 예외 응답(장치가 응답함)인지, 전송 계층 실패인지
   */
  static bool IsExceptionResponse(int error_number);

private:
  /**
   * @brief 단일 주소 읽기. 실패 시 errno 를 error_number 로 돌려준다
   */
  static bool ReadSingle(modbus_t *ctx, int address, int function_code,
                         int &value, int &error_number);

  static std::shared_ptr<ModbusSession>
  AsModbusSession(const SessionPtr &session);
};

} // namespace Drivers
} // namespace OtLink

#endif // OTLINK_DRIVERS_MODBUS_ADAPTER_H
