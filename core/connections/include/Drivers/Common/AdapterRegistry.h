// =============================================================================
// connections/include/Drivers/Common/AdapterRegistry.h
// 프로토콜 -> 어댑터 레지스트리 (애플리케이션이 소유, 싱글턴 아님)
// =============================================================================

#ifndef OTLINK_DRIVERS_ADAPTER_REGISTRY_H
#define OTLINK_DRIVERS_ADAPTER_REGISTRY_H

#include "Drivers/Common/IOtAdapter.h"

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace OtLink {
namespace Drivers {

using AdapterPtr = std::shared_ptr<IOtAdapter>;

/**
 * @brief 프로토콜별 어댑터 보관소
 *
 * 프로토콜당 어댑터 하나. 비활성화된 드라이버는 UnavailableAdapter 로
 * 등록되어 connect 시 즉시 DRIVER_UNAVAILABLE 로 실패한다.
 */
class AdapterRegistry {
public:
  /**
   * @brief 어댑터 기본 파라미터 (ConfigManager 에서 로드)
   */
  struct DriverOptions {
    bool opcua_enabled = true;
    bool mqtt_enabled = true;
    bool modbus_enabled = true;
  };

  AdapterRegistry() = default;
  ~AdapterRegistry() = default;

  AdapterRegistry(const AdapterRegistry &) = delete;
  AdapterRegistry &operator=(const AdapterRegistry &) = delete;

  /**
   * @brief 어댑터 등록
   * @return 같은 프로토콜이 이미 등록되어 있으면 false
   */
  bool RegisterAdapter(AdapterPtr adapter);

  /**
   * @brief 등록 해제
   */
  bool UnregisterAdapter(ProtocolType protocol);

  /**
   * @brief 어댑터 조회 (미등록이면 nullptr)
   */
  AdapterPtr GetAdapter(ProtocolType protocol) const;

  /**
   * @brief 등록되어 있고 사용 가능한지
   */
  bool IsProtocolSupported(ProtocolType protocol) const;

  std::vector<ProtocolType> GetAvailableProtocols() const;
  size_t GetAdapterCount() const;

  /**
   * @brief DRIVER_<P>_ENABLED 설정값 읽기
   */
  static DriverOptions LoadDriverOptions();

  /**
   * @brief 실제 드라이버(open62541 / paho / libmodbus)로 채운 레지스트리
   */
  static std::shared_ptr<AdapterRegistry>
  CreateDefault(const DriverOptions &options);

private:
  mutable std::mutex mutex_;
  std::map<ProtocolType, AdapterPtr> adapters_;
};

} // namespace Drivers
} // namespace OtLink

#endif // OTLINK_DRIVERS_ADAPTER_REGISTRY_H
