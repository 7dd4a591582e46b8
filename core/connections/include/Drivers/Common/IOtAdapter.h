// connections/include/Drivers/Common/IOtAdapter.h
#ifndef OTLINK_DRIVERS_IOT_ADAPTER_H
#define OTLINK_DRIVERS_IOT_ADAPTER_H

#include "Common/BasicTypes.h"
#include "Common/Enums.h"
#include "Common/Structs.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace OtLink {
namespace Drivers {

// =============================================================================
// 타입 별칭들
// =============================================================================
using ProtocolType = OtLink::Enums::ProtocolType;
using ErrorCode = OtLink::Enums::ErrorCode;
using ErrorInfo = OtLink::Structs::ErrorInfo;
using ConnectionConfig = OtLink::Structs::ConnectionConfig;
using Timestamp = OtLink::BasicTypes::Timestamp;

// =============================================================================
// AdapterSession - 프로토콜 라이브러리 핸들을 감싸는 세션
// =============================================================================

/**
 * @brief 한 번의 connect 로 만들어진 프로토콜 세션
 * @details 프로토콜별 파생 클래스가 라이브러리 핸들(UA_Client*, modbus_t*,
 *          mqtt::async_client)을 소유한다. 라이브러리 핸들은 스레드 안전하지
 *          않으므로 모든 I/O 는 LockIo() 를 잡고 수행한다.
 *          포기된(타임아웃) 연산이 락을 쥐고 있을 수 있으므로 해제 경로는
 *          TryLockIo() 로 제한된 시간만 기다린다. 기다리지 못하면 마지막
 *          참조가 사라질 때 파생 클래스 소멸자가 핸들을 닫는다.
 */
class AdapterSession {
public:
  explicit AdapterSession(ProtocolType protocol)
      : protocol_(protocol), created_at_(std::chrono::system_clock::now()) {}
  virtual ~AdapterSession() = default;

  AdapterSession(const AdapterSession &) = delete;
  AdapterSession &operator=(const AdapterSession &) = delete;

  ProtocolType GetProtocol() const { return protocol_; }
  Timestamp GetCreatedAt() const { return created_at_; }

  using IoLock = std::unique_lock<std::timed_mutex>;

  IoLock LockIo() { return IoLock(io_mutex_); }

  IoLock TryLockIo(std::chrono::milliseconds wait) {
    IoLock lock(io_mutex_, std::defer_lock);
    lock.try_lock_for(wait);
    return lock;
  }

private:
  ProtocolType protocol_;
  Timestamp created_at_;
  std::timed_mutex io_mutex_;
};

using SessionPtr = std::shared_ptr<AdapterSession>;

// Disconnect 가 I/O 락을 기다리는 최대 시간
constexpr std::chrono::milliseconds kDisconnectLockWait{500};

// =============================================================================
// IOtAdapter - 프로토콜 공통 계약
// =============================================================================

/**
 * @brief 한 프로토콜의 connect / verify / probe / disconnect
 * @details 읽기 연산은 프로토콜마다 의미가 달라 하위 인터페이스에 둔다.
 */
class IOtAdapter {
public:
  virtual ~IOtAdapter() = default;

  virtual ProtocolType GetProtocolType() const = 0;

  /**
   * @brief 드라이버 사용 가능 여부 (UnavailableAdapter 만 false)
   */
  virtual bool IsAvailable() const { return true; }

  /**
   * @brief 세션/링크 수립
   * @return 실패 시 nullptr, error 에 CONNECTION_FAILED 등
   */
  virtual SessionPtr Connect(const ConnectionConfig &config,
                             ErrorInfo &error) = 0;

  /**
   * @brief 캐시된 세션이 아직 살아있는지 가벼운 확인
   */
  virtual bool VerifyLive(const SessionPtr &session) = 0;

  /**
   * @brief 연결 테스트 (testConnection)
   * @param message 성공 시 사용자에게 보일 메시지
   */
  virtual bool Probe(const SessionPtr &session, std::string &message,
                     ErrorInfo &error) = 0;

  /**
   * @brief best-effort 해제. 실패는 로그만 남기고 throw 하지 않는다
   */
  virtual void Disconnect(const SessionPtr &session) = 0;
};

// =============================================================================
// 프로토콜별 읽기 인터페이스
// =============================================================================

class IOpcUaAdapter : public IOtAdapter {
public:
  /**
   * @brief 노드 배치 읽기 (한 번의 Read 서비스 호출, 입력 순서 유지)
   */
  virtual bool ReadNodes(const SessionPtr &session,
                         const std::vector<std::string> &node_ids,
                         Structs::OpcUaReadResult &result,
                         ErrorInfo &error) = 0;
};

class IMqttAdapter : public IOtAdapter {
public:
  /**
   * @brief 구독 후 window 동안 메시지 수집
   */
  virtual bool CollectMessages(const SessionPtr &session,
                               const std::vector<std::string> &topics, int qos,
                               std::chrono::milliseconds window,
                               Structs::MqttCollectResult &result,
                               ErrorInfo &error) = 0;
};

class IModbusAdapter : public IOtAdapter {
public:
  /**
   * @brief 주소별 개별 읽기. 한 주소의 실패가 배치를 중단시키지 않는다
   */
  virtual bool ReadAddresses(const SessionPtr &session,
                             const std::vector<int> &addresses,
                             int function_code,
                             Structs::ModbusReadResult &result,
                             ErrorInfo &error) = 0;
};

} // namespace Drivers
} // namespace OtLink

#endif // OTLINK_DRIVERS_IOT_ADAPTER_H
