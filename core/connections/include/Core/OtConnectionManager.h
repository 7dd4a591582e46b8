// =============================================================================
// connections/include/Core/OtConnectionManager.h
// OT 연결 관리자 - 연결 테스트 / 프로토콜별 읽기 진입점
// =============================================================================

#ifndef OTLINK_CORE_OT_CONNECTION_MANAGER_H
#define OTLINK_CORE_OT_CONNECTION_MANAGER_H

#include "Config/ConnectionConfigParser.h"
#include "Pool/ConnectionPool.h"
#include "Pool/TimedExecutor.h"
#include "Scheduler/IConnectionProber.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace OtLink {
namespace Core {

using ConnectionConfig = OtLink::Structs::ConnectionConfig;
using ErrorInfo = OtLink::Structs::ErrorInfo;
using ProbeResult = OtLink::Structs::ProbeResult;
using JsonType = OtLink::Structs::JsonType;

/**
 * @brief 기본 마감 시간들
 */
struct ManagerOptions {
  std::chrono::milliseconds probe_timeout{5000};
  std::chrono::milliseconds opcua_read_timeout{10000};
  std::chrono::milliseconds modbus_read_timeout{10000};
  std::chrono::milliseconds mqtt_collect_window{5000};
  std::chrono::milliseconds mqtt_collect_grace{5000};

  static ManagerOptions FromConfig();
};

/**
 * @brief 라우트 계층이 사용하는 연결 관리 facade
 *
 * 모든 네트워크 연산은 TimedExecutor 를 거친다. 디바이스 에러는 예외가 아니라
 * ProbeResult / ErrorInfo 로 돌려준다. 읽기 실패나 타임아웃 시 풀의 해당
 * 핸들을 무효화하여 다음 호출이 재연결하도록 한다.
 */
class OtConnectionManager : public Scheduler::IConnectionProber {
public:
  OtConnectionManager(std::shared_ptr<Pool::ConnectionPool> pool,
                      std::shared_ptr<Pool::TimedExecutor> executor,
                      const Config::ConnectionConfigParser &parser,
                      const ManagerOptions &options = {});
  ~OtConnectionManager() override = default;

  OtConnectionManager(const OtConnectionManager &) = delete;
  OtConnectionManager &operator=(const OtConnectionManager &) = delete;

  // =======================================================================
  // 연결 테스트
  // =======================================================================

  ProbeResult TestConnection(const ConnectionConfig &config,
                             std::chrono::milliseconds timeout) override;

  ProbeResult TestConnection(const ConnectionConfig &config) {
    return TestConnection(config, options_.probe_timeout);
  }

  /**
   * @brief 저장 형식 그대로 테스트 ("opcua", "{...}")
   */
  ProbeResult TestConnection(const std::string &protocol,
                             const std::string &config_json,
                             std::chrono::milliseconds timeout);

  // =======================================================================
  // 프로토콜별 읽기
  // =======================================================================

  bool ReadOpcUa(const ConnectionConfig &config,
                 const std::vector<std::string> &node_ids,
                 Structs::OpcUaReadResult &result, ErrorInfo &error,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  /**
   * @param window 수집 창 (0 이면 기본값). 마감은 window + grace
   */
  bool CollectMqtt(const ConnectionConfig &config,
                   const std::vector<std::string> &topics, int qos,
                   Structs::MqttCollectResult &result, ErrorInfo &error,
                   std::chrono::milliseconds window = std::chrono::milliseconds(0));

  bool ReadModbus(const ConnectionConfig &config,
                  const std::vector<int> &addresses, int function_code,
                  Structs::ModbusReadResult &result, ErrorInfo &error,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  /**
   * @brief 범용 읽기 계약
   * @param targets {nodeIds} | {topics, qos} | {addresses, functionCode}
   * @param timeout_ms 0 이하이면 프로토콜 기본값
   */
  bool ReadConnection(const std::string &protocol,
                      const std::string &config_json, const JsonType &targets,
                      int timeout_ms, JsonType &out, ErrorInfo &error);

  // =======================================================================
  // 기타
  // =======================================================================

  bool Validate(const ConnectionConfig &config, ErrorInfo &error) const {
    return Config::ConnectionConfigParser::Validate(config, error);
  }

  void CloseAll() override;
  std::string DescribeStatistics() const override;

  const ManagerOptions &GetOptions() const { return options_; }

private:
  /**
   * @brief 타임아웃된 키를 즉시 풀에서 빼고 disconnect 는 executor 로 넘긴다
   */
  void DropTimedOutSession(const std::string &key);

  bool ParseForProtocol(const std::string &protocol,
                        const std::string &config_json,
                        ConnectionConfig &config, ErrorInfo &error) const;

  std::shared_ptr<Pool::ConnectionPool> pool_;
  std::shared_ptr<Pool::TimedExecutor> executor_;
  Config::ConnectionConfigParser parser_;
  ManagerOptions options_;
};

} // namespace Core
} // namespace OtLink

#endif // OTLINK_CORE_OT_CONNECTION_MANAGER_H
