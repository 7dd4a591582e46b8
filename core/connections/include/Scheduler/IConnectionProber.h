// connections/include/Scheduler/IConnectionProber.h
#ifndef OTLINK_SCHEDULER_ICONNECTION_PROBER_H
#define OTLINK_SCHEDULER_ICONNECTION_PROBER_H

#include "Common/Structs.h"

#include <chrono>
#include <string>

namespace OtLink {
namespace Scheduler {

/**
 * @brief 스케줄러가 연결 테스트를 요청하는 경계
 * @details 구현체(OtConnectionManager)는 절대 throw 하지 않고 디바이스 에러를
 *          실패한 ProbeResult 로 돌려준다.
 */
class IConnectionProber {
public:
  virtual ~IConnectionProber() = default;

  virtual Structs::ProbeResult
  TestConnection(const Structs::ConnectionConfig &config,
                 std::chrono::milliseconds timeout) = 0;

  /**
   * @brief 캐시된 모든 연결 해제 (종료 시)
   */
  virtual void CloseAll() = 0;

  /**
   * @brief 스윕 후 로그용 통계 요약
   */
  virtual std::string DescribeStatistics() const { return std::string(); }
};

} // namespace Scheduler
} // namespace OtLink

#endif // OTLINK_SCHEDULER_ICONNECTION_PROBER_H
