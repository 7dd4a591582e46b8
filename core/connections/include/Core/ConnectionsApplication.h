/**
 * @file ConnectionsApplication.h
 * @brief OtLink Connections 애플리케이션 (composition root)
 * @author OtLink Development Team
 */

#ifndef OTLINK_CORE_CONNECTIONS_APPLICATION_H
#define OTLINK_CORE_CONNECTIONS_APPLICATION_H

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "Common/Structs.h"
#include "DatabaseManager.hpp"

namespace OtLink {
namespace Drivers {
class AdapterRegistry;
}
namespace Pool {
class ConnectionPool;
class TimedExecutor;
} // namespace Pool
namespace Storage {
class SqliteConnectionRepository;
}
namespace Scheduler {
class HealthCheckScheduler;
class IStatusChangeNotifier;
struct SweepSummary;
} // namespace Scheduler

namespace Core {

class OtConnectionManager;

/**
 * @brief OtLink Connections 메인 애플리케이션 클래스
 *
 * 다음 구성요소를 하나씩 소유하고 생명주기를 관리한다:
 * - 설정 (ConfigManager) / 로그 (LogManager)
 * - 데이터베이스 (DbLib::DatabaseManager) 와 연결 레코드 저장소
 * - 어댑터 레지스트리, 연결 풀, 실행기, 연결 관리자
 * - 상태 변경 알림과 헬스체크 스케줄러
 */
class ConnectionsApplication {
public:
  ConnectionsApplication();
  ~ConnectionsApplication();

  ConnectionsApplication(const ConnectionsApplication &) = delete;
  ConnectionsApplication &operator=(const ConnectionsApplication &) = delete;

  /**
   * @brief 전체 구성요소 초기화 (중복 호출 시 true 반환)
   */
  bool Initialize();

  /**
   * @brief 스케줄러 시작 후 Stop() 까지 대기
   * @return 초기화 실패 시 false
   */
  bool Run();

  /**
   * @brief 종료 요청 (시그널 핸들러 스레드가 아닌 곳에서 호출)
   */
  void Stop();

  /**
   * @brief 스윕 1회 실행 (--once)
   */
  bool RunOnce();

  /**
   * @brief 임시 연결 테스트 (--test)
   */
  Structs::ProbeResult TestConnection(const std::string &protocol,
                                      const std::string &config_json);

  bool IsRunning() const { return is_running_.load(); }

  OtConnectionManager *GetManager() const { return manager_.get(); }

private:
  bool InitializeDatabase();
  bool InitializeConnections();
  bool InitializeScheduler();
  void Cleanup();

  std::atomic<bool> initialized_{false};
  std::atomic<bool> is_running_{false};
  std::atomic<bool> stop_requested_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::shared_ptr<DbLib::DatabaseManager> database_;
  std::shared_ptr<Storage::SqliteConnectionRepository> repository_;
  std::shared_ptr<Drivers::AdapterRegistry> registry_;
  std::shared_ptr<Pool::ConnectionPool> pool_;
  std::shared_ptr<Pool::TimedExecutor> executor_;
  std::shared_ptr<OtConnectionManager> manager_;
  std::shared_ptr<Scheduler::IStatusChangeNotifier> notifier_;
  std::unique_ptr<Scheduler::HealthCheckScheduler> scheduler_;

  bool health_check_enabled_ = true;
};

} // namespace Core
} // namespace OtLink

#endif // OTLINK_CORE_CONNECTIONS_APPLICATION_H
