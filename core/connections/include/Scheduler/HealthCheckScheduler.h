// =============================================================================
// connections/include/Scheduler/HealthCheckScheduler.h
// 등록된 OT 연결 주기적 헬스체크
// =============================================================================

#ifndef OTLINK_SCHEDULER_HEALTH_CHECK_SCHEDULER_H
#define OTLINK_SCHEDULER_HEALTH_CHECK_SCHEDULER_H

#include "Config/ConnectionConfigParser.h"
#include "Scheduler/IConnectionProber.h"
#include "Scheduler/StatusChangeNotifier.h"
#include "Storage/IConnectionRepository.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace OtLink {
namespace Scheduler {

struct SchedulerOptions {
  std::chrono::milliseconds interval{300000};
  std::chrono::milliseconds probe_timeout{5000};

  static SchedulerOptions FromConfig();
};

/**
 * @brief 스윕 1회 결과
 */
struct SweepSummary {
  bool skipped = false; // 다른 스윕이 진행 중이었음
  bool aborted = false; // 저장소 오류 또는 정지 요청
  size_t total = 0;
  size_t succeeded = 0;
  size_t failed = 0;
  size_t persisted = 0;
  size_t persist_failures = 0;
  size_t transitions = 0;
  size_t record_errors = 0;
  int64_t duration_ms = 0;
};

/**
 * @brief 헬스체크 스케줄러 (Stopped -> Running -> Stopped)
 *
 * Start 는 워커 스레드를 하나 만들고 즉시 스윕한 뒤 interval 마다 반복한다.
 * 레코드는 순차적으로 probe 된다 (스윕당 동시에 1개). 상태는 매 스윕마다
 * 저장하고, 이벤트는 상태가 바뀐 경우에만 발행한다.
 */
class HealthCheckScheduler {
public:
  HealthCheckScheduler(std::shared_ptr<Storage::IConnectionRepository> repository,
                       std::shared_ptr<IConnectionProber> prober,
                       std::shared_ptr<IStatusChangeNotifier> notifier,
                       const Config::ConnectionConfigParser &parser,
                       const SchedulerOptions &options = {});
  ~HealthCheckScheduler();

  HealthCheckScheduler(const HealthCheckScheduler &) = delete;
  HealthCheckScheduler &operator=(const HealthCheckScheduler &) = delete;

  /**
   * @return 새로 시작했으면 true, 이미 실행 중이면 false (no-op)
   */
  bool Start();
  bool Start(std::chrono::milliseconds interval);

  /**
   * @brief 워커 정지 후 prober.CloseAll(). 이미 정지 상태면 no-op
   */
  void Stop();

  bool IsRunning() const;

  /**
   * @brief 스윕 1회. 진행 중인 스윕이 있으면 skipped 로 즉시 반환
   */
  SweepSummary RunSweepOnce();

  uint64_t GetSweepCount() const { return sweep_count_.load(); }

private:
  void WorkerLoop(std::chrono::milliseconds interval);
  void ProcessRecord(const Storage::ConnectionRecord &record,
                     SweepSummary &summary);
  Structs::ProbeResult ProbeRecord(const Storage::ConnectionRecord &record);
  bool IsStopRequested() const;

  std::shared_ptr<Storage::IConnectionRepository> repository_;
  std::shared_ptr<IConnectionProber> prober_;
  std::shared_ptr<IStatusChangeNotifier> notifier_;
  Config::ConnectionConfigParser parser_;
  SchedulerOptions options_;

  // 상태 플래그: Start/Stop 경쟁을 state_mutex_ 로 보호
  mutable std::mutex state_mutex_;
  std::condition_variable stop_cv_;
  bool running_ = false;
  bool stopping_ = false;
  bool stop_requested_ = false;
  std::thread worker_;

  // 스윕 중복 방지
  std::mutex sweep_mutex_;
  std::atomic<uint64_t> sweep_count_{0};
};

} // namespace Scheduler
} // namespace OtLink

#endif // OTLINK_SCHEDULER_HEALTH_CHECK_SCHEDULER_H
