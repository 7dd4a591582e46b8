// =============================================================================
// connections/include/Pool/TimedExecutor.h
// 네트워크 I/O 연산을 마감 시간과 경주시키는 실행기
// =============================================================================

#ifndef OTLINK_POOL_TIMED_EXECUTOR_H
#define OTLINK_POOL_TIMED_EXECUTOR_H

#include "Common/Structs.h"
#include "Logging/LogManager.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace OtLink {
namespace Pool {

using ErrorInfo = OtLink::Structs::ErrorInfo;
using ErrorCode = OtLink::Enums::ErrorCode;

struct ExecutorStatistics {
  uint64_t started = 0;
  uint64_t completed = 0;
  uint64_t timed_out = 0;
  uint64_t failed = 0;
  uint64_t dispatched = 0; // Dispatch 로 넘긴 백그라운드 작업
  uint64_t in_flight = 0;  // 마감 후에도 아직 끝나지 않은 연산 포함
};

/**
 * @brief 연산을 별도 스레드에서 실행하고 timeout 안에 끝나지 않으면 포기한다
 *
 * 포기된 연산은 취소되지 않는다. 연산이 캡처한 상태는 shared_ptr 로 유지되어
 * 늦게 도착한 결과는 버려진다. 호출자는 timeout 이 지나면 반드시 반환된다.
 * 모든 워커는 in_flight 로 추적되며 종료 시 Drain() 으로 제한 시간까지 기다린다.
 */
class TimedExecutor {
public:
  TimedExecutor() : counters_(std::make_shared<Counters>()) {}

  TimedExecutor(const TimedExecutor &) = delete;
  TimedExecutor &operator=(const TimedExecutor &) = delete;

  /**
   * @param op     bool(T &, ErrorInfo &) 연산 (결과 채우고 성공 여부 반환)
   * @param what   타임아웃 메시지 접두어 ("OPC UA test" 등)
   * @return false 이면 error 에 연산 에러 또는 TIMEOUT
   */
  template <typename T, typename Op>
  bool Run(Op op,
           std::chrono::milliseconds timeout, const std::string &what, T &out,
           ErrorInfo &error) {
    struct State {
      std::promise<void> done;
      T value{};
      ErrorInfo error;
      bool ok = false;
    };
    auto state = std::make_shared<State>();
    auto counters = counters_;
    std::future<void> finished = state->done.get_future();

    counters->started++;
    counters->in_flight++;

    std::thread([state, counters, op]() {
      try {
        state->ok = op(state->value, state->error);
      } catch (const std::exception &e) {
        state->ok = false;
        state->error =
            ErrorInfo(ErrorCode::INTERNAL_ERROR,
                      std::string("Unexpected error: ") + e.what());
      } catch (...) {
        state->ok = false;
        state->error = ErrorInfo(ErrorCode::INTERNAL_ERROR,
                                 "Unexpected non-standard exception");
      }
      Finish(*counters);
      state->done.set_value();
    }).detach();

    if (finished.wait_for(timeout) != std::future_status::ready) {
      counters->timed_out++;
      error = ErrorInfo::Timeout(what + " timeout after " +
                                     std::to_string(timeout.count()) + "ms",
                                 static_cast<uint32_t>(timeout.count()));
      return false;
    }

    if (!state->ok) {
      counters->failed++;
      error = state->error;
      return false;
    }
    counters->completed++;
    out = std::move(state->value);
    return true;
  }

  /**
   * @brief 결과를 기다리지 않는 백그라운드 작업 (타임아웃된 세션 정리 등)
   *
   * 작업은 in_flight 에 포함되어 Drain() 대상이 된다.
   */
  template <typename Fn> void Dispatch(Fn fn, const std::string &what) {
    auto counters = counters_;
    counters->dispatched++;
    counters->in_flight++;

    std::thread([counters, fn, what]() {
      try {
        fn();
      } catch (const std::exception &e) {
        counters->failed++;
        LogManager::getInstance().Warn("[TimedExecutor] {} failed: {}", what,
                                       e.what());
      } catch (...) {
        counters->failed++;
        LogManager::getInstance().Warn(
            "[TimedExecutor] {} failed: non-standard exception", what);
      }
      Finish(*counters);
    }).detach();
  }

  /**
   * @brief 진행 중인 워커가 모두 끝날 때까지 최대 limit 동안 대기
   * @return limit 안에 in_flight 가 0 이 되었으면 true
   */
  bool Drain(std::chrono::milliseconds limit) {
    auto counters = counters_;
    std::unique_lock<std::mutex> lock(counters->drain_mutex);
    return counters->drained.wait_for(lock, limit, [&counters]() {
      return counters->in_flight.load() == 0;
    });
  }

  ExecutorStatistics GetStatistics() const {
    ExecutorStatistics stats;
    stats.started = counters_->started.load();
    stats.completed = counters_->completed.load();
    stats.timed_out = counters_->timed_out.load();
    stats.failed = counters_->failed.load();
    stats.dispatched = counters_->dispatched.load();
    stats.in_flight = counters_->in_flight.load();
    return stats;
  }

private:
  struct Counters {
    std::atomic<uint64_t> started{0};
    std::atomic<uint64_t> completed{0};
    std::atomic<uint64_t> timed_out{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> dispatched{0};
    std::atomic<uint64_t> in_flight{0};
    std::mutex drain_mutex;
    std::condition_variable drained;
  };

  static void Finish(Counters &counters) {
    {
      std::lock_guard<std::mutex> lock(counters.drain_mutex);
      counters.in_flight--;
    }
    counters.drained.notify_all();
  }

  std::shared_ptr<Counters> counters_;
};

} // namespace Pool
} // namespace OtLink

#endif // OTLINK_POOL_TIMED_EXECUTOR_H
