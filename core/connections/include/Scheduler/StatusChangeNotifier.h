// =============================================================================
// connections/include/Scheduler/StatusChangeNotifier.h
// 상태 전이 이벤트 전달 경계 (외부 브로드캐스터/알림)
// =============================================================================

#ifndef OTLINK_SCHEDULER_STATUS_CHANGE_NOTIFIER_H
#define OTLINK_SCHEDULER_STATUS_CHANGE_NOTIFIER_H

#include "Common/Structs.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>

namespace OtLink {
namespace Scheduler {

using StatusTransitionEvent = OtLink::Structs::StatusTransitionEvent;

/**
 * @brief fire-and-forget. 구현체가 던진 예외는 스케줄러가 잡아 로그만 남긴다
 */
class IStatusChangeNotifier {
public:
  virtual ~IStatusChangeNotifier() = default;
  virtual void OnStatusChange(const StatusTransitionEvent &event) = 0;
};

/**
 * @brief 기본 싱크: "health" 카테고리 로그
 */
class LoggingStatusNotifier : public IStatusChangeNotifier {
public:
  void OnStatusChange(const StatusTransitionEvent &event) override;
};

/**
 * @brief std::function 브로드캐스터 어댑터
 */
class CallbackStatusNotifier : public IStatusChangeNotifier {
public:
  using Callback = std::function<void(const StatusTransitionEvent &)>;

  explicit CallbackStatusNotifier(Callback callback)
      : callback_(std::move(callback)) {}

  void OnStatusChange(const StatusTransitionEvent &event) override {
    if (callback_) {
      callback_(event);
    }
  }

private:
  Callback callback_;
};

/**
 * @brief 같은 (connection_id, new_status) 의 반복 전달을 cooldown 동안 억제
 *
 * 키는 문자열 연결이 아닌 구조체 튜플이다. 만료된 항목은 전달 시점에 정리된다.
 */
class ThrottledStatusNotifier : public IStatusChangeNotifier {
public:
  using Clock = std::chrono::steady_clock;
  using NowFunction = std::function<Clock::time_point()>;

  struct ThrottleKey {
    std::string connection_id;
    Enums::ConnectionStatus new_status = Enums::ConnectionStatus::INACTIVE;

    bool operator<(const ThrottleKey &other) const {
      return std::tie(connection_id, new_status) <
             std::tie(other.connection_id, other.new_status);
    }
  };

  ThrottledStatusNotifier(std::shared_ptr<IStatusChangeNotifier> downstream,
                          std::chrono::milliseconds cooldown =
                              std::chrono::milliseconds(300000),
                          NowFunction now = nullptr);

  void OnStatusChange(const StatusTransitionEvent &event) override;

  uint64_t GetDeliveredCount() const;
  uint64_t GetSuppressedCount() const;
  size_t GetCacheSize() const;

private:
  void PurgeExpired(Clock::time_point now);

  std::shared_ptr<IStatusChangeNotifier> downstream_;
  std::chrono::milliseconds cooldown_;
  NowFunction now_;

  mutable std::mutex mutex_;
  std::map<ThrottleKey, Clock::time_point> last_sent_;
  uint64_t delivered_ = 0;
  uint64_t suppressed_ = 0;
};

/**
 * @brief 싱크 앞에 cooldown 억제를 선택적으로 붙인다
 * @param cooldown 0 이면 sink 를 그대로 돌려준다 (모든 전이를 전달)
 */
std::shared_ptr<IStatusChangeNotifier>
MakeStatusNotifier(std::shared_ptr<IStatusChangeNotifier> sink,
                   std::chrono::milliseconds cooldown);

} // namespace Scheduler
} // namespace OtLink

#endif // OTLINK_SCHEDULER_STATUS_CHANGE_NOTIFIER_H
