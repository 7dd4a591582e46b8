// =============================================================================
// connections/src/Scheduler/StatusChangeNotifier.cpp
// =============================================================================

#include "Scheduler/StatusChangeNotifier.h"
#include "Logging/LogManager.h"

namespace OtLink {
namespace Scheduler {

// =============================================================================
// LoggingStatusNotifier
// =============================================================================

void LoggingStatusNotifier::OnStatusChange(const StatusTransitionEvent &event) {
  LogLevel level = event.new_status == Enums::ConnectionStatus::CONNECTION_ERROR
                       ? LogLevel::WARN
                       : LogLevel::INFO;
  std::string message = "Connection " + event.connection_id + " (" +
                        event.protocol + ") " +
                        Enums::ConnectionStatusToString(event.old_status) +
                        " -> " +
                        Enums::ConnectionStatusToString(event.new_status);
  if (!event.last_error.empty()) {
    message += ": " + event.last_error;
  }
  LogManager::getInstance().logHealth(level, message);
}

// =============================================================================
// ThrottledStatusNotifier
// =============================================================================

ThrottledStatusNotifier::ThrottledStatusNotifier(
    std::shared_ptr<IStatusChangeNotifier> downstream,
    std::chrono::milliseconds cooldown, NowFunction now)
    : downstream_(std::move(downstream)), cooldown_(cooldown),
      now_(now ? std::move(now) : NowFunction([] { return Clock::now(); })) {}

void ThrottledStatusNotifier::PurgeExpired(Clock::time_point now) {
  for (auto it = last_sent_.begin(); it != last_sent_.end();) {
    if (now - it->second >= cooldown_) {
      it = last_sent_.erase(it);
    } else {
      ++it;
    }
  }
}

void ThrottledStatusNotifier::OnStatusChange(
    const StatusTransitionEvent &event) {
  ThrottleKey key{event.connection_id, event.new_status};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = now_();
    PurgeExpired(now);
    if (last_sent_.find(key) != last_sent_.end()) {
      suppressed_++;
      LogManager::getInstance().Debug(
          "[ThrottledStatusNotifier] Suppressed {} -> {}", event.connection_id,
          Enums::ConnectionStatusToString(event.new_status));
      return;
    }
    last_sent_[key] = now;
    delivered_++;
  }

  // 하위 전달은 락 밖에서
  if (downstream_) {
    downstream_->OnStatusChange(event);
  }
}

uint64_t ThrottledStatusNotifier::GetDeliveredCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return delivered_;
}

uint64_t ThrottledStatusNotifier::GetSuppressedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return suppressed_;
}

size_t ThrottledStatusNotifier::GetCacheSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_sent_.size();
}

// =============================================================================
// 조립
// =============================================================================

std::shared_ptr<IStatusChangeNotifier>
MakeStatusNotifier(std::shared_ptr<IStatusChangeNotifier> sink,
                   std::chrono::milliseconds cooldown) {
  if (cooldown.count() <= 0) {
    return sink;
  }
  return std::make_shared<ThrottledStatusNotifier>(std::move(sink), cooldown);
}

} // namespace Scheduler
} // namespace OtLink
