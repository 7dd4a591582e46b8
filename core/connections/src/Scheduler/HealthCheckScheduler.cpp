// =============================================================================
// connections/src/Scheduler/HealthCheckScheduler.cpp
// =============================================================================

#include "Scheduler/HealthCheckScheduler.h"
#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

#include <algorithm>

namespace OtLink {
namespace Scheduler {

using namespace std::chrono;
using ConnectionStatus = OtLink::Enums::ConnectionStatus;
using ProtocolType = OtLink::Enums::ProtocolType;

SchedulerOptions SchedulerOptions::FromConfig() {
  auto &config = ConfigManager::getInstance();
  SchedulerOptions options;
  options.interval = milliseconds(
      std::max(1000, config.getInt("HEALTH_CHECK_INTERVAL_MS", 300000)));
  options.probe_timeout =
      milliseconds(std::max(1, config.getInt("PROBE_TIMEOUT_MS", 5000)));
  return options;
}

HealthCheckScheduler::HealthCheckScheduler(
    std::shared_ptr<Storage::IConnectionRepository> repository,
    std::shared_ptr<IConnectionProber> prober,
    std::shared_ptr<IStatusChangeNotifier> notifier,
    const Config::ConnectionConfigParser &parser,
    const SchedulerOptions &options)
    : repository_(std::move(repository)), prober_(std::move(prober)),
      notifier_(std::move(notifier)), parser_(parser), options_(options) {}

HealthCheckScheduler::~HealthCheckScheduler() { Stop(); }

// =============================================================================
// 생명주기
// =============================================================================

bool HealthCheckScheduler::Start() { return Start(options_.interval); }

bool HealthCheckScheduler::Start(milliseconds interval) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (running_ || stopping_) {
    LogManager::getInstance().Debug(
        "[HealthCheckScheduler] Start ignored: already running");
    return false;
  }
  if (interval.count() <= 0) {
    interval = options_.interval;
  }

  running_ = true;
  stop_requested_ = false;
  worker_ = std::thread(&HealthCheckScheduler::WorkerLoop, this, interval);

  LogManager::getInstance().logHealth(
      LogLevel::INFO, "Health check scheduler started (interval " +
                          std::to_string(interval.count()) + "ms)");
  return true;
}

void HealthCheckScheduler::Stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!running_ || stopping_) {
      return;
    }
    stopping_ = true;
    stop_requested_ = true;
    worker = std::move(worker_);
  }
  stop_cv_.notify_all();

  if (worker.joinable()) {
    if (worker.get_id() == std::this_thread::get_id()) {
      worker.detach();
    } else {
      worker.join();
    }
  }

  if (prober_) {
    prober_->CloseAll();
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    running_ = false;
    stopping_ = false;
  }
  LogManager::getInstance().logHealth(LogLevel::INFO,
                                      "Health check scheduler stopped");
}

bool HealthCheckScheduler::IsRunning() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return running_ && !stopping_;
}

bool HealthCheckScheduler::IsStopRequested() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return stop_requested_;
}

void HealthCheckScheduler::WorkerLoop(milliseconds interval) {
  RunSweepOnce();

  while (true) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    if (stop_cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    RunSweepOnce();
  }
}

// =============================================================================
// 스윕
// =============================================================================

SweepSummary HealthCheckScheduler::RunSweepOnce() {
  SweepSummary summary;
  std::unique_lock<std::mutex> sweep_lock(sweep_mutex_, std::try_to_lock);
  if (!sweep_lock.owns_lock()) {
    summary.skipped = true;
    LogManager::getInstance().logHealth(
        LogLevel::DEBUG, "Sweep skipped: previous sweep still running");
    return summary;
  }

  auto start = steady_clock::now();
  std::vector<Storage::ConnectionRecord> records;
  if (!repository_ || !repository_->ListOtConnections(records)) {
    summary.aborted = true;
    LogManager::getInstance().logHealth(
        LogLevel::LOG_ERROR, "Failed to load OT connections, sweep aborted");
    return summary;
  }

  summary.total = records.size();
  for (const auto &record : records) {
    if (IsStopRequested()) {
      summary.aborted = true;
      break;
    }
    try {
      ProcessRecord(record, summary);
    } catch (const std::exception &e) {
      summary.record_errors++;
      LogManager::getInstance().logHealth(
          LogLevel::LOG_ERROR,
          "Health check failed for " + record.id + ": " + e.what());
    } catch (...) {
      summary.record_errors++;
      LogManager::getInstance().logHealth(
          LogLevel::LOG_ERROR, "Health check failed for " + record.id +
                                   ": non-standard exception");
    }
  }

  summary.duration_ms =
      duration_cast<milliseconds>(steady_clock::now() - start).count();
  sweep_count_++;

  LogManager::getInstance().logHealth(
      LogLevel::INFO,
      "Sweep complete: " + std::to_string(summary.total) + " connections, " +
          std::to_string(summary.succeeded) + " ok, " +
          std::to_string(summary.failed) + " failed, " +
          std::to_string(summary.transitions) + " transitions (" +
          std::to_string(summary.duration_ms) + "ms)");
  if (prober_) {
    std::string stats = prober_->DescribeStatistics();
    if (!stats.empty()) {
      LogManager::getInstance().logHealth(LogLevel::DEBUG, stats);
    }
  }
  return summary;
}

Structs::ProbeResult
HealthCheckScheduler::ProbeRecord(const Storage::ConnectionRecord &record) {
  ProtocolType type = Enums::StringToProtocolType(record.protocol);

  // 드라이버 유무와 관계없이 저장된 설정은 먼저 파싱/검증한다
  Structs::ConnectionConfig config;
  Structs::ErrorInfo error;
  if (!parser_.Parse(type, record.config_json, config, error)) {
    return error.ToProbeResult();
  }
  if (!Config::ConnectionConfigParser::Validate(config, error)) {
    return error.ToProbeResult();
  }

  // 드라이버가 없는 OT 프로토콜은 경보를 내지 않는다
  if (!Enums::HasProtocolDriver(type)) {
    Structs::ProbeResult synthetic;
    synthetic.success = true;
    synthetic.message = "not auto-checked";
    return synthetic;
  }

  if (!prober_) {
    return Structs::ErrorInfo(Enums::ErrorCode::INTERNAL_ERROR,
                              "No connection prober configured")
        .ToProbeResult();
  }
  return prober_->TestConnection(config, options_.probe_timeout);
}

void HealthCheckScheduler::ProcessRecord(
    const Storage::ConnectionRecord &record, SweepSummary &summary) {
  Structs::ProbeResult probe = ProbeRecord(record);

  ConnectionStatus new_status =
      probe.success ? ConnectionStatus::ACTIVE
                    : ConnectionStatus::CONNECTION_ERROR;
  if (probe.success) {
    summary.succeeded++;
  } else {
    summary.failed++;
  }

  // 상태가 같아도 lastTestedAt 갱신을 위해 항상 저장
  Structs::StatusUpdate update;
  update.status = new_status;
  update.last_tested_at = BasicTypes::NowIso8601();
  update.last_error = probe.success ? std::string() : probe.message;
  update.latency_ms = probe.latency_ms;

  if (!repository_->UpdateConnectionStatus(record.id, update)) {
    summary.persist_failures++;
    LogManager::getInstance().logHealth(
        LogLevel::WARN, "Failed to persist status for " + record.id);
    return;
  }
  summary.persisted++;

  if (record.status == new_status) {
    return;
  }

  summary.transitions++;
  Structs::StatusTransitionEvent event;
  event.connection_id = record.id;
  event.organization_id = record.organization_id;
  event.protocol = record.protocol;
  event.old_status = record.status;
  event.new_status = new_status;
  event.latency_ms = probe.latency_ms;
  event.last_error = update.last_error;
  event.occurred_at = update.last_tested_at;

  if (!notifier_) {
    return;
  }
  try {
    notifier_->OnStatusChange(event);
  } catch (const std::exception &e) {
    LogManager::getInstance().logHealth(
        LogLevel::WARN,
        "Status change notification failed for " + record.id + ": " + e.what());
  } catch (...) {
    LogManager::getInstance().logHealth(
        LogLevel::WARN, "Status change notification failed for " + record.id +
                            ": non-standard exception");
  }
}

} // namespace Scheduler
} // namespace OtLink
