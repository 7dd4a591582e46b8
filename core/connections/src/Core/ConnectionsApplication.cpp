/**
 * @file ConnectionsApplication.cpp
 * @brief OtLink Connections 애플리케이션 구현
 */

#include "Core/ConnectionsApplication.h"

#include "Config/ConnectionConfigParser.h"
#include "Core/OtConnectionManager.h"
#include "Drivers/Common/AdapterRegistry.h"
#include "Logging/LogManager.h"
#include "Pool/ConnectionPool.h"
#include "Pool/TimedExecutor.h"
#include "Scheduler/HealthCheckScheduler.h"
#include "Scheduler/StatusChangeNotifier.h"
#include "Storage/SqliteConnectionRepository.h"
#include "Utils/ConfigManager.h"

#include <algorithm>
#include <filesystem>

namespace OtLink {
namespace Core {

ConnectionsApplication::ConnectionsApplication() = default;

ConnectionsApplication::~ConnectionsApplication() { Cleanup(); }

// =============================================================================
// 초기화
// =============================================================================

bool ConnectionsApplication::Initialize() {
  if (initialized_.load()) {
    return true;
  }

  auto &logger = LogManager::getInstance();
  logger.Info("=== SYSTEM INITIALIZATION STARTING ===");

  // 1. 설정 (ConfigManager 가 먼저 로드되어야 로그 설정을 읽을 수 있다)
  logger.Info("Step 1/4: Loading configuration...");
  auto &config = ConfigManager::getInstance();
  if (!config.isInitialized()) {
    logger.Error("✗ ConfigManager initialization failed");
    return false;
  }
  logger.reloadSettings();
  logger.Info("✓ Configuration loaded from " + config.getConfigDirectory());

  // 2. 데이터베이스
  logger.Info("Step 2/4: Initializing database...");
  if (!InitializeDatabase()) {
    return false;
  }

  // 3. 어댑터 / 풀 / 관리자
  logger.Info("Step 3/4: Initializing connection manager...");
  if (!InitializeConnections()) {
    return false;
  }

  // 4. 알림 / 스케줄러
  logger.Info("Step 4/4: Initializing health check scheduler...");
  if (!InitializeScheduler()) {
    return false;
  }

  initialized_.store(true);
  logger.Info("=== SYSTEM INITIALIZATION COMPLETED ===");
  return true;
}

bool ConnectionsApplication::InitializeDatabase() {
  auto &logger = LogManager::getInstance();

  DbLib::DatabaseConfig db_config;
  db_config.sqlite_path = ConfigManager::getInstance().getDatabasePath();

  std::error_code ec;
  auto parent = std::filesystem::path(db_config.sqlite_path).parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      logger.Error("✗ Cannot create database directory " + parent.string() +
                   ": " + ec.message());
      return false;
    }
  }

  database_ = std::make_shared<DbLib::DatabaseManager>();
  if (!database_->initialize(db_config, &Storage::DbLogBridge::Instance())) {
    logger.Error("✗ Database open failed: " + db_config.sqlite_path);
    return false;
  }

  repository_ = std::make_shared<Storage::SqliteConnectionRepository>(database_);
  if (!repository_->EnsureSchema()) {
    logger.Error("✗ data_connections schema creation failed");
    return false;
  }

  logger.Info("✓ Database ready: " + db_config.sqlite_path);
  return true;
}

bool ConnectionsApplication::InitializeConnections() {
  auto &logger = LogManager::getInstance();

  registry_ = Drivers::AdapterRegistry::CreateDefault(
      Drivers::AdapterRegistry::LoadDriverOptions());
  pool_ = std::make_shared<Pool::ConnectionPool>(registry_);
  executor_ = std::make_shared<Pool::TimedExecutor>();

  Config::ConnectionConfigParser parser(Config::ParserDefaults::FromConfig());
  manager_ = std::make_shared<OtConnectionManager>(
      pool_, executor_, parser, ManagerOptions::FromConfig());

  std::string protocols;
  for (auto protocol : registry_->GetAvailableProtocols()) {
    if (!protocols.empty()) {
      protocols += ", ";
    }
    protocols += Enums::ProtocolDisplayName(protocol);
  }
  logger.Info("✓ Connection manager ready (drivers: " +
              (protocols.empty() ? std::string("none") : protocols) + ")");
  return true;
}

bool ConnectionsApplication::InitializeScheduler() {
  auto &config = ConfigManager::getInstance();

  // 기본값 0: 로그 싱크는 모든 전이를 기록한다
  auto cooldown = std::chrono::milliseconds(
      std::max(0, config.getInt("NOTIFY_COOLDOWN_MS", 0)));
  notifier_ = Scheduler::MakeStatusNotifier(
      std::make_shared<Scheduler::LoggingStatusNotifier>(), cooldown);
  if (cooldown.count() > 0) {
    LogManager::getInstance().Info("✓ Status notifications throttled ({}ms)",
                                   cooldown.count());
  }

  Config::ConnectionConfigParser parser(Config::ParserDefaults::FromConfig());
  scheduler_ = std::make_unique<Scheduler::HealthCheckScheduler>(
      repository_, manager_, notifier_, parser,
      Scheduler::SchedulerOptions::FromConfig());

  health_check_enabled_ = config.getBool("HEALTH_CHECK_ENABLED", true);
  LogManager::getInstance().Info(
      std::string("✓ Health check scheduler ready (") +
      (health_check_enabled_ ? "enabled" : "disabled") + ")");
  return true;
}

// =============================================================================
// 생명주기
// =============================================================================

bool ConnectionsApplication::Run() {
  auto &logger = LogManager::getInstance();
  logger.Info("OtLink Connections starting...");

  if (!Initialize()) {
    logger.Error("Initialization failed");
    return false;
  }

  is_running_.store(true);
  if (health_check_enabled_) {
    scheduler_->Start();
  } else {
    logger.Info("Health check disabled (HEALTH_CHECK_ENABLED=false)");
  }
  logger.Info("OtLink Connections started successfully");

  {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stop_cv_.wait(lock, [this] { return stop_requested_.load(); });
  }

  Cleanup();
  logger.Info("OtLink Connections shutdown complete");
  return true;
}

void ConnectionsApplication::Stop() {
  LogManager::getInstance().Info("Shutdown requested");
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_.store(true);
  }
  stop_cv_.notify_all();
}

bool ConnectionsApplication::RunOnce() {
  if (!Initialize()) {
    LogManager::getInstance().Error("Initialization failed");
    return false;
  }

  Scheduler::SweepSummary summary = scheduler_->RunSweepOnce();
  manager_->CloseAll();
  return !summary.skipped && !summary.aborted;
}

Structs::ProbeResult
ConnectionsApplication::TestConnection(const std::string &protocol,
                                       const std::string &config_json) {
  // --test 는 DB 없이 관리자만 구성
  if (!manager_) {
    LogManager::getInstance().reloadSettings();
    InitializeConnections();
  }

  Structs::ProbeResult result = manager_->TestConnection(
      protocol, config_json, manager_->GetOptions().probe_timeout);
  manager_->CloseAll();
  return result;
}

void ConnectionsApplication::Cleanup() {
  is_running_.store(false);

  // 스케줄러 정지가 풀의 세션도 닫는다
  if (scheduler_) {
    scheduler_->Stop();
  }
  if (manager_) {
    manager_->CloseAll();
  }
  if (executor_) {
    auto limit = std::chrono::milliseconds(std::max(
        0, ConfigManager::getInstance().getInt("EXECUTOR_DRAIN_MS", 3000)));
    if (!executor_->Drain(limit)) {
      LogManager::getInstance().Warn(
          "{} network workers still running after {}ms shutdown wait",
          executor_->GetStatistics().in_flight, limit.count());
    }
  }
  if (database_) {
    database_->disconnect();
  }
}

} // namespace Core
} // namespace OtLink
