// =============================================================================
// connections/src/Storage/SqliteConnectionRepository.cpp
// =============================================================================

#include "Storage/SqliteConnectionRepository.h"
#include "Logging/LogManager.h"
#include "Storage/SQLQueries.h"

namespace OtLink {
namespace Storage {

using DbLib::Row;
using DbLib::SqlParam;

// =============================================================================
// DbLogBridge
// =============================================================================

void DbLogBridge::log(const std::string &category, int level,
                      const std::string &message) {
  LogLevel mapped = LogLevel::INFO;
  switch (level) {
  case 0:
    mapped = LogLevel::DEBUG;
    break;
  case 2:
    mapped = LogLevel::WARN;
    break;
  case 3:
    mapped = LogLevel::LOG_ERROR;
    break;
  default:
    break;
  }
  LogManager::getInstance().log(category, mapped, message);
}

DbLogBridge &DbLogBridge::Instance() {
  static DbLogBridge instance;
  return instance;
}

// =============================================================================
// SqliteConnectionRepository
// =============================================================================

SqliteConnectionRepository::SqliteConnectionRepository(
    std::shared_ptr<DbLib::DatabaseManager> db)
    : db_(std::move(db)) {}

bool SqliteConnectionRepository::EnsureSchema() {
  if (!db_ || !db_->executeNonQuery(SQL::DataConnection::CREATE_TABLE)) {
    LogManager::getInstance().Error(
        "[SqliteConnectionRepository] Failed to create data_connections: {}",
        db_ ? db_->lastError() : std::string("no database"));
    return false;
  }
  return true;
}

ConnectionRecord SqliteConnectionRepository::MapRowToRecord(const Row &row) {
  auto get = [&row](const char *column) {
    auto it = row.find(column);
    return it == row.end() ? std::string() : it->second;
  };

  ConnectionRecord record;
  record.id = get("id");
  record.organization_id = get("organizationId");
  record.name = get("name");
  record.protocol = get("type");
  record.config_json = get("config");
  if (record.config_json.empty()) {
    record.config_json = "{}";
  }
  record.status = Enums::StringToConnectionStatus(get("status"));
  record.last_tested_at = get("lastTestedAt");
  record.last_error = get("lastError");

  const std::string latency = get("latencyMs");
  try {
    record.latency_ms = latency.empty() ? 0 : std::stoll(latency);
  } catch (const std::exception &) {
    record.latency_ms = 0;
  }
  return record;
}

bool SqliteConnectionRepository::ListOtConnections(
    std::vector<ConnectionRecord> &records) {
  records.clear();
  std::vector<Row> rows;
  if (!db_ || !db_->executeQuery(SQL::DataConnection::FIND_OT_CONNECTIONS,
                                 rows)) {
    LogManager::getInstance().Error(
        "[SqliteConnectionRepository] ListOtConnections failed: {}",
        db_ ? db_->lastError() : std::string("no database"));
    return false;
  }
  records.reserve(rows.size());
  for (const auto &row : rows) {
    records.push_back(MapRowToRecord(row));
  }
  return true;
}

bool SqliteConnectionRepository::UpdateConnectionStatus(
    const std::string &id, const StatusUpdate &update) {
  if (!db_) {
    return false;
  }
  std::vector<SqlParam> params{
      Enums::ConnectionStatusToString(update.status),
      update.last_tested_at,
      update.last_error.empty() ? SqlParam(nullptr)
                                : SqlParam(update.last_error),
      static_cast<int64_t>(update.latency_ms),
      BasicTypes::NowIso8601(),
      id};

  if (!db_->executeNonQuery(SQL::DataConnection::UPDATE_STATUS, params)) {
    LogManager::getInstance().Error(
        "[SqliteConnectionRepository] Status update failed for {}: {}", id,
        db_->lastError());
    return false;
  }
  if (db_->lastChanges() == 0) {
    LogManager::getInstance().Warn(
        "[SqliteConnectionRepository] Connection {} no longer exists", id);
    return false;
  }
  return true;
}

bool SqliteConnectionRepository::FindById(const std::string &id,
                                          ConnectionRecord &record) {
  std::vector<Row> rows;
  if (!db_ ||
      !db_->executeQuery(SQL::DataConnection::FIND_BY_ID, {id}, rows) ||
      rows.empty()) {
    return false;
  }
  record = MapRowToRecord(rows.front());
  return true;
}

bool SqliteConnectionRepository::Save(const ConnectionRecord &record) {
  if (!db_) {
    return false;
  }
  const std::string now = BasicTypes::NowIso8601();
  std::vector<SqlParam> params{
      record.id,
      record.organization_id,
      record.name,
      record.protocol,
      record.config_json,
      Enums::ConnectionStatusToString(record.status),
      record.last_tested_at.empty() ? SqlParam(nullptr)
                                    : SqlParam(record.last_tested_at),
      record.last_error.empty() ? SqlParam(nullptr)
                                : SqlParam(record.last_error),
      static_cast<int64_t>(record.latency_ms),
      now,
      now};

  if (!db_->executeNonQuery(SQL::DataConnection::UPSERT, params)) {
    LogManager::getInstance().Error(
        "[SqliteConnectionRepository] Save failed for {}: {}", record.id,
        db_->lastError());
    return false;
  }
  return true;
}

bool SqliteConnectionRepository::DeleteById(const std::string &id) {
  if (!db_ || !db_->executeNonQuery(SQL::DataConnection::DELETE_BY_ID, {id})) {
    return false;
  }
  return db_->lastChanges() > 0;
}

} // namespace Storage
} // namespace OtLink
