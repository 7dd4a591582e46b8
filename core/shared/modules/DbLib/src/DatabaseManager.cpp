#include "DatabaseManager.hpp"

namespace DbLib {

DatabaseManager::~DatabaseManager() { disconnect(); }

bool DatabaseManager::initialize(const DatabaseConfig &config,
                                 IDbLogger *logger) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  current_config_ = config;
  logger_ = logger;

  if (sqlite_conn_) {
    sqlite3_close(sqlite_conn_);
    sqlite_conn_ = nullptr;
  }

  log(1, "DatabaseManager initialization started...");
  if (!connectSQLite()) {
    log(3, "Failed to connect to SQLite");
    return false;
  }
  return true;
}

// ========================================================================
// SQLite Implementation
// ========================================================================

bool DatabaseManager::connectSQLite() {
  const std::string &db_path = current_config_.sqlite_path;
  log(1, "Attempting SQLite connection: " + db_path);

  int result = sqlite3_open(db_path.c_str(), &sqlite_conn_);
  if (result == SQLITE_OK) {
    log(1, "SQLite connection successful: " + db_path);

    sqlite3_busy_timeout(sqlite_conn_, current_config_.busy_timeout_ms);

    if (current_config_.enable_wal && db_path != ":memory:") {
      char *err_wal = nullptr;
      if (sqlite3_exec(sqlite_conn_, "PRAGMA journal_mode=WAL;", nullptr,
                       nullptr, &err_wal) != SQLITE_OK) {
        log(2, "Failed to set SQLite WAL mode: " +
                   std::string(err_wal ? err_wal : "unknown"));
        sqlite3_free(err_wal);
      }
      sqlite3_exec(sqlite_conn_, "PRAGMA synchronous=NORMAL;", nullptr,
                   nullptr, nullptr);
    }
    return true;
  }

  last_error_ = sqlite_conn_ ? sqlite3_errmsg(sqlite_conn_) : "out of memory";
  log(3, "SQLite connection failed: " + last_error_);

  if (sqlite_conn_) {
    sqlite3_close(sqlite_conn_);
    sqlite_conn_ = nullptr;
  }
  return false;
}

void DatabaseManager::disconnect() {
  std::lock_guard<std::mutex> lock(db_mutex_);
  if (sqlite_conn_) {
    sqlite3_close(sqlite_conn_);
    sqlite_conn_ = nullptr;
  }
}

bool DatabaseManager::isConnected() const {
  std::lock_guard<std::mutex> lock(db_mutex_);
  return sqlite_conn_ != nullptr;
}

bool DatabaseManager::prepareAndBind(const std::string &query,
                                     const std::vector<SqlParam> &params,
                                     sqlite3_stmt **stmt) {
  if (sqlite3_prepare_v2(sqlite_conn_, query.c_str(), -1, stmt, nullptr) !=
      SQLITE_OK) {
    last_error_ = sqlite3_errmsg(sqlite_conn_);
    log(3, "SQLite prepare error: " + last_error_ +
               " in query: " + query.substr(0, 100));
    return false;
  }

  for (size_t i = 0; i < params.size(); ++i) {
    int index = static_cast<int>(i + 1);
    int rc = SQLITE_OK;
    if (std::holds_alternative<std::nullptr_t>(params[i])) {
      rc = sqlite3_bind_null(*stmt, index);
    } else if (const auto *n = std::get_if<int64_t>(&params[i])) {
      rc = sqlite3_bind_int64(*stmt, index, static_cast<sqlite3_int64>(*n));
    } else {
      const auto &s = std::get<std::string>(params[i]);
      rc = sqlite3_bind_text(*stmt, index, s.c_str(),
                             static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }
    if (rc != SQLITE_OK) {
      last_error_ = sqlite3_errmsg(sqlite_conn_);
      log(3, "SQLite bind error at parameter " + std::to_string(index) + ": " +
                 last_error_);
      sqlite3_finalize(*stmt);
      *stmt = nullptr;
      return false;
    }
  }
  return true;
}

bool DatabaseManager::executeQuery(const std::string &query,
                                   const std::vector<SqlParam> &params,
                                   std::vector<Row> &results) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  results.clear();
  if (!sqlite_conn_) {
    last_error_ = "SQLite not connected";
    return false;
  }

  sqlite3_stmt *stmt = nullptr;
  if (!prepareAndBind(query, params, &stmt)) {
    return false;
  }

  int rc;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    Row row;
    int columns = sqlite3_column_count(stmt);
    for (int c = 0; c < columns; ++c) {
      const char *name = sqlite3_column_name(stmt, c);
      const unsigned char *text = sqlite3_column_text(stmt, c);
      row[name ? name : ""] = text ? reinterpret_cast<const char *>(text) : "";
    }
    results.push_back(std::move(row));
  }

  bool ok = (rc == SQLITE_DONE);
  if (!ok) {
    last_error_ = sqlite3_errmsg(sqlite_conn_);
    log(3, "SQLite error: " + last_error_ + " in query: " + query.substr(0, 100));
  }
  sqlite3_finalize(stmt);
  return ok;
}

bool DatabaseManager::executeNonQuery(const std::string &query,
                                      const std::vector<SqlParam> &params) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  last_changes_ = 0;
  if (!sqlite_conn_) {
    last_error_ = "SQLite not connected";
    return false;
  }

  // 파라미터 없는 다중 문장 (스키마 생성 등)
  if (params.empty()) {
    char *error_msg = nullptr;
    int rc = sqlite3_exec(sqlite_conn_, query.c_str(), nullptr, nullptr,
                          &error_msg);
    if (rc != SQLITE_OK) {
      last_error_ = error_msg ? std::string(error_msg) : "Unknown SQLite error";
      log(3, "SQLite error: " + last_error_ +
                 " in query: " + query.substr(0, 100));
      sqlite3_free(error_msg);
      return false;
    }
    last_changes_ = sqlite3_changes(sqlite_conn_);
    return true;
  }

  sqlite3_stmt *stmt = nullptr;
  if (!prepareAndBind(query, params, &stmt)) {
    return false;
  }

  int rc = sqlite3_step(stmt);
  bool ok = (rc == SQLITE_DONE || rc == SQLITE_ROW);
  if (ok) {
    last_changes_ = sqlite3_changes(sqlite_conn_);
  } else {
    last_error_ = sqlite3_errmsg(sqlite_conn_);
    log(3, "SQLite error: " + last_error_ + " in query: " + query.substr(0, 100));
  }
  sqlite3_finalize(stmt);
  return ok;
}

int DatabaseManager::lastChanges() const {
  std::lock_guard<std::mutex> lock(db_mutex_);
  return last_changes_;
}

std::string DatabaseManager::lastError() const {
  std::lock_guard<std::mutex> lock(db_mutex_);
  return last_error_;
}

void DatabaseManager::log(int level, const std::string &message) {
  if (logger_) {
    logger_->log("database", level, message);
  }
}

} // namespace DbLib
