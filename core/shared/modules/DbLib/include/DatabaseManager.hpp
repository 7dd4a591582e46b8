#ifndef DBLIB_DATABASE_MANAGER_HPP
#define DBLIB_DATABASE_MANAGER_HPP

#include "DbExport.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <variant>
#include <vector>

namespace DbLib {

/**
 * @brief Configuration for the SQLite connection
 */
struct DBLIB_API DatabaseConfig {
  std::string sqlite_path = "otlink.db";
  int busy_timeout_ms = 5000;
  bool enable_wal = true;
};

/**
 * @brief Logger interface for DbLib (0=DEBUG, 1=INFO, 2=WARN, 3=ERROR)
 */
class DBLIB_API IDbLogger {
public:
  virtual ~IDbLogger() = default;
  virtual void log(const std::string &category, int level,
                   const std::string &message) = 0;
};

/// 바인딩 파라미터. nullptr 은 SQL NULL 로 바인딩된다.
using SqlParam = std::variant<std::nullptr_t, int64_t, std::string>;
/// 결과 행 (컬럼명 -> 값, NULL 은 빈 문자열)
using Row = std::map<std::string, std::string>;

/**
 * @brief SQLite connection manager
 * @details One instance per database file, owned by the caller. All calls
 *          are serialized on an internal mutex.
 */
class DBLIB_API DatabaseManager {
public:
  DatabaseManager() = default;
  ~DatabaseManager();

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

  bool initialize(const DatabaseConfig &config, IDbLogger *logger = nullptr);
  void disconnect();
  bool isConnected() const;

  const DatabaseConfig &getConfig() const { return current_config_; }

  bool executeQuery(const std::string &query, const std::vector<SqlParam> &params,
                    std::vector<Row> &results);
  bool executeQuery(const std::string &query, std::vector<Row> &results) {
    return executeQuery(query, {}, results);
  }

  bool executeNonQuery(const std::string &query,
                       const std::vector<SqlParam> &params = {});

  /// 마지막 executeNonQuery 가 변경한 행 수
  int lastChanges() const;
  std::string lastError() const;

private:
  bool connectSQLite();
  bool prepareAndBind(const std::string &query,
                      const std::vector<SqlParam> &params,
                      sqlite3_stmt **stmt);
  void log(int level, const std::string &message);

  mutable std::mutex db_mutex_;
  sqlite3 *sqlite_conn_ = nullptr;
  DatabaseConfig current_config_;
  IDbLogger *logger_ = nullptr;
  int last_changes_ = 0;
  std::string last_error_;
};

} // namespace DbLib

#endif // DBLIB_DATABASE_MANAGER_HPP
