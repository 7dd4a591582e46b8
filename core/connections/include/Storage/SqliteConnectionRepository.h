// =============================================================================
// connections/include/Storage/SqliteConnectionRepository.h
// DbLib(SQLite) 기반 data_connections 저장소
// =============================================================================

#ifndef OTLINK_STORAGE_SQLITE_CONNECTION_REPOSITORY_H
#define OTLINK_STORAGE_SQLITE_CONNECTION_REPOSITORY_H

#include "Storage/IConnectionRepository.h"

#include "DatabaseManager.hpp"

#include <memory>

namespace OtLink {
namespace Storage {

/**
 * @brief DbLib 로그를 LogManager 의 "database" 카테고리로 전달
 */
class DbLogBridge : public DbLib::IDbLogger {
public:
  void log(const std::string &category, int level,
           const std::string &message) override;

  static DbLogBridge &Instance();
};

class SqliteConnectionRepository : public IConnectionRepository {
public:
  explicit SqliteConnectionRepository(
      std::shared_ptr<DbLib::DatabaseManager> db);
  ~SqliteConnectionRepository() override = default;

  /**
   * @brief 테이블/인덱스 생성 (없을 때만)
   */
  bool EnsureSchema();

  bool ListOtConnections(std::vector<ConnectionRecord> &records) override;
  bool UpdateConnectionStatus(const std::string &id,
                              const StatusUpdate &update) override;

  bool FindById(const std::string &id, ConnectionRecord &record);

  /**
   * @brief insert 또는 update (도구/테스트용)
   */
  bool Save(const ConnectionRecord &record);

  bool DeleteById(const std::string &id);

private:
  static ConnectionRecord MapRowToRecord(const DbLib::Row &row);

  std::shared_ptr<DbLib::DatabaseManager> db_;
};

} // namespace Storage
} // namespace OtLink

#endif // OTLINK_STORAGE_SQLITE_CONNECTION_REPOSITORY_H
