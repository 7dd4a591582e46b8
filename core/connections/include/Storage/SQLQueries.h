// =============================================================================
// connections/include/Storage/SQLQueries.h
// data_connections 테이블 SQL 상수
// =============================================================================

#ifndef OTLINK_STORAGE_SQL_QUERIES_H
#define OTLINK_STORAGE_SQL_QUERIES_H

#include <string>

namespace OtLink {
namespace Storage {
namespace SQL {

namespace DataConnection {

const std::string CREATE_TABLE = R"(
        CREATE TABLE IF NOT EXISTS data_connections (
            id TEXT PRIMARY KEY,
            organizationId TEXT NOT NULL,
            name TEXT NOT NULL,
            type TEXT,
            description TEXT,
            config TEXT,
            status TEXT DEFAULT 'inactive',
            lastTestedAt TEXT,
            lastError TEXT,
            latencyMs INTEGER DEFAULT 0,
            createdBy TEXT,
            createdAt TEXT,
            updatedAt TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_data_connections_type
            ON data_connections(type);
    )";

// 자동 헬스체크 대상 (OT 계열)
const std::string FIND_OT_CONNECTIONS = R"(
        SELECT id, organizationId, name, type, config, status,
               lastTestedAt, lastError, latencyMs
        FROM data_connections
        WHERE type IN ('opcua', 'mqtt', 'modbus', 'scada', 'mes',
                       'dataHistorian', 'data-historian')
        ORDER BY createdAt, id
    )";

const std::string FIND_BY_ID = R"(
        SELECT id, organizationId, name, type, config, status,
               lastTestedAt, lastError, latencyMs
        FROM data_connections
        WHERE id = ?
    )";

const std::string UPDATE_STATUS = R"(
        UPDATE data_connections
        SET status = ?, lastTestedAt = ?, lastError = ?, latencyMs = ?,
            updatedAt = ?
        WHERE id = ?
    )";

const std::string UPSERT = R"(
        INSERT INTO data_connections (
            id, organizationId, name, type, config, status,
            lastTestedAt, lastError, latencyMs, createdAt, updatedAt
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            organizationId = excluded.organizationId,
            name = excluded.name,
            type = excluded.type,
            config = excluded.config,
            status = excluded.status,
            lastTestedAt = excluded.lastTestedAt,
            lastError = excluded.lastError,
            latencyMs = excluded.latencyMs,
            updatedAt = excluded.updatedAt
    )";

const std::string DELETE_BY_ID = "DELETE FROM data_connections WHERE id = ?";

} // namespace DataConnection

} // namespace SQL
} // namespace Storage
} // namespace OtLink

#endif // OTLINK_STORAGE_SQL_QUERIES_H
