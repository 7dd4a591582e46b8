#ifndef OTLINK_COMMON_BASIC_TYPES_H
#define OTLINK_COMMON_BASIC_TYPES_H

/**
 * @file BasicTypes.h
 * @brief OtLink 기본 타입 및 시간 헬퍼
 * @author OtLink Development Team
 */

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace OtLink {
namespace BasicTypes {

// =========================================================================
// 식별자 타입
// =========================================================================
using UniqueId = std::string;
using ConnectionId = std::string;
using CacheKey = std::string;

// 시간 관련 타입
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// =========================================================================
// 시간 헬퍼
// =========================================================================

inline Timestamp GetCurrentTimestamp() {
  return std::chrono::system_clock::now();
}

inline int64_t TimestampToEpochMs(const Timestamp &timestamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             timestamp.time_since_epoch())
      .count();
}

inline int64_t NowEpochMs() { return TimestampToEpochMs(GetCurrentTimestamp()); }

/**
 * @brief ISO-8601 UTC 문자열 (예: 2025-01-31T12:34:56.789Z)
 */
inline std::string TimestampToIso8601(const Timestamp &timestamp) {
  auto time_t = std::chrono::system_clock::to_time_t(timestamp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                timestamp.time_since_epoch())
                .count() %
            1000;
  if (ms < 0)
    ms += 1000;

  std::tm tm_buf{};
#ifdef _WIN32
  gmtime_s(&tm_buf, &time_t);
#else
  gmtime_r(&time_t, &tm_buf);
#endif

  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
     << std::setfill('0') << ms << 'Z';
  return ss.str();
}

inline std::string NowIso8601() {
  return TimestampToIso8601(GetCurrentTimestamp());
}

} // namespace BasicTypes
} // namespace OtLink

#endif // OTLINK_COMMON_BASIC_TYPES_H
