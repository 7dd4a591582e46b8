// =============================================================================
// connections/include/Pool/ConnectionPool.h
// 캐시 키별 라이브 세션 풀 (liveness 확인, 재생성, 무효화)
// =============================================================================

#ifndef OTLINK_POOL_CONNECTION_POOL_H
#define OTLINK_POOL_CONNECTION_POOL_H

#include "Drivers/Common/AdapterRegistry.h"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace OtLink {
namespace Pool {

using CacheKey = OtLink::BasicTypes::CacheKey;
using SessionPtr = OtLink::Drivers::SessionPtr;
using AdapterPtr = OtLink::Drivers::AdapterPtr;
using ConnectionConfig = OtLink::Structs::ConnectionConfig;

/**
 * @brief 풀이 소유하는 캐시 항목
 */
struct PooledHandle {
  CacheKey key;
  Enums::ProtocolType protocol = Enums::ProtocolType::UNKNOWN;
  SessionPtr session;
  AdapterPtr adapter;
  BasicTypes::Timestamp created_at;
  BasicTypes::Timestamp last_used;
  uint64_t use_count = 0;
};

using HandlePtr = std::shared_ptr<PooledHandle>;

struct PoolStatistics {
  uint64_t total_connects = 0;
  uint64_t failed_connects = 0;
  uint64_t pool_hits = 0;
  uint64_t pool_misses = 0;
  uint64_t evictions = 0;
  size_t active_handles = 0;
};

/**
 * @brief 연결 풀
 *
 * 키마다 최대 하나의 핸들만 캐시한다. 같은 키의 GetHandle 은 키 단위 mutex
 * 로 직렬화되어 cache miss 시 중복 연결이 생기지 않는다. 서로 다른 키는
 * 서로를 막지 않는다.
 */
class ConnectionPool {
public:
  explicit ConnectionPool(std::shared_ptr<Drivers::AdapterRegistry> registry);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool &) = delete;
  ConnectionPool &operator=(const ConnectionPool &) = delete;

  /**
   * @brief 캐시된 핸들을 재사용하거나 새로 연결한다
   * @return 실패 시 nullptr (실패는 캐시하지 않음)
   */
  HandlePtr GetHandle(const ConnectionConfig &config,
                      Structs::ErrorInfo &error);

  /**
   * @brief 핸들 제거 후 best-effort disconnect
   * @param expected 지정하면 현재 캐시된 세션이 같을 때만 제거
   * @return 제거했으면 true
   */
  bool Invalidate(const CacheKey &key, const SessionPtr &expected = nullptr);

  /**
   * @brief 핸들을 풀에서만 제거한다. disconnect 는 호출자가 Dispose 로 수행
   * @return 제거된 핸들 (없으면 nullptr)
   */
  HandlePtr Evict(const CacheKey &key, const SessionPtr &expected = nullptr);

  /**
   * @brief 어댑터 disconnect. 예외를 던지지 않는다
   */
  static void Dispose(const HandlePtr &handle, const char *reason);

  /**
   * @brief 명시적 연결 해제
   */
  bool Disconnect(const CacheKey &key) { return Invalidate(key); }

  /**
   * @brief 모든 핸들 해제. 예외를 던지지 않는다
   */
  void CloseAll();

  bool Contains(const CacheKey &key) const;
  size_t Size() const;

  /**
   * @brief 현재 사용 중인 키 단위 mutex 개수 (GetHandle 진행 중인 키만 남는다)
   */
  size_t GetKeyLockCount() const;

  PoolStatistics GetStatistics() const;

private:
  struct KeyLock {
    std::mutex mutex;
    size_t users = 0;
  };

  /**
   * @brief 키 단위 잠금. 마지막 사용자가 풀면 맵에서 항목을 지운다
   */
  class KeyLockGuard {
  public:
    KeyLockGuard(ConnectionPool &pool, const CacheKey &key);
    ~KeyLockGuard();

    KeyLockGuard(const KeyLockGuard &) = delete;
    KeyLockGuard &operator=(const KeyLockGuard &) = delete;

  private:
    ConnectionPool &pool_;
    CacheKey key_;
    std::shared_ptr<KeyLock> entry_;
    std::unique_lock<std::mutex> lock_;
  };

  std::shared_ptr<KeyLock> AcquireKeyLock(const CacheKey &key);
  void ReleaseKeyLock(const CacheKey &key);
  HandlePtr FindHandle(const CacheKey &key) const;
  HandlePtr RemoveHandle(const CacheKey &key, const SessionPtr &expected);

  std::shared_ptr<Drivers::AdapterRegistry> registry_;

  mutable std::shared_mutex handles_mutex_;
  std::map<CacheKey, HandlePtr> handles_;

  mutable std::mutex key_locks_mutex_;
  std::map<CacheKey, std::shared_ptr<KeyLock>> key_locks_;

  std::atomic<uint64_t> total_connects_{0};
  std::atomic<uint64_t> failed_connects_{0};
  std::atomic<uint64_t> pool_hits_{0};
  std::atomic<uint64_t> pool_misses_{0};
  std::atomic<uint64_t> evictions_{0};
};

} // namespace Pool
} // namespace OtLink

#endif // OTLINK_POOL_CONNECTION_POOL_H
